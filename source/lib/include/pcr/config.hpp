#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include <pcr/color.hpp>
#include <pcr/units.hpp>
#include <pcr/util.hpp>

#include <pcr/layout/card_template.hpp>

enum class OutputFormat
{
    Jpg,
    Png,
};

enum class PrintColorModel
{
    Cmyk,
    Rgb,
};

enum class ColorConversion
{
    Direct,
    ColorCube,
};

enum class OverflowPolicy
{
    Truncate,
    Overflow,
};

enum class ErrorPolicy
{
    SkipAndContinue,
    FailFast,
};

struct TextStyle
{
    ColorRGB8 m_Fill;
    std::optional<ColorRGB8> m_Outline{};
    int32_t m_OutlineWidth{ 0 };
};

struct RenderStyle
{
    TextStyle m_Title{ { 255, 255, 255 }, ColorRGB8{ 0, 0, 0 }, 2 };
    TextStyle m_Cost{ { 255, 255, 255 }, ColorRGB8{ 0, 0, 0 }, 1 };
    TextStyle m_TypeLine{ { 0, 0, 0 } };
    TextStyle m_Body{ { 0, 0, 0 } };
    TextStyle m_Strength{ { 0, 0, 0 } };

    ColorRGB8 m_PlaceholderArt{ 128, 128, 128 };
    ColorRGB8 m_ArtBorder{ 0, 0, 0 };
    int32_t m_ArtBorderWidth{ 4 };
    ColorRGB8 m_StrengthBorder{ 0, 0, 0 };
    int32_t m_StrengthBorderWidth{ 2 };
};

struct Config
{
    // Asset layout
    fs::path m_AssetDir{ "assets"_p };
    fs::path m_ArtDir{ "art"_p };
    fs::path m_TitleFont{ "Beleren2016-Bold.ttf"_p };
    fs::path m_BodyFont{ "MPlantin.ttf"_p };
    fs::path m_SymbolFont{ "MagicSymbols.ttf"_p };

    // Physical output
    PixelDensity m_Dpi{ 300_dpi };
    std::string m_CardSizeChoice{ "Standard" };
    Length m_BleedEdge{ 0_mm };
    bool m_FancyBleed{ true };

    // File output
    OutputFormat m_OutputFormat{ OutputFormat::Jpg };
    PrintColorModel m_ColorModel{ PrintColorModel::Cmyk };
    ColorConversion m_ColorConversion{ ColorConversion::Direct };
    fs::path m_ColorCube{};
    std::optional<int> m_PngCompression{ std::nullopt };
    std::optional<int> m_JpgQuality{ 95 };

    // Rendering
    OverflowPolicy m_OverflowPolicy{ OverflowPolicy::Truncate };
    ErrorPolicy m_ErrorPolicy{ ErrorPolicy::SkipAndContinue };
    bool m_TitleUppercase{ true };
    CardTemplate m_Template{};
    RenderStyle m_Style{};

    struct CardSizeInfo
    {
        Size m_Dimensions;
        Unit m_BaseUnit;
        std::string m_Hint;
    };

    inline static const std::map<std::string, CardSizeInfo> g_DefaultCardSizes{
        {
            "Standard",
            {
                .m_Dimensions{ 2.48_in, 3.46_in },
                .m_BaseUnit = Unit::Inches,
                .m_Hint{ ".e.g. Magic the Gathering, Pokemon, and other TCGs" },
            },
        },
        {
            "Oversized",
            {
                .m_Dimensions{ 3.46_in, 4.96_in },
                .m_BaseUnit = Unit::Inches,
                .m_Hint{ ".e.g. oversized Magic the Gathering" },
            },
        },
        {
            "Novelty",
            {
                .m_Dimensions{ 1.24_in, 1.73_in },
                .m_BaseUnit = Unit::Inches,
                .m_Hint{ ".e.g. novelty-sized Magic the Gathering" },
            },
        },
        {
            "Japanese",
            {
                .m_Dimensions{ 59_mm, 86_mm },
                .m_BaseUnit = Unit::Millimeter,
                .m_Hint{ ".e.g. Yu-Gi-Oh!" },
            },
        },
        {
            "Poker",
            {
                .m_Dimensions{ 2.5_in, 3.5_in },
                .m_BaseUnit = Unit::Inches,
                .m_Hint{},
            },
        },
    };
    std::map<std::string, CardSizeInfo> m_CardSizes{ g_DefaultCardSizes };

    // Trim size, falls back to "Standard" for unknown choices
    Size CardSize() const;
    Size CardSizeWithBleed() const;

    uint32_t ChannelCount() const;
    fs::path OutputExtension() const;
};

Config ConfigFromJson(const nlohmann::json& json);
nlohmann::json ConfigToJson(const Config& config);

// A missing file yields the default config, a broken one is reported and ignored
Config LoadConfig(const fs::path& json_path);
nlohmann::json LoadConfigJson(const fs::path& json_path);
void SaveConfig(const Config& config, const fs::path& json_path);
