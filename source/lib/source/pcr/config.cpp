#include <pcr/config.hpp>

#include <algorithm>
#include <fstream>

#include <magic_enum/magic_enum.hpp>

#include <nlohmann/json.hpp>

#include <pcr/version.hpp>

#include <pcr/util/log.hpp>

namespace
{
template<class EnumT>
void ReadEnum(const nlohmann::json& json, const char* key, EnumT& value)
{
    if (json.contains(key))
    {
        const auto& name{ json[key].get_ref<const std::string&>() };
        const auto parsed{ magic_enum::enum_cast<EnumT>(name, magic_enum::case_insensitive) };
        if (parsed.has_value())
        {
            value = parsed.value();
        }
        else
        {
            LogWarning("Unknown value '{}' for '{}', keeping {}", name, key, magic_enum::enum_name(value));
        }
    }
}

void ReadPath(const nlohmann::json& json, const char* key, fs::path& value)
{
    if (json.contains(key))
    {
        value = json[key].get<std::string>();
    }
}

void ReadLength(const nlohmann::json& json, const char* key, Length& value)
{
    if (json.contains(key))
    {
        const auto& str{ json[key].get_ref<const std::string&>() };
        if (const auto length{ ParseLength(str) })
        {
            value = length.value();
        }
        else
        {
            LogWarning("Could not parse length '{}' for '{}', expected e.g. \"3 mm\"", str, key);
        }
    }
}

void ReadRect(const nlohmann::json& json, const char* key, cv::Rect& rect)
{
    if (json.contains(key))
    {
        const auto& values{ json[key] };
        rect = cv::Rect{ values.at(0).get<int>(), values.at(1).get<int>(), values.at(2).get<int>(), values.at(3).get<int>() };
    }
}

void ReadSizes(const nlohmann::json& json, const char* key, FontSizeRange& sizes)
{
    if (json.contains(key))
    {
        const auto& values{ json[key] };
        sizes = FontSizeRange{ values.at(0).get<uint32_t>(), values.at(1).get<uint32_t>(), values.at(2).get<uint32_t>() };
    }
}

void ReadColor(const nlohmann::json& json, const char* key, ColorRGB8& color)
{
    if (json.contains(key))
    {
        const auto& hex{ json[key].get_ref<const std::string&>() };
        if (const auto parsed{ ColorFromHex(hex) })
        {
            color = parsed.value();
        }
        else
        {
            LogWarning("Could not parse color '{}' for '{}'", hex, key);
        }
    }
}

void ReadTextStyle(const nlohmann::json& json, const char* key, TextStyle& style)
{
    if (json.contains(key))
    {
        const auto& style_json{ json[key] };
        ReadColor(style_json, "fill", style.m_Fill);
        if (style_json.contains("outline"))
        {
            ColorRGB8 outline{ style.m_Outline.value_or(ColorRGB8{ 0, 0, 0 }) };
            ReadColor(style_json, "outline", outline);
            style.m_Outline = outline;
        }
        if (style_json.contains("outline_width"))
        {
            style.m_OutlineWidth = style_json["outline_width"].get<int32_t>();
        }
    }
}

nlohmann::json RectToJson(const cv::Rect& rect)
{
    return nlohmann::json::array({ rect.x, rect.y, rect.width, rect.height });
}

nlohmann::json SizesToJson(const FontSizeRange& sizes)
{
    return nlohmann::json::array({ sizes.m_Start, sizes.m_Min, sizes.m_Step });
}

nlohmann::json TextStyleToJson(const TextStyle& style)
{
    nlohmann::json json{};
    json["fill"] = ColorToHex(style.m_Fill);
    if (style.m_Outline.has_value())
    {
        json["outline"] = ColorToHex(style.m_Outline.value());
        json["outline_width"] = style.m_OutlineWidth;
    }
    return json;
}
} // namespace

Size Config::CardSize() const
{
    const auto& card_size_info{
        m_CardSizes.contains(m_CardSizeChoice)
            ? m_CardSizes.at(m_CardSizeChoice)
            : g_DefaultCardSizes.at("Standard"),
    };
    return card_size_info.m_Dimensions;
}

Size Config::CardSizeWithBleed() const
{
    return CardSize() + m_BleedEdge * 2;
}

uint32_t Config::ChannelCount() const
{
    return m_ColorModel == PrintColorModel::Cmyk ? 4 : 3;
}

fs::path Config::OutputExtension() const
{
    switch (m_OutputFormat)
    {
    case OutputFormat::Png:
        return ".png";
    case OutputFormat::Jpg:
    default:
        return ".jpg";
    }
}

Config ConfigFromJson(const nlohmann::json& json)
{
    Config config{};

    ReadPath(json, "asset_dir", config.m_AssetDir);
    ReadPath(json, "art_dir", config.m_ArtDir);
    ReadPath(json, "title_font", config.m_TitleFont);
    ReadPath(json, "body_font", config.m_BodyFont);
    ReadPath(json, "symbol_font", config.m_SymbolFont);

    if (json.contains("dpi"))
    {
        config.m_Dpi = json["dpi"].get<float>() * 1_dpi;
    }

    if (json.contains("card_sizes"))
    {
        for (const auto& [name, size_json] : json["card_sizes"].items())
        {
            const auto& size_str{ size_json.get_ref<const std::string&>() };
            const auto size{ ParseSize(size_str) };
            if (!size.has_value())
            {
                LogWarning("Could not parse card size '{}' for '{}', expected e.g. \"63 x 88 mm\"", size_str, name);
                continue;
            }

            config.m_CardSizes[name] = Config::CardSizeInfo{
                size.value(),
                Unit::Millimeter,
                {},
            };
        }
    }

    if (json.contains("card_size"))
    {
        config.m_CardSizeChoice = json["card_size"].get<std::string>();
        if (!config.m_CardSizes.contains(config.m_CardSizeChoice))
        {
            LogWarning("Unknown card size '{}', using Standard", config.m_CardSizeChoice);
            config.m_CardSizeChoice = "Standard";
        }
    }

    ReadLength(json, "bleed_edge", config.m_BleedEdge);
    if (config.m_BleedEdge < 0_mm)
    {
        LogWarning("Negative bleed edge is not supported, using no bleed");
        config.m_BleedEdge = 0_mm;
    }
    if (json.contains("fancy_bleed"))
    {
        config.m_FancyBleed = json["fancy_bleed"].get<bool>();
    }

    ReadEnum(json, "output_format", config.m_OutputFormat);
    ReadEnum(json, "color_model", config.m_ColorModel);
    ReadEnum(json, "color_conversion", config.m_ColorConversion);
    ReadPath(json, "color_cube", config.m_ColorCube);

    if (json.contains("png_compression") && !json["png_compression"].is_null())
    {
        config.m_PngCompression = std::clamp(json["png_compression"].get<int>(), 0, 9);
    }
    if (json.contains("jpg_quality") && !json["jpg_quality"].is_null())
    {
        config.m_JpgQuality = std::clamp(json["jpg_quality"].get<int>(), 0, 100);
    }

    ReadEnum(json, "overflow_policy", config.m_OverflowPolicy);
    ReadEnum(json, "error_policy", config.m_ErrorPolicy);
    if (json.contains("title_uppercase"))
    {
        config.m_TitleUppercase = json["title_uppercase"].get<bool>();
    }

    if (json.contains("layout"))
    {
        const auto& layout{ json["layout"] };
        CardTemplate& card_template{ config.m_Template };
        if (layout.contains("canvas"))
        {
            card_template.m_CanvasSize = cv::Size{ layout["canvas"].at(0).get<int>(), layout["canvas"].at(1).get<int>() };
        }
        ReadRect(layout, "title", card_template.m_TitleBox);
        ReadRect(layout, "cost", card_template.m_CostBox);
        ReadRect(layout, "art", card_template.m_ArtBox);
        ReadRect(layout, "type", card_template.m_TypeBox);
        ReadRect(layout, "strength", card_template.m_StrengthBox);
        if (layout.contains("body"))
        {
            const auto& body{ layout["body"] };
            card_template.m_BodyLeft = body.value("left", card_template.m_BodyLeft);
            card_template.m_BodyWidth = body.value("width", card_template.m_BodyWidth);
            card_template.m_BodyTop = body.value("top", card_template.m_BodyTop);
            card_template.m_BodyBottomMargin = body.value("bottom_margin", card_template.m_BodyBottomMargin);
            card_template.m_BodyLineSpacing = body.value("line_spacing", card_template.m_BodyLineSpacing);
        }
        ReadSizes(layout, "title_sizes", card_template.m_TitleSizes);
        ReadSizes(layout, "cost_sizes", card_template.m_CostSizes);
        ReadSizes(layout, "type_sizes", card_template.m_TypeSizes);
        ReadSizes(layout, "body_sizes", card_template.m_BodySizes);
        ReadSizes(layout, "strength_sizes", card_template.m_StrengthSizes);
    }
    config.m_Template.Validate();

    if (json.contains("style"))
    {
        const auto& style{ json["style"] };
        ReadTextStyle(style, "title", config.m_Style.m_Title);
        ReadTextStyle(style, "cost", config.m_Style.m_Cost);
        ReadTextStyle(style, "type", config.m_Style.m_TypeLine);
        ReadTextStyle(style, "body", config.m_Style.m_Body);
        ReadTextStyle(style, "strength", config.m_Style.m_Strength);
        ReadColor(style, "placeholder_art", config.m_Style.m_PlaceholderArt);
        ReadColor(style, "art_border", config.m_Style.m_ArtBorder);
        config.m_Style.m_ArtBorderWidth = style.value("art_border_width", config.m_Style.m_ArtBorderWidth);
        ReadColor(style, "strength_border", config.m_Style.m_StrengthBorder);
        config.m_Style.m_StrengthBorderWidth = style.value("strength_border_width", config.m_Style.m_StrengthBorderWidth);
    }

    return config;
}

nlohmann::json ConfigToJson(const Config& config)
{
    nlohmann::json json{};
    json["version"] = std::string{ ConfigFormatVersion() };

    json["asset_dir"] = config.m_AssetDir.string();
    json["art_dir"] = config.m_ArtDir.string();
    json["title_font"] = config.m_TitleFont.string();
    json["body_font"] = config.m_BodyFont.string();
    json["symbol_font"] = config.m_SymbolFont.string();

    json["dpi"] = ToDotsPerInch(config.m_Dpi);
    json["card_size"] = config.m_CardSizeChoice;
    for (const auto& [name, info] : config.m_CardSizes)
    {
        if (!Config::g_DefaultCardSizes.contains(name))
        {
            json["card_sizes"][name] = SizeToString(info.m_Dimensions, info.m_BaseUnit);
        }
    }
    json["bleed_edge"] = LengthToString(config.m_BleedEdge, Unit::Millimeter);
    json["fancy_bleed"] = config.m_FancyBleed;

    json["output_format"] = std::string{ magic_enum::enum_name(config.m_OutputFormat) };
    json["color_model"] = std::string{ magic_enum::enum_name(config.m_ColorModel) };
    json["color_conversion"] = std::string{ magic_enum::enum_name(config.m_ColorConversion) };
    json["color_cube"] = config.m_ColorCube.string();
    json["png_compression"] = config.m_PngCompression.has_value() ? nlohmann::json(config.m_PngCompression.value()) : nlohmann::json{};
    json["jpg_quality"] = config.m_JpgQuality.has_value() ? nlohmann::json(config.m_JpgQuality.value()) : nlohmann::json{};

    json["overflow_policy"] = std::string{ magic_enum::enum_name(config.m_OverflowPolicy) };
    json["error_policy"] = std::string{ magic_enum::enum_name(config.m_ErrorPolicy) };
    json["title_uppercase"] = config.m_TitleUppercase;

    const CardTemplate& card_template{ config.m_Template };
    nlohmann::json& layout{ json["layout"] };
    layout["canvas"] = nlohmann::json::array({ card_template.m_CanvasSize.width, card_template.m_CanvasSize.height });
    layout["title"] = RectToJson(card_template.m_TitleBox);
    layout["cost"] = RectToJson(card_template.m_CostBox);
    layout["art"] = RectToJson(card_template.m_ArtBox);
    layout["type"] = RectToJson(card_template.m_TypeBox);
    layout["strength"] = RectToJson(card_template.m_StrengthBox);
    layout["body"] = {
        { "left", card_template.m_BodyLeft },
        { "width", card_template.m_BodyWidth },
        { "top", card_template.m_BodyTop },
        { "bottom_margin", card_template.m_BodyBottomMargin },
        { "line_spacing", card_template.m_BodyLineSpacing },
    };
    layout["title_sizes"] = SizesToJson(card_template.m_TitleSizes);
    layout["cost_sizes"] = SizesToJson(card_template.m_CostSizes);
    layout["type_sizes"] = SizesToJson(card_template.m_TypeSizes);
    layout["body_sizes"] = SizesToJson(card_template.m_BodySizes);
    layout["strength_sizes"] = SizesToJson(card_template.m_StrengthSizes);

    nlohmann::json& style{ json["style"] };
    style["title"] = TextStyleToJson(config.m_Style.m_Title);
    style["cost"] = TextStyleToJson(config.m_Style.m_Cost);
    style["type"] = TextStyleToJson(config.m_Style.m_TypeLine);
    style["body"] = TextStyleToJson(config.m_Style.m_Body);
    style["strength"] = TextStyleToJson(config.m_Style.m_Strength);
    style["placeholder_art"] = ColorToHex(config.m_Style.m_PlaceholderArt);
    style["art_border"] = ColorToHex(config.m_Style.m_ArtBorder);
    style["art_border_width"] = config.m_Style.m_ArtBorderWidth;
    style["strength_border"] = ColorToHex(config.m_Style.m_StrengthBorder);
    style["strength_border_width"] = config.m_Style.m_StrengthBorderWidth;

    return json;
}

nlohmann::json LoadConfigJson(const fs::path& json_path)
{
    if (!fs::exists(json_path))
    {
        LogInfo("No config at {}, using defaults...", json_path.string());
        return nlohmann::json::object();
    }

    try
    {
        nlohmann::json json = nlohmann::json::parse(std::ifstream{ json_path });
        if (!json.contains("version") || !json["version"].is_string() || json["version"].get_ref<const std::string&>() != ConfigFormatVersion())
        {
            LogWarning("Config {} has no or an unknown version, expected {}", json_path.string(), ConfigFormatVersion());
        }
        return json;
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Failed loading config from {}, continuing with defaults: {}", json_path.string(), e.what());
        return nlohmann::json::object();
    }
}

Config LoadConfig(const fs::path& json_path)
{
    const nlohmann::json json = LoadConfigJson(json_path);
    try
    {
        return ConfigFromJson(json);
    }
    catch (const nlohmann::json::exception& e)
    {
        LogError("Config {} has invalid values, continuing with defaults: {}", json_path.string(), e.what());
        return Config{};
    }
}

void SaveConfig(const Config& config, const fs::path& json_path)
{
    if (std::ofstream file{ json_path })
    {
        LogInfo("Writing config to {}...", json_path.string());
        file << ConfigToJson(config).dump(4);
    }
    else
    {
        LogError("Failed opening {} for writing", json_path.string());
    }
}
