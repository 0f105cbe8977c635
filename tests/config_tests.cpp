#include <fstream>

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include <pcr/color.hpp>
#include <pcr/config.hpp>
#include <pcr/errors.hpp>
#include <pcr/json_util.hpp>
#include <pcr/units.hpp>
#include <pcr/util/at_scope_exit.hpp>

#include "test_assets.hpp"

TEST_CASE("Empty json gives the default config", "[config_defaults]")
{
    const Config config{ ConfigFromJson(nlohmann::json::object()) };
    REQUIRE(ToDotsPerInch(config.m_Dpi) == 300);
    REQUIRE(config.m_CardSizeChoice == "Standard");
    REQUIRE(config.m_OutputFormat == OutputFormat::Jpg);
    REQUIRE(config.m_ColorModel == PrintColorModel::Cmyk);
    REQUIRE(config.m_ColorConversion == ColorConversion::Direct);
    REQUIRE(config.m_OverflowPolicy == OverflowPolicy::Truncate);
    REQUIRE(config.m_ErrorPolicy == ErrorPolicy::SkipAndContinue);
    REQUIRE(config.ChannelCount() == 4);
    REQUIRE(config.OutputExtension() == ".jpg");
}

TEST_CASE("Read config values from json", "[config_read]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "dpi": 600,
        "card_sizes": { "Tarot": "70 x 120 mm" },
        "card_size": "Tarot",
        "bleed_edge": "3 mm",
        "fancy_bleed": false,
        "output_format": "png",
        "color_model": "Rgb",
        "overflow_policy": "overflow",
        "error_policy": "FailFast",
        "png_compression": 42,
        "title_uppercase": false,
        "layout": {
            "body": { "line_spacing": 9 },
            "body_sizes": [30, 12, 3]
        },
        "style": {
            "title": { "fill": "#ff0000" },
            "art_border_width": 0
        }
    })");

    const Config config{ ConfigFromJson(json) };
    REQUIRE(ToDotsPerInch(config.m_Dpi) == 600);
    REQUIRE(config.m_CardSizeChoice == "Tarot");
    REQUIRE(ToPixels(config.CardSize().x, config.m_Dpi) == ToPixels(70_mm, config.m_Dpi));
    REQUIRE(ToPixels(config.CardSize().y, config.m_Dpi) == ToPixels(120_mm, config.m_Dpi));
    REQUIRE(ToPixels(config.m_BleedEdge, config.m_Dpi) == ToPixels(3_mm, config.m_Dpi));
    REQUIRE(!config.m_FancyBleed);
    REQUIRE(config.m_OutputFormat == OutputFormat::Png);
    REQUIRE(config.m_ColorModel == PrintColorModel::Rgb);
    REQUIRE(config.ChannelCount() == 3);
    REQUIRE(config.m_OverflowPolicy == OverflowPolicy::Overflow);
    REQUIRE(config.m_ErrorPolicy == ErrorPolicy::FailFast);
    REQUIRE(config.m_PngCompression == 9);
    REQUIRE(!config.m_TitleUppercase);
    REQUIRE(config.m_Template.m_BodyLineSpacing == 9);
    REQUIRE(config.m_Template.m_BodySizes.m_Start == 30);
    REQUIRE(config.m_Template.m_BodySizes.m_Min == 12);
    REQUIRE(ColorToHex(config.m_Style.m_Title.m_Fill) == "#ff0000");
    REQUIRE(config.m_Style.m_ArtBorderWidth == 0);
}

TEST_CASE("Invalid values fall back to defaults", "[config_invalid_values]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "card_size": "Gigantic",
        "bleed_edge": "-2 mm",
        "color_model": "Hexachrome"
    })");

    const Config config{ ConfigFromJson(json) };
    REQUIRE(config.m_CardSizeChoice == "Standard");
    REQUIRE(config.m_BleedEdge == 0_mm);
    REQUIRE(config.m_ColorModel == PrintColorModel::Cmyk);
}

TEST_CASE("Overlapping layout is rejected", "[config_bad_template]")
{
    const nlohmann::json json = nlohmann::json::parse(R"({
        "layout": { "cost": [96, 98, 440, 64] }
    })");
    REQUIRE_THROWS_AS(ConfigFromJson(json), TemplateError);
}

TEST_CASE("Dotted overrides", "[config_overrides]")
{
    nlohmann::json json = ConfigToJson(Config{});
    ApplyJsonOverrides(json,
                       {
                           { "dpi", "450" },
                           { "layout.body.line_spacing", "7" },
                           { "output_format", "Png" },
                       });

    REQUIRE(GetJsonValue(json, "layout.body.line_spacing").get<int>() == 7);
    REQUIRE_THROWS_AS(GetJsonValue(json, "layout.nothing_here"), std::logic_error);

    const Config config{ ConfigFromJson(json) };
    REQUIRE(ToDotsPerInch(config.m_Dpi) == 450);
    REQUIRE(config.m_Template.m_BodyLineSpacing == 7);
    REQUIRE(config.m_OutputFormat == OutputFormat::Png);
}

TEST_CASE("Save and load config", "[config_save_load]")
{
    const fs::path dir{ MakeTestDirectory("config_save_load") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{};
    config.m_Dpi = 1200_dpi;
    config.m_CardSizeChoice = "Poker";
    config.m_OverflowPolicy = OverflowPolicy::Overflow;
    config.m_Template.m_TitleSizes = FontSizeRange{ 50, 30, 5 };

    const fs::path config_path{ dir / "config.json" };
    SaveConfig(config, config_path);
    REQUIRE(fs::exists(config_path));

    const nlohmann::json saved = LoadConfigJson(config_path);
    REQUIRE(saved.is_object());
    REQUIRE(saved.contains("version"));

    const Config loaded{ LoadConfig(config_path) };
    REQUIRE(ToDotsPerInch(loaded.m_Dpi) == 1200);
    REQUIRE(loaded.m_CardSizeChoice == "Poker");
    REQUIRE(loaded.m_OverflowPolicy == OverflowPolicy::Overflow);
    REQUIRE(loaded.m_Template.m_TitleSizes.m_Start == 50);
    REQUIRE(loaded.m_Template.m_TitleSizes.m_Step == 5);
}

TEST_CASE("Missing or broken config file gives defaults", "[config_missing]")
{
    const fs::path dir{ MakeTestDirectory("config_missing") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    REQUIRE(LoadConfigJson(dir / "missing.json").empty());

    const fs::path broken_path{ dir / "broken.json" };
    {
        std::ofstream broken{ broken_path };
        broken << "{ \"dpi\": ";
    }
    REQUIRE(LoadConfigJson(broken_path).empty());
    REQUIRE(ToDotsPerInch(LoadConfig(broken_path).m_Dpi) == 300);
}
