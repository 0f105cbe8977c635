#include <fstream>

#include <catch2/catch_test_macros.hpp>

#include <pcr/assets/asset_resolver.hpp>
#include <pcr/card/csv_reader.hpp>
#include <pcr/errors.hpp>
#include <pcr/print/color_conversion.hpp>
#include <pcr/print/jpeg_io.hpp>
#include <pcr/print/print_exporter.hpp>
#include <pcr/render/card_renderer.hpp>
#include <pcr/util/at_scope_exit.hpp>

#include "stub_font.hpp"
#include "test_assets.hpp"

RenderSummary RenderRows(const Config& config, const std::vector<CsvRow>& rows, const fs::path& output_dir)
{
    const AssetResolver resolver{ config, MakeStubFontSet() };
    const PrintExporter exporter{ config, MakeColorConverter(config) };
    const CardRenderer renderer{ config, resolver, exporter };
    return renderer.RenderAll(rows, output_dir);
}

TEST_CASE("Render a card from csv without artwork", "[pipeline_single]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_single") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const Config config{ MakeTestConfig(dir) };
    WriteAllFrames(config.m_AssetDir, config.m_Template);

    const fs::path csv_path{ dir / "cards.csv" };
    {
        std::ofstream csv{ csv_path };
        csv << "name,cost,type,subtype,color,strength,description\n";
        csv << "Test Bear,{1}{G},Creature,Bear,Green,2,\"Whenever Test Bear attacks, it gets +1/+0.\"\n";
    }

    const fs::path output_dir{ dir / "output" };
    const RenderSummary summary{ RenderRows(config, ReadCsv(csv_path), output_dir) };

    REQUIRE(summary.AllRendered());
    REQUIRE(summary.m_Rendered.size() == 1);
    REQUIRE(summary.m_Rendered.front() == output_dir / "test-bear.jpg");
    REQUIRE(fs::exists(output_dir / "test-bear.jpg"));

    REQUIRE(summary.m_Warnings.size() == 1);
    REQUIRE(summary.m_Warnings.front().m_Row == 1);
    REQUIRE(summary.m_Warnings.front().m_Message.starts_with("MissingArtwork"));

    const auto info{ ProbeJpeg(output_dir / "test-bear.jpg") };
    REQUIRE(info.has_value());
    REQUIRE(info->m_ColorSpace == "CMYK");
    REQUIRE(info->m_Components == 4);
    REQUIRE(info->m_Dpi == 300u);
    REQUIRE(info->m_Width == static_cast<uint32_t>(ToPixels(config.CardSize().x, config.m_Dpi)));
    REQUIRE(info->m_Height == static_cast<uint32_t>(ToPixels(config.CardSize().y, config.m_Dpi)));
}

TEST_CASE("Invalid rows are skipped and reported", "[pipeline_skip]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_skip") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const Config config{ MakeTestConfig(dir) };
    WriteAllFrames(config.m_AssetDir, config.m_Template);

    CsvRow purple{ TestBearRow(2) };
    purple.m_Fields["name"] = "Purple Bear";
    purple.m_Fields["color"] = "Purple";

    CsvRow unnamed{ TestBearRow(3) };
    unnamed.m_Fields["name"] = "???";

    CsvRow spell{ TestBearRow(4) };
    spell.m_Fields["name"] = "Giant Growth";
    spell.m_Fields["type"] = "Spell";
    spell.m_Fields["strength"] = "";

    const fs::path output_dir{ dir / "output" };
    const RenderSummary summary{ RenderRows(config, { TestBearRow(1), purple, unnamed, spell }, output_dir) };

    REQUIRE(!summary.AllRendered());
    REQUIRE(!summary.m_Aborted);
    REQUIRE(summary.m_Rendered.size() == 2);
    REQUIRE(fs::exists(output_dir / "test-bear.jpg"));
    REQUIRE(fs::exists(output_dir / "giant-growth.jpg"));

    REQUIRE(summary.m_Skipped.size() == 2);
    REQUIRE(summary.m_Skipped[0].m_Row == 2);
    REQUIRE(summary.m_Skipped[0].m_Name == "Purple Bear");
    REQUIRE(summary.m_Skipped[0].m_Reason.find("color") != std::string::npos);
    REQUIRE(summary.m_Skipped[1].m_Row == 3);
    REQUIRE(summary.m_Skipped[1].m_Reason.find("name") != std::string::npos);
}

TEST_CASE("Fail fast stops at the first failed row", "[pipeline_fail_fast]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_fail_fast") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{ MakeTestConfig(dir) };
    config.m_ErrorPolicy = ErrorPolicy::FailFast;
    WriteAllFrames(config.m_AssetDir, config.m_Template);

    CsvRow broken{ TestBearRow(1) };
    broken.m_Fields["strength"] = "lots";

    CsvRow other{ TestBearRow(2) };
    other.m_Fields["name"] = "Other Bear";

    const fs::path output_dir{ dir / "output" };
    const RenderSummary summary{ RenderRows(config, { broken, other }, output_dir) };

    REQUIRE(summary.m_Aborted);
    REQUIRE(!summary.AllRendered());
    REQUIRE(summary.m_Skipped.size() == 1);
    REQUIRE(summary.m_Rendered.empty());
    REQUIRE(!fs::exists(output_dir / "other-bear.jpg"));
}

TEST_CASE("Duplicate names overwrite with a warning", "[pipeline_duplicate]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_duplicate") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{ MakeTestConfig(dir) };
    config.m_ColorModel = PrintColorModel::Rgb;
    config.m_OutputFormat = OutputFormat::Png;
    WriteAllFrames(config.m_AssetDir, config.m_Template);
    WriteArtwork(config.m_ArtDir / "test-bear.png", cv::Size{ 64, 48 }, cv::Scalar{ 0, 160, 0 });

    CsvRow again{ TestBearRow(2) };
    again.m_Fields["name"] = "TEST bear!";

    const fs::path output_dir{ dir / "output" };
    const RenderSummary summary{ RenderRows(config, { TestBearRow(1), again }, output_dir) };

    REQUIRE(summary.AllRendered());
    REQUIRE(summary.m_Rendered.size() == 2);
    REQUIRE(summary.m_Rendered[0] == summary.m_Rendered[1]);
    REQUIRE(summary.m_Rendered[0] == output_dir / "test-bear.png");
    REQUIRE(summary.m_Warnings.size() == 1);
    REQUIRE(summary.m_Warnings.front().m_Row == 2);
}

TEST_CASE("Missing frame stops the run before any card", "[pipeline_missing_frame]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_missing_frame") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const Config config{ MakeTestConfig(dir) };
    WriteAllFrames(config.m_AssetDir, config.m_Template);
    fs::remove(config.m_AssetDir / "frame_black.png");

    const fs::path output_dir{ dir / "output" };
    REQUIRE_THROWS_AS(RenderRows(config, { TestBearRow(1) }, output_dir), AssetNotFoundError);
    REQUIRE(!fs::exists(output_dir / "test-bear.jpg"));
}

TEST_CASE("Failed export skips the card and continues", "[pipeline_export_failure]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_export_failure") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const Config config{ MakeTestConfig(dir) };
    WriteAllFrames(config.m_AssetDir, config.m_Template);

    // A directory where the first card wants to write its file
    const fs::path output_dir{ dir / "output" };
    fs::create_directories(output_dir / "test-bear.jpg");

    CsvRow other{ TestBearRow(2) };
    other.m_Fields["name"] = "Other Bear";

    const RenderSummary summary{ RenderRows(config, { TestBearRow(1), other }, output_dir) };

    REQUIRE(!summary.AllRendered());
    REQUIRE(!summary.m_Aborted);
    REQUIRE(summary.m_Skipped.size() == 1);
    REQUIRE(summary.m_Skipped.front().m_Row == 1);
    REQUIRE(summary.m_Skipped.front().m_Name == "Test Bear");
    REQUIRE(summary.m_Skipped.front().m_Reason.starts_with("Failed exporting"));
    REQUIRE(fs::is_directory(output_dir / "test-bear.jpg"));

    REQUIRE(summary.m_Rendered.size() == 1);
    REQUIRE(summary.m_Rendered.front() == output_dir / "other-bear.jpg");
    REQUIRE(fs::exists(output_dir / "other-bear.jpg"));
}

TEST_CASE("Overlong names do not stop the batch", "[pipeline_long_name]")
{
    const fs::path dir{ MakeTestDirectory("pipeline_long_name") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const Config config{ MakeTestConfig(dir) };
    WriteAllFrames(config.m_AssetDir, config.m_Template);

    CsvRow long_name{ TestBearRow(1) };
    long_name.m_Fields["name"] = std::string(300, 'a');

    const fs::path output_dir{ dir / "output" };
    RenderSummary summary{};
    REQUIRE_NOTHROW(summary = RenderRows(config, { long_name, TestBearRow(2) }, output_dir));

    REQUIRE(!summary.m_Aborted);
    REQUIRE(summary.m_Rendered.size() + summary.m_Skipped.size() == 2);
    REQUIRE(summary.m_Rendered.back() == output_dir / "test-bear.jpg");
    REQUIRE(fs::exists(output_dir / "test-bear.jpg"));
    for (const SkippedCard& skipped : summary.m_Skipped)
    {
        REQUIRE(skipped.m_Row == 1);
    }
}
