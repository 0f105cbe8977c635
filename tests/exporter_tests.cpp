#include <cmath>
#include <cstdlib>
#include <fstream>

#include <catch2/catch_test_macros.hpp>

#include <opencv2/imgcodecs.hpp>

#include <pcr/errors.hpp>
#include <pcr/print/color_conversion.hpp>
#include <pcr/print/jpeg_io.hpp>
#include <pcr/print/print_exporter.hpp>
#include <pcr/util/at_scope_exit.hpp>

#include "test_assets.hpp"

// Expected size in pixels before rounding
float ExpectedPixels(Length length, PixelDensity dpi)
{
    return length * dpi / 1_pix;
}

Image MakeCanvas()
{
    return Image::Filled(PixelSize{ 744_pix, 1039_pix }, ColorRGB8{ 200, 30, 30 });
}

TEST_CASE("Naive cmyk mapping", "[export_rgb_to_cmyk]")
{
    REQUIRE(RgbToCmyk(ColorRGB8{ 255, 255, 255 }) == cv::Vec4b{ 0, 0, 0, 0 });
    REQUIRE(RgbToCmyk(ColorRGB8{ 0, 0, 0 }) == cv::Vec4b{ 0, 0, 0, 255 });
    REQUIRE(RgbToCmyk(ColorRGB8{ 255, 0, 0 }) == cv::Vec4b{ 0, 255, 255, 0 });
    REQUIRE(RgbToCmyk(ColorRGB8{ 128, 128, 128 }) == cv::Vec4b{ 0, 0, 0, 127 });
    REQUIRE(RgbToCmyk(ColorRGB8{ 0, 128, 255 }) == cv::Vec4b{ 255, 127, 0, 0 });
}

TEST_CASE("Prepared canvas has trim size plus bleed", "[export_prepare]")
{
    Config config{};
    config.m_BleedEdge = 3_mm;

    for (const bool fancy_bleed : { true, false })
    {
        config.m_FancyBleed = fancy_bleed;
        const PrintExporter exporter{ config, std::make_unique<DirectCmykConverter>() };

        const Image prepared{ exporter.Prepare(MakeCanvas()) };
        REQUIRE(prepared.Channels() == 3);

        const Size expected_size{ config.CardSizeWithBleed() };
        REQUIRE(std::abs(prepared.Width() / 1_pix - ExpectedPixels(expected_size.x, config.m_Dpi)) <= 1.0f);
        REQUIRE(std::abs(prepared.Height() / 1_pix - ExpectedPixels(expected_size.y, config.m_Dpi)) <= 1.0f);
        REQUIRE(prepared.Width() == exporter.OutputPixelSize().x);
        REQUIRE(prepared.Height() == exporter.OutputPixelSize().y);

        // Mirrored bleed continues the card, plain bleed is paper white
        const cv::Vec3b corner{ prepared.GetUnderlying().at<cv::Vec3b>(0, 0) };
        if (fancy_bleed)
        {
            REQUIRE(corner == cv::Vec3b{ 30, 30, 200 });
        }
        else
        {
            REQUIRE(corner == cv::Vec3b{ 255, 255, 255 });
        }
    }
}

TEST_CASE("Transparent canvas is flattened onto white", "[export_flatten]")
{
    const Config config{};
    const PrintExporter exporter{ config, std::make_unique<RgbConverter>() };

    const Image transparent{ Image::Filled(PixelSize{ 100_pix, 140_pix }, ColorRGB8{ 0, 0, 0 }, 0) };
    const Image prepared{ exporter.Prepare(transparent) };
    REQUIRE(prepared.GetUnderlying().at<cv::Vec3b>(10, 10) == cv::Vec3b{ 255, 255, 255 });
}

TEST_CASE("Export cmyk jpeg", "[export_cmyk_jpg]")
{
    const fs::path dir{ MakeTestDirectory("export_cmyk_jpg") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{};
    config.m_Dpi = 600_dpi;
    const PrintExporter exporter{ config, MakeColorConverter(config) };
    REQUIRE(exporter.Converter().ColorModel() == PrintColorModel::Cmyk);

    const fs::path output{ OutputPath(dir, "test-card", config) };
    REQUIRE(output == dir / "test-card.jpg");
    exporter.Export(MakeCanvas(), output);
    REQUIRE(fs::exists(output));

    const auto info{ ProbeJpeg(output) };
    REQUIRE(info.has_value());
    REQUIRE(info->m_Components == config.ChannelCount());
    REQUIRE(info->m_ColorSpace == "CMYK");
    REQUIRE(info->m_AdobeMarker);
    REQUIRE(info->m_Dpi == 600u);

    const Size card_size{ config.CardSize() };
    REQUIRE(std::abs(static_cast<float>(info->m_Width) - ExpectedPixels(card_size.x, config.m_Dpi)) <= 1.0f);
    REQUIRE(std::abs(static_cast<float>(info->m_Height) - ExpectedPixels(card_size.y, config.m_Dpi)) <= 1.0f);
}

TEST_CASE("Export rgb png and jpeg", "[export_rgb]")
{
    const fs::path dir{ MakeTestDirectory("export_rgb") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{};
    config.m_ColorModel = PrintColorModel::Rgb;
    config.m_CardSizeChoice = "Japanese";

    {
        config.m_OutputFormat = OutputFormat::Png;
        const PrintExporter exporter{ config, MakeColorConverter(config) };
        const fs::path output{ OutputPath(dir, "card", config) };
        REQUIRE(output.extension() == ".png");
        exporter.Export(MakeCanvas(), output);

        const cv::Mat written{ cv::imread(output.string(), cv::IMREAD_UNCHANGED) };
        REQUIRE(written.channels() == 3);
        REQUIRE(written.cols == ToPixels(59_mm, config.m_Dpi));
        REQUIRE(written.rows == ToPixels(86_mm, config.m_Dpi));
    }

    {
        config.m_OutputFormat = OutputFormat::Jpg;
        const PrintExporter exporter{ config, MakeColorConverter(config) };
        const fs::path output{ OutputPath(dir, "card", config) };
        exporter.Export(MakeCanvas(), output);

        const auto info{ ProbeJpeg(output) };
        REQUIRE(info.has_value());
        REQUIRE(info->m_Components == 3);
        REQUIRE(info->m_Dpi == 300u);
        REQUIRE(!info->m_AdobeMarker);
    }
}

TEST_CASE("Cmyk png is rejected", "[export_cmyk_png]")
{
    const fs::path dir{ MakeTestDirectory("export_cmyk_png") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    Config config{};
    config.m_OutputFormat = OutputFormat::Png;
    const PrintExporter exporter{ config, MakeColorConverter(config) };

    const fs::path output{ OutputPath(dir, "card", config) };
    REQUIRE_THROWS_AS(exporter.Export(MakeCanvas(), output), ExportError);
    REQUIRE(!fs::exists(output));
}

TEST_CASE("Unwritable destination is an export error", "[export_unwritable]")
{
    const Config config{};
    const PrintExporter exporter{ config, MakeColorConverter(config) };
    const fs::path output{ fs::temp_directory_path() / "pcr_does_not_exist" / "nested" / "card.jpg" };
    REQUIRE_THROWS_AS(exporter.Export(MakeCanvas(), output), ExportError);
}

TEST_CASE("Identity color cube matches the direct conversion", "[export_color_cube]")
{
    const fs::path dir{ MakeTestDirectory("export_color_cube") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const fs::path cube_path{ dir / "identity.cube" };
    {
        std::ofstream cube{ cube_path };
        cube << "# identity\n";
        cube << "TITLE \"identity\"\n";
        cube << "LUT_3D_SIZE 2\n";
        for (int b = 0; b < 2; b++)
        {
            for (int g = 0; g < 2; g++)
            {
                for (int r = 0; r < 2; r++)
                {
                    cube << r << ".0 " << g << ".0 " << b << ".0\n";
                }
            }
        }
    }

    const cv::Mat color_cube{ LoadColorCube(cube_path) };
    REQUIRE(!color_cube.empty());
    REQUIRE(color_cube.dims == 3);

    Config config{};
    config.m_ColorConversion = ColorConversion::ColorCube;
    config.m_ColorCube = cube_path;
    const auto converter{ MakeColorConverter(config) };
    REQUIRE(converter->Name() == "color cube");

    const Image bgr{ Image::Filled(PixelSize{ 4_pix, 4_pix }, ColorRGB8{ 0, 128, 255 }).FlattenAlpha(ColorRGB8{ 255, 255, 255 }) };
    const PrintImage graded{ converter->Convert(bgr) };
    const PrintImage direct{ DirectCmykConverter{}.Convert(bgr) };
    REQUIRE(graded.m_ColorModel == PrintColorModel::Cmyk);
    REQUIRE(cv::norm(graded.m_Pixels, direct.m_Pixels, cv::NORM_INF) <= 2.0);
}

TEST_CASE("Missing or broken color cube", "[export_color_cube_missing]")
{
    Config config{};
    config.m_ColorConversion = ColorConversion::ColorCube;
    config.m_ColorCube = "does_not_exist.cube"_p;
    REQUIRE(LoadColorCube(config.m_ColorCube).empty());
    REQUIRE_THROWS_AS(MakeColorConverter(config), AssetNotFoundError);

    // Rgb output never grades through a cube
    config.m_ColorModel = PrintColorModel::Rgb;
    REQUIRE(MakeColorConverter(config)->ColorModel() == PrintColorModel::Rgb);
}

TEST_CASE("Color cube entries with trailing garbage are rejected", "[export_color_cube_garbage]")
{
    const fs::path dir{ MakeTestDirectory("export_color_cube_garbage") };
    AtScopeExit delete_dir{
        [&]()
        { fs::remove_all(dir); }
    };

    const fs::path cube_path{ dir / "garbage.cube" };
    {
        std::ofstream cube{ cube_path };
        cube << "LUT_3D_SIZE 2\n";
        for (int i = 0; i < 8; i++)
        {
            cube << "0.5abc 0.5 0.5\n";
        }
    }
    REQUIRE(LoadColorCube(cube_path).empty());

    REQUIRE(ToFloat("0.5") == 0.5f);
    REQUIRE(ToFloat("-2") == -2.0f);
    REQUIRE(!ToFloat("0.5abc").has_value());
    REQUIRE(!ToFloat("").has_value());
    REQUIRE(!ToFloat("mm").has_value());
}
