#include <cstdlib>

#include <catch2/catch_test_macros.hpp>

#include <opencv2/core.hpp>

#include <pcr/render/compositor.hpp>

#include "stub_font.hpp"
#include "test_assets.hpp"

bool IsNear(const cv::Vec4b& pixel, const cv::Vec4b& expected, int tolerance = 2)
{
    for (int c = 0; c < 4; c++)
    {
        if (std::abs(pixel[c] - expected[c]) > tolerance)
        {
            return false;
        }
    }
    return true;
}

Image MakeFrame(const CardTemplate& card_template)
{
    cv::Mat frame(card_template.m_CanvasSize, CV_8UC4, cv::Scalar{ 40, 40, 40, 255 });
    frame(card_template.m_ArtBox).setTo(cv::Scalar{ 0, 0, 0, 0 });
    frame(card_template.BodyBox()).setTo(cv::Scalar{ 230, 240, 245, 255 });
    return Image{ std::move(frame) };
}

ResolvedAssets MakeAssets(const CardTemplate& card_template)
{
    return ResolvedAssets{
        .m_Frame = MakeFrame(card_template),
        .m_Fonts = MakeStubFontSet(),
    };
}

TEST_CASE("Alpha composite blends and clips", "[compositor_alpha]")
{
    cv::Mat dst(4, 4, CV_8UC4, cv::Scalar{ 0, 0, 255, 255 });

    const cv::Mat opaque(2, 2, CV_8UC4, cv::Scalar{ 255, 0, 0, 255 });
    AlphaComposite(dst, opaque, cv::Point{ -1, -1 });
    REQUIRE(dst.at<cv::Vec4b>(0, 0) == cv::Vec4b{ 255, 0, 0, 255 });
    REQUIRE(dst.at<cv::Vec4b>(1, 1) == cv::Vec4b{ 0, 0, 255, 255 });

    const cv::Mat invisible(2, 2, CV_8UC4, cv::Scalar{ 0, 255, 0, 0 });
    AlphaComposite(dst, invisible, cv::Point{ 2, 2 });
    REQUIRE(dst.at<cv::Vec4b>(3, 3) == cv::Vec4b{ 0, 0, 255, 255 });

    const cv::Mat half(1, 1, CV_8UC4, cv::Scalar{ 255, 255, 255, 128 });
    AlphaComposite(dst, half, cv::Point{ 3, 0 });
    REQUIRE(IsNear(dst.at<cv::Vec4b>(0, 3), cv::Vec4b{ 128, 128, 255, 255 }));
}

TEST_CASE("Coverage blending paints text color", "[compositor_coverage]")
{
    cv::Mat dst(2, 2, CV_8UC4, cv::Scalar{ 255, 255, 255, 255 });
    cv::Mat coverage(2, 2, CV_8UC1, cv::Scalar{ 0 });
    coverage.at<uchar>(0, 0) = 255;
    coverage.at<uchar>(1, 1) = 128;

    BlendCoverage(dst, coverage, ColorRGB8{ 0, 0, 0 });
    REQUIRE(dst.at<cv::Vec4b>(0, 0) == cv::Vec4b{ 0, 0, 0, 255 });
    REQUIRE(dst.at<cv::Vec4b>(0, 1) == cv::Vec4b{ 255, 255, 255, 255 });
    REQUIRE(IsNear(dst.at<cv::Vec4b>(1, 1), cv::Vec4b{ 127, 127, 127, 255 }));
}

TEST_CASE("Compose a card with artwork", "[compositor_art]")
{
    const CardTemplate card_template{};
    const RenderStyle style{};
    const CardRecord record{ ParseCardRecord(TestBearRow()) };

    ResolvedAssets assets{ MakeAssets(card_template) };
    assets.m_Artwork = Image::Filled(PixelSize{ 100_pix, 50_pix }, ColorRGB8{ 10, 200, 30 });
    const cv::Mat frame_before{ assets.m_Frame.GetUnderlying().clone() };

    const CardLayout layout{ LayoutCard(record, assets.m_Fonts, card_template, LayoutOptions{}) };
    const Image card{ Compose(record, assets, layout, card_template, style) };
    const cv::Mat& pixels{ card.GetUnderlying() };

    REQUIRE(pixels.size() == card_template.m_CanvasSize);
    REQUIRE(pixels.type() == CV_8UC4);

    // Frame border
    REQUIRE(pixels.at<cv::Vec4b>(5, 5) == cv::Vec4b{ 40, 40, 40, 255 });

    // Artwork fills the window
    const cv::Rect& art{ card_template.m_ArtBox };
    REQUIRE(IsNear(pixels.at<cv::Vec4b>(art.y + art.height / 2, art.x + art.width / 2), cv::Vec4b{ 30, 200, 10, 255 }));
    REQUIRE(IsNear(pixels.at<cv::Vec4b>(art.y + 20, art.x + 20), cv::Vec4b{ 30, 200, 10, 255 }));

    // Art border
    REQUIRE(pixels.at<cv::Vec4b>(art.y + 1, art.x + art.width / 2) == cv::Vec4b{ 0, 0, 0, 255 });

    // Title glyphs are white
    REQUIRE(pixels.at<cv::Vec4b>(130, 100) == cv::Vec4b{ 255, 255, 255, 255 });

    // Body glyphs are black on the body box
    const cv::Rect body{ card_template.BodyBox() };
    REQUIRE(pixels.at<cv::Vec4b>(body.y + 16, body.x + 5) == cv::Vec4b{ 0, 0, 0, 255 });
    REQUIRE(pixels.at<cv::Vec4b>(body.y + body.height - 5, body.x + body.width - 5) == cv::Vec4b{ 230, 240, 245, 255 });

    // Strength box gets the flat fill of the card color behind its text
    const cv::Rect& strength{ card_template.m_StrengthBox };
    const ColorRGB8 fill{ FlatFillColor(CardColor::Green) };
    REQUIRE(pixels.at<cv::Vec4b>(strength.y + 8, strength.x + 8) == cv::Vec4b{ fill.b, fill.g, fill.r, 255 });
    REQUIRE(pixels.at<cv::Vec4b>(strength.y + strength.height / 2, strength.x + strength.width / 2) == cv::Vec4b{ 0, 0, 0, 255 });

    // Assets are left untouched
    REQUIRE(cv::norm(frame_before, assets.m_Frame.GetUnderlying(), cv::NORM_INF) == 0.0);
}

TEST_CASE("Compose a card without artwork", "[compositor_placeholder]")
{
    const CardTemplate card_template{};
    const RenderStyle style{};
    const CardRecord record{ ParseCardRecord(TestBearRow()) };

    const ResolvedAssets assets{ MakeAssets(card_template) };
    const CardLayout layout{ LayoutCard(record, assets.m_Fonts, card_template, LayoutOptions{}) };
    const Image card{ Compose(record, assets, layout, card_template, style) };
    const cv::Mat& pixels{ card.GetUnderlying() };

    const cv::Rect& art{ card_template.m_ArtBox };
    const ColorRGB8& placeholder{ style.m_PlaceholderArt };
    const cv::Vec4b placeholder_bgra{ placeholder.b, placeholder.g, placeholder.r, 255 };

    // Placeholder fill away from the cross
    REQUIRE(pixels.at<cv::Vec4b>(art.y + art.height / 2, art.x + 20) == placeholder_bgra);

    // Cross runs through the center
    REQUIRE(pixels.at<cv::Vec4b>(art.y + art.height / 2, art.x + art.width / 2) != placeholder_bgra);
}

TEST_CASE("Compose uses the background pattern", "[compositor_pattern]")
{
    const CardTemplate card_template{};
    const RenderStyle style{};
    CardRecord record{ ParseCardRecord(TestBearRow()) };
    record.m_Type = CardType::Spell;
    record.m_Strength.reset();

    ResolvedAssets assets{ MakeAssets(card_template) };
    assets.m_Pattern = Image::Filled(PixelSize{ 32_pix, 32_pix }, ColorRGB8{ 1, 2, 3 });

    const CardLayout layout{ LayoutCard(record, assets.m_Fonts, card_template, LayoutOptions{}) };
    REQUIRE(!layout.m_Strength.has_value());

    const Image card{ Compose(record, assets, layout, card_template, style) };
    const cv::Mat& pixels{ card.GetUnderlying() };

    const cv::Rect& art{ card_template.m_ArtBox };
    REQUIRE(IsNear(pixels.at<cv::Vec4b>(art.y + art.height / 2, art.x + 20), cv::Vec4b{ 3, 2, 1, 255 }));

    // No strength box for spells, the frame shows through
    const cv::Rect& strength{ card_template.m_StrengthBox };
    REQUIRE(pixels.at<cv::Vec4b>(strength.y + 8, strength.x + 8) == cv::Vec4b{ 40, 40, 40, 255 });
}
