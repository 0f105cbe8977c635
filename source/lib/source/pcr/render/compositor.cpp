#include <pcr/render/compositor.hpp>

#include <algorithm>
#include <array>

#include <opencv2/imgproc.hpp>

namespace
{
PixelSize ToPixelSize(cv::Size size)
{
    return PixelSize{
        Pixel(static_cast<float>(size.width)),
        Pixel(static_cast<float>(size.height)),
    };
}

// Pattern scaled to cover the region if there is one, otherwise a flat fill
Image Backdrop(const ResolvedAssets& assets, CardColor color, cv::Size size)
{
    if (assets.m_Pattern.has_value())
    {
        return assets.m_Pattern->CoverResize(ToPixelSize(size));
    }
    return Image::Filled(ToPixelSize(size), FlatFillColor(color));
}

void DrawArtwork(cv::Mat& canvas,
                 const CardRecord& record,
                 const ResolvedAssets& assets,
                 const cv::Rect& art_box,
                 const RenderStyle& style)
{
    if (assets.m_Artwork.has_value())
    {
        const Image art{ assets.m_Artwork->CoverResize(ToPixelSize(art_box.size())) };
        AlphaComposite(canvas, art.GetUnderlying(), art_box.tl());
    }
    else
    {
        const Image placeholder{
            assets.m_Pattern.has_value()
                ? Backdrop(assets, record.m_Color, art_box.size())
                : Image::Filled(ToPixelSize(art_box.size()), style.m_PlaceholderArt),
        };
        AlphaComposite(canvas, placeholder.GetUnderlying(), art_box.tl());

        // Cross marks the missing artwork
        const cv::Scalar cross_color{ ColorToScalar(style.m_ArtBorder) };
        const cv::Point top_left{ art_box.tl() };
        const cv::Point bottom_right{ art_box.br() - cv::Point{ 1, 1 } };
        cv::line(canvas, top_left, bottom_right, cross_color, 2, cv::LINE_AA);
        cv::line(canvas, cv::Point{ bottom_right.x, top_left.y }, cv::Point{ top_left.x, bottom_right.y }, cross_color, 2, cv::LINE_AA);
    }

    if (style.m_ArtBorderWidth > 0)
    {
        cv::rectangle(canvas, art_box, ColorToScalar(style.m_ArtBorder), style.m_ArtBorderWidth);
    }
}

void DrawStrengthBox(cv::Mat& canvas,
                     const CardRecord& record,
                     const ResolvedAssets& assets,
                     const cv::Rect& strength_box,
                     const RenderStyle& style)
{
    const Image backdrop{ Backdrop(assets, record.m_Color, strength_box.size()) };
    AlphaComposite(canvas, backdrop.GetUnderlying(), strength_box.tl());
    if (style.m_StrengthBorderWidth > 0)
    {
        cv::rectangle(canvas, strength_box, ColorToScalar(style.m_StrengthBorder), style.m_StrengthBorderWidth);
    }
}
} // namespace

ColorRGB8 FlatFillColor(CardColor color)
{
    switch (color)
    {
    case CardColor::White:
        return ColorRGB8{ 236, 232, 218 };
    case CardColor::Blue:
        return ColorRGB8{ 38, 110, 176 };
    case CardColor::Black:
        return ColorRGB8{ 62, 58, 56 };
    case CardColor::Red:
        return ColorRGB8{ 200, 56, 44 };
    case CardColor::Green:
    default:
        return ColorRGB8{ 36, 120, 70 };
    }
}

void AlphaComposite(cv::Mat& dst, const cv::Mat& src, cv::Point offset)
{
    const cv::Rect dst_rect{ cv::Rect{ offset, src.size() } & cv::Rect{ cv::Point{ 0, 0 }, dst.size() } };
    if (dst_rect.empty() || dst.type() != CV_8UC4 || src.type() != CV_8UC4)
    {
        return;
    }

    for (int y = dst_rect.y; y < dst_rect.y + dst_rect.height; y++)
    {
        const auto* src_row{ src.ptr<cv::Vec4b>(y - offset.y) };
        auto* dst_row{ dst.ptr<cv::Vec4b>(y) };
        for (int x = dst_rect.x; x < dst_rect.x + dst_rect.width; x++)
        {
            const cv::Vec4b& s{ src_row[x - offset.x] };
            cv::Vec4b& d{ dst_row[x] };

            const float src_alpha{ s[3] / 255.0f };
            const float dst_alpha{ d[3] / 255.0f };
            const float out_alpha{ src_alpha + dst_alpha * (1.0f - src_alpha) };
            if (out_alpha <= 0.0f)
            {
                d = cv::Vec4b{ 0, 0, 0, 0 };
                continue;
            }

            for (int c = 0; c < 3; c++)
            {
                const float blended{ (s[c] * src_alpha + d[c] * dst_alpha * (1.0f - src_alpha)) / out_alpha };
                d[c] = cv::saturate_cast<uchar>(blended);
            }
            d[3] = cv::saturate_cast<uchar>(out_alpha * 255.0f);
        }
    }
}

void BlendCoverage(cv::Mat& dst, const cv::Mat& coverage, const ColorRGB8& color)
{
    if (dst.type() != CV_8UC4 || coverage.type() != CV_8UC1 || dst.size() != coverage.size())
    {
        return;
    }

    const std::array<float, 3> bgr{
        static_cast<float>(color.b),
        static_cast<float>(color.g),
        static_cast<float>(color.r),
    };
    for (int y = 0; y < dst.rows; y++)
    {
        const auto* cov_row{ coverage.ptr<uchar>(y) };
        auto* dst_row{ dst.ptr<cv::Vec4b>(y) };
        for (int x = 0; x < dst.cols; x++)
        {
            const uchar cov{ cov_row[x] };
            if (cov == 0)
            {
                continue;
            }

            const float alpha{ cov / 255.0f };
            cv::Vec4b& d{ dst_row[x] };
            for (int c = 0; c < 3; c++)
            {
                d[c] = cv::saturate_cast<uchar>(d[c] * (1.0f - alpha) + bgr[c] * alpha);
            }
            d[3] = std::max(d[3], cov);
        }
    }
}

void DrawText(cv::Mat& canvas, const PlacedText& text, const FontSet& fonts, const TextStyle& style)
{
    if (text.m_Text.empty())
    {
        return;
    }

    cv::Mat coverage(canvas.size(), CV_8UC1, cv::Scalar{ 0 });
    FontFor(fonts, text.m_Font).Draw(coverage, text.m_Text, text.m_Origin, text.m_Size);

    if (style.m_Outline.has_value() && style.m_OutlineWidth > 0)
    {
        const int kernel_size{ 2 * style.m_OutlineWidth + 1 };
        const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size{ kernel_size, kernel_size });
        cv::Mat outline;
        cv::dilate(coverage, outline, kernel);
        BlendCoverage(canvas, outline, style.m_Outline.value());
    }

    BlendCoverage(canvas, coverage, style.m_Fill);
}

Image Compose(const CardRecord& record,
              const ResolvedAssets& assets,
              const CardLayout& layout,
              const CardTemplate& card_template,
              const RenderStyle& style)
{
    const cv::Size canvas_size{ card_template.m_CanvasSize };

    const Image background{ Backdrop(assets, record.m_Color, canvas_size) };
    cv::Mat canvas = background.GetUnderlying().clone();

    DrawArtwork(canvas, record, assets, card_template.m_ArtBox, style);

    if (assets.m_Frame.GetUnderlying().size() == canvas_size)
    {
        AlphaComposite(canvas, assets.m_Frame.GetUnderlying(), cv::Point{ 0, 0 });
    }
    else
    {
        const Image frame{ assets.m_Frame.Resize(ToPixelSize(canvas_size)) };
        AlphaComposite(canvas, frame.GetUnderlying(), cv::Point{ 0, 0 });
    }

    if (assets.m_BodyPanel.has_value())
    {
        const cv::Rect body_box{ card_template.BodyBox() };
        const Image panel{ assets.m_BodyPanel->CoverResize(ToPixelSize(body_box.size())) };
        AlphaComposite(canvas, panel.GetUnderlying(), body_box.tl());
    }

    if (layout.m_Strength.has_value())
    {
        DrawStrengthBox(canvas, record, assets, card_template.m_StrengthBox, style);
    }

    DrawText(canvas, layout.m_Title, assets.m_Fonts, style.m_Title);
    DrawText(canvas, layout.m_TypeLine, assets.m_Fonts, style.m_TypeLine);
    for (const PlacedText& glyph : layout.m_Cost.m_Glyphs)
    {
        DrawText(canvas, glyph, assets.m_Fonts, style.m_Cost);
    }
    for (const PlacedText& line : layout.m_Body)
    {
        DrawText(canvas, line, assets.m_Fonts, style.m_Body);
    }
    if (layout.m_Strength.has_value())
    {
        DrawText(canvas, layout.m_Strength.value(), assets.m_Fonts, style.m_Strength);
    }

    return Image{ std::move(canvas) };
}
