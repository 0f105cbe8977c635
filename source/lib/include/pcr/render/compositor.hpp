#pragma once

#include <opencv2/core/mat.hpp>

#include <pcr/assets/asset_resolver.hpp>
#include <pcr/card/card_record.hpp>
#include <pcr/color.hpp>
#include <pcr/config.hpp>
#include <pcr/image.hpp>
#include <pcr/layout/card_template.hpp>
#include <pcr/layout/text_layout.hpp>

ColorRGB8 FlatFillColor(CardColor color);

// Blends src over dst at the given offset, both BGRA, src is clipped to dst
void AlphaComposite(cv::Mat& dst, const cv::Mat& src, cv::Point offset);

// Paints color into a BGRA image weighted by an 8 bit coverage mask of the same size
void BlendCoverage(cv::Mat& dst, const cv::Mat& coverage, const ColorRGB8& color);

void DrawText(cv::Mat& canvas, const PlacedText& text, const FontSet& fonts, const TextStyle& style);

/*
        Builds the card at working resolution, from bottom to top:
        background, artwork, frame, body panel, strength box, title, type line, cost, body, strength
        Assets are not modified
*/
Image Compose(const CardRecord& record,
              const ResolvedAssets& assets,
              const CardLayout& layout,
              const CardTemplate& card_template,
              const RenderStyle& style);
