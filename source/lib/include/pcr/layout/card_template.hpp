#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include <opencv2/core/types.hpp>

struct LayoutBox
{
    std::string_view m_Name;
    cv::Rect m_Rect;
};

// Shrink-to-fit parameters, all in pixels at working resolution
struct FontSizeRange
{
    uint32_t m_Start;
    uint32_t m_Min;
    uint32_t m_Step;

    // Number of sizes tried before hitting the floor, including the start size
    uint32_t StepCount() const;
};

/*
        Geometry of a card at working resolution, every text region gets its own box
        Defaults reproduce the classic 63x88mm frame at 300 dpi
*/
struct CardTemplate
{
    cv::Size m_CanvasSize{ 744, 1039 };

    cv::Rect m_TitleBox{ 96, 98, 440, 64 };
    cv::Rect m_CostBox{ 540, 98, 112, 64 };
    cv::Rect m_ArtBox{ 64, 164, 616, 486 };
    cv::Rect m_TypeBox{ 96, 656, 556, 40 };
    cv::Rect m_StrengthBox{ 542, 930, 110, 64 };

    // The body box spans the remaining height between its top and the bottom margin
    int32_t m_BodyLeft{ 100 };
    int32_t m_BodyWidth{ 544 };
    int32_t m_BodyTop{ 704 };
    int32_t m_BodyBottomMargin{ 117 };

    FontSizeRange m_TitleSizes{ 60, 28, 2 };
    FontSizeRange m_CostSizes{ 44, 24, 2 };
    FontSizeRange m_TypeSizes{ 38, 20, 2 };
    FontSizeRange m_BodySizes{ 34, 16, 2 };
    FontSizeRange m_StrengthSizes{ 48, 24, 2 };

    int32_t m_BodyLineSpacing{ 4 };

    cv::Rect BodyBox() const;

    std::vector<LayoutBox> Boxes() const;

    // Throws TemplateError if boxes overlap, leave the canvas or are empty
    void Validate() const;
};
