#include <pcr/layout/card_template.hpp>

#include <fmt/format.h>

#include <pcr/errors.hpp>

uint32_t FontSizeRange::StepCount() const
{
    if (m_Step == 0 || m_Start <= m_Min)
    {
        return 1;
    }
    return (m_Start - m_Min + m_Step - 1) / m_Step + 1;
}

cv::Rect CardTemplate::BodyBox() const
{
    return cv::Rect{
        m_BodyLeft,
        m_BodyTop,
        m_BodyWidth,
        m_CanvasSize.height - m_BodyTop - m_BodyBottomMargin,
    };
}

std::vector<LayoutBox> CardTemplate::Boxes() const
{
    return {
        { "title", m_TitleBox },
        { "cost", m_CostBox },
        { "art", m_ArtBox },
        { "type", m_TypeBox },
        { "body", BodyBox() },
        { "strength", m_StrengthBox },
    };
}

void CardTemplate::Validate() const
{
    if (m_CanvasSize.width <= 0 || m_CanvasSize.height <= 0)
    {
        throw TemplateError{ fmt::format("Canvas size {}x{} is empty", m_CanvasSize.width, m_CanvasSize.height) };
    }

    const cv::Rect canvas{ cv::Point{ 0, 0 }, m_CanvasSize };
    const auto boxes{ Boxes() };
    for (size_t i = 0; i < boxes.size(); i++)
    {
        const auto& [name, rect]{ boxes[i] };
        if (rect.empty())
        {
            throw TemplateError{ fmt::format("Box '{}' is empty", name) };
        }
        if ((rect & canvas) != rect)
        {
            throw TemplateError{ fmt::format("Box '{}' leaves the canvas", name) };
        }

        for (size_t j = i + 1; j < boxes.size(); j++)
        {
            const auto& [other_name, other_rect]{ boxes[j] };
            if ((rect & other_rect).area() > 0)
            {
                throw TemplateError{ fmt::format("Box '{}' overlaps box '{}'", name, other_name) };
            }
        }
    }

    for (const FontSizeRange* sizes : { &m_TitleSizes, &m_CostSizes, &m_TypeSizes, &m_BodySizes, &m_StrengthSizes })
    {
        if (sizes->m_Min == 0 || sizes->m_Min > sizes->m_Start || sizes->m_Step == 0)
        {
            throw TemplateError{
                fmt::format("Font sizes {}/{}/{} are not a valid shrink range", sizes->m_Start, sizes->m_Min, sizes->m_Step)
            };
        }
    }
}
