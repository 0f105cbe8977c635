#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <opencv2/core/mat.hpp>

struct FontMetrics
{
    int32_t m_Ascent;
    int32_t m_Descent;

    int32_t LineHeight() const
    {
        return m_Ascent + m_Descent;
    }
};

// All sizes are pixel heights at working resolution, all text is utf-8
class Font
{
  public:
    virtual ~Font() = default;

    virtual std::string_view Name() const = 0;

    virtual int32_t MeasureWidth(std::string_view text, uint32_t size) const = 0;
    virtual FontMetrics Metrics(uint32_t size) const = 0;

    // Rasterizes text with its baseline starting at origin, coverage is max-combined into an 8 bit single channel mask
    virtual void Draw(cv::Mat& coverage, std::string_view text, cv::Point origin, uint32_t size) const = 0;
};

// Loaded once per run and shared read-only by every card
struct FontSet
{
    std::shared_ptr<const Font> m_Title;
    std::shared_ptr<const Font> m_Body;
    std::shared_ptr<const Font> m_Symbol;
};
