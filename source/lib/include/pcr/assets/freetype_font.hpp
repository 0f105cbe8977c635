#pragma once

#include <memory>

#include <pcr/assets/font.hpp>
#include <pcr/util.hpp>

struct Config;

class FreeTypeFont : public Font
{
  public:
    // Throws AssetNotFoundError if the file is missing or not a font
    explicit FreeTypeFont(const fs::path& font_path);
    ~FreeTypeFont() override;

    FreeTypeFont(const FreeTypeFont&) = delete;
    FreeTypeFont& operator=(const FreeTypeFont&) = delete;

    std::string_view Name() const override;

    int32_t MeasureWidth(std::string_view text, uint32_t size) const override;
    FontMetrics Metrics(uint32_t size) const override;

    void Draw(cv::Mat& coverage, std::string_view text, cv::Point origin, uint32_t size) const override;

  private:
    struct FaceImpl;
    std::unique_ptr<FaceImpl> m_Impl;
};

// Loads title, body and symbol font from the asset directory
FontSet LoadFontSet(const Config& config);
