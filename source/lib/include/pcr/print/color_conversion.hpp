#pragma once

#include <memory>
#include <string_view>

#include <opencv2/core/mat.hpp>

#include <pcr/config.hpp>
#include <pcr/image.hpp>

struct PrintImage
{
    // 8 bit, C M Y K for Cmyk and B G R for Rgb
    cv::Mat m_Pixels;
    PrintColorModel m_ColorModel;
};

// Naive mapping without a color profile, values are ink amounts from 0 to 255
cv::Vec4b RgbToCmyk(const ColorRGB8& color);

class ColorConverter
{
  public:
    virtual ~ColorConverter() = default;

    virtual std::string_view Name() const = 0;
    virtual PrintColorModel ColorModel() const = 0;

    // Input is an opaque 8 bit BGR image
    virtual PrintImage Convert(const Image& bgr) const = 0;
};

class DirectCmykConverter : public ColorConverter
{
  public:
    std::string_view Name() const override;
    PrintColorModel ColorModel() const override;
    PrintImage Convert(const Image& bgr) const override;
};

// Grades the image through a 3D lookup table before the direct mapping
class ColorCubeCmykConverter : public ColorConverter
{
  public:
    explicit ColorCubeCmykConverter(cv::Mat color_cube);

    std::string_view Name() const override;
    PrintColorModel ColorModel() const override;
    PrintImage Convert(const Image& bgr) const override;

  private:
    cv::Mat m_ColorCube;
};

class RgbConverter : public ColorConverter
{
  public:
    std::string_view Name() const override;
    PrintColorModel ColorModel() const override;
    PrintImage Convert(const Image& bgr) const override;
};

// Reads a .cube file into a size x size x size table of rgb entries, empty on failure
cv::Mat LoadColorCube(const fs::path& file_path);

std::unique_ptr<ColorConverter> MakeColorConverter(const Config& config);
