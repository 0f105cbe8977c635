#pragma once

#include <cstdint>
#include <optional>

#include <opencv2/core/mat.hpp>

#include <pcr/color.hpp>
#include <pcr/util.hpp>

class [[nodiscard]] Image
{
  public:
    Image() = default;
    Image(cv::Mat impl);
    ~Image();

    Image(Image&& rhs);
    Image(const Image& rhs);

    Image& operator=(Image&& rhs);
    Image& operator=(const Image& rhs);

    // Solid BGRA image
    static Image Filled(PixelSize size, const ColorRGB8& color, uint8_t alpha = 255);

    // Returns an invalid image if the file is missing or can not be decoded
    static Image Read(const fs::path& path);

    // Writes png or jpg based on the extension of path, with density stored in the file header
    bool Write(const fs::path& path,
               std::optional<int32_t> png_compression,
               std::optional<int32_t> jpg_quality,
               PixelDensity density) const;

    explicit operator bool() const;
    bool Valid() const;

    // Converts any 8 or 16 bit gray, BGR or BGRA image to 8 bit BGRA
    Image ToBgra() const;

    // Composites alpha over a solid background and drops the alpha channel
    Image FlattenAlpha(const ColorRGB8& background) const;

    Image Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const;
    Image AddSolidBorder(Pixel left, Pixel top, Pixel right, Pixel bottom, const ColorRGB8& color) const;
    Image AddReflectBorder(Pixel left, Pixel top, Pixel right, Pixel bottom) const;

    Image ApplyColorCube(const cv::Mat& color_cube) const;

    Image Resize(PixelSize size) const;

    // Scales to fully cover size, keeping the aspect ratio, then crops the overhang evenly from both sides
    Image CoverResize(PixelSize size) const;

    Pixel Width() const;
    Pixel Height() const;
    PixelSize Size() const;
    int32_t Channels() const;

    const cv::Mat& GetUnderlying() const;

  private:
    void Release();

    cv::Mat m_Impl{};
};
