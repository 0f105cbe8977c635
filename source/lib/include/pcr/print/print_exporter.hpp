#pragma once

#include <memory>
#include <string_view>

#include <pcr/config.hpp>
#include <pcr/image.hpp>
#include <pcr/print/color_conversion.hpp>

fs::path OutputPath(const fs::path& output_dir, std::string_view slug, const Config& config);

class PrintExporter
{
  public:
    PrintExporter(const Config& config, std::unique_ptr<ColorConverter> converter);

    // Trim size plus bleed on every side, in whole pixels at the configured density
    PixelSize OutputPixelSize() const;
    PixelSize TrimPixelSize() const;
    Pixel BleedPixels() const;

    // Flattened, resized and bled image, still in BGR
    Image Prepare(const Image& canvas) const;

    // Throws ExportError if the format can not hold the color model or the file can not be written
    void Export(const Image& canvas, const fs::path& destination) const;

    const ColorConverter& Converter() const;

  private:
    const Config& m_Config;
    std::unique_ptr<ColorConverter> m_Converter;
};
