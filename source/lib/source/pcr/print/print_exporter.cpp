#include <pcr/print/print_exporter.hpp>

#include <system_error>

#include <magic_enum/magic_enum.hpp>

#include <pcr/errors.hpp>
#include <pcr/print/jpeg_io.hpp>
#include <pcr/util/at_scope_exit.hpp>
#include <pcr/util/log.hpp>

namespace
{
const ColorRGB8 c_PaperWhite{ 255, 255, 255 };
inline constexpr int32_t c_DefaultJpgQuality{ 95 };
} // namespace

fs::path OutputPath(const fs::path& output_dir, std::string_view slug, const Config& config)
{
    fs::path output_path{ output_dir / slug };
    output_path += config.OutputExtension();
    return output_path;
}

PrintExporter::PrintExporter(const Config& config, std::unique_ptr<ColorConverter> converter)
    : m_Config{ config }
    , m_Converter{ std::move(converter) }
{
}

PixelSize PrintExporter::TrimPixelSize() const
{
    const Size card_size{ m_Config.CardSize() };
    return PixelSize{
        Pixel(static_cast<float>(ToPixels(card_size.x, m_Config.m_Dpi))),
        Pixel(static_cast<float>(ToPixels(card_size.y, m_Config.m_Dpi))),
    };
}

Pixel PrintExporter::BleedPixels() const
{
    return Pixel(static_cast<float>(ToPixels(m_Config.m_BleedEdge, m_Config.m_Dpi)));
}

PixelSize PrintExporter::OutputPixelSize() const
{
    const Pixel bleed{ BleedPixels() };
    return TrimPixelSize() + PixelSize{ bleed, bleed } * 2;
}

Image PrintExporter::Prepare(const Image& canvas) const
{
    const Image flat{ canvas.FlattenAlpha(c_PaperWhite) };
    const Image trimmed{ flat.Resize(TrimPixelSize()) };

    const Pixel bleed{ BleedPixels() };
    if (bleed <= 0_pix)
    {
        return trimmed;
    }

    if (m_Config.m_FancyBleed)
    {
        return trimmed.AddReflectBorder(bleed, bleed, bleed, bleed);
    }
    return trimmed.AddSolidBorder(bleed, bleed, bleed, bleed, c_PaperWhite);
}

void PrintExporter::Export(const Image& canvas, const fs::path& destination) const
{
    const PrintColorModel color_model{ m_Converter->ColorModel() };
    if (color_model == PrintColorModel::Cmyk && m_Config.m_OutputFormat == OutputFormat::Png)
    {
        throw ExportError{ destination, "PNG can not store CMYK, use Jpg output or the Rgb color model" };
    }

    const Image prepared{ Prepare(canvas) };
    if (!prepared)
    {
        throw ExportError{ destination, "rendered card is empty" };
    }

    const PrintImage print_image{ m_Converter->Convert(prepared) };

    // Half written files are removed so they can not be mistaken for finished cards
    AtScopeExit remove_partial_file{
        [&destination]()
        {
            std::error_code error;
            if (fs::is_regular_file(destination, error))
            {
                fs::remove(destination, error);
            }
        }
    };

    bool written{ false };
    if (color_model == PrintColorModel::Cmyk)
    {
        written = WriteCmykJpeg(destination,
                                print_image.m_Pixels,
                                m_Config.m_JpgQuality.value_or(c_DefaultJpgQuality),
                                m_Config.m_Dpi);
    }
    else
    {
        const Image rgb_image{ print_image.m_Pixels };
        written = rgb_image.Write(destination, m_Config.m_PngCompression, m_Config.m_JpgQuality, m_Config.m_Dpi);
    }

    if (!written)
    {
        throw ExportError{ destination, "could not write file" };
    }
    remove_partial_file.Release();

    LogInfo("Wrote {} ({}x{} px, {}, {} dpi, {} conversion)",
            destination.string(),
            print_image.m_Pixels.cols,
            print_image.m_Pixels.rows,
            magic_enum::enum_name(color_model),
            ToDotsPerInch(m_Config.m_Dpi),
            m_Converter->Name());
}

const ColorConverter& PrintExporter::Converter() const
{
    return *m_Converter;
}
