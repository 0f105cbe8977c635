#include <pcr/print/jpeg_io.hpp>

#include <csetjmp>
#include <cstdio>
#include <vector>

#include <jpeglib.h>

#include <pcr/util/at_scope_exit.hpp>
#include <pcr/util/log.hpp>

namespace
{
// libjpeg reports fatal errors through error_exit, which must not return
struct JpegErrorManager
{
    jpeg_error_mgr m_Pub;
    std::jmp_buf m_Jump;
    char m_Message[JMSG_LENGTH_MAX];
};

void JpegErrorExit(j_common_ptr cinfo)
{
    auto* error_manager{ reinterpret_cast<JpegErrorManager*>(cinfo->err) };
    (*cinfo->err->format_message)(cinfo, error_manager->m_Message);
    std::longjmp(error_manager->m_Jump, 1);
}

std::string_view ColorSpaceName(J_COLOR_SPACE color_space)
{
    switch (color_space)
    {
    case JCS_GRAYSCALE:
        return "Grayscale";
    case JCS_RGB:
        return "RGB";
    case JCS_YCbCr:
        return "YCbCr";
    case JCS_CMYK:
        return "CMYK";
    case JCS_YCCK:
        return "YCCK";
    default:
        return "Unknown";
    }
}
} // namespace

bool WriteCmykJpeg(const fs::path& path, const cv::Mat& cmyk, int32_t quality, PixelDensity density)
{
    if (cmyk.empty() || cmyk.type() != CV_8UC4)
    {
        LogError("Cmyk jpeg needs a four channel 8 bit image");
        return false;
    }

    FILE* file{ std::fopen(path.string().c_str(), "wb") };
    if (file == nullptr)
    {
        return false;
    }
    AtScopeExit close_file{
        [file]()
        { std::fclose(file); }
    };

    jpeg_compress_struct compressor{};
    JpegErrorManager error_manager{};
    compressor.err = jpeg_std_error(&error_manager.m_Pub);
    error_manager.m_Pub.error_exit = JpegErrorExit;

    // Everything libjpeg may jump over is set up before the jump target
    std::vector<JSAMPLE> row_buffer(static_cast<size_t>(cmyk.cols) * 4);

    if (setjmp(error_manager.m_Jump))
    {
        LogError("libjpeg failed writing {}: {}", path.string(), error_manager.m_Message);
        jpeg_destroy_compress(&compressor);
        return false;
    }

    jpeg_create_compress(&compressor);
    jpeg_stdio_dest(&compressor, file);

    compressor.image_width = static_cast<JDIMENSION>(cmyk.cols);
    compressor.image_height = static_cast<JDIMENSION>(cmyk.rows);
    compressor.input_components = 4;
    compressor.in_color_space = JCS_CMYK;

    jpeg_set_defaults(&compressor);
    jpeg_set_colorspace(&compressor, JCS_CMYK);
    jpeg_set_quality(&compressor, quality, TRUE);

    // jpeg_set_colorspace drops JFIF for CMYK, but it is the only standard place for the density
    compressor.write_JFIF_header = TRUE;
    compressor.write_Adobe_marker = TRUE;
    compressor.density_unit = 1; // 0: pixel ratio only, 1: DPI, 2: dots per cm
    compressor.X_density = static_cast<UINT16>(ToDotsPerInch(density));
    compressor.Y_density = compressor.X_density;

    jpeg_start_compress(&compressor, TRUE);
    while (compressor.next_scanline < compressor.image_height)
    {
        const auto* src_row{ cmyk.ptr<uchar>(static_cast<int>(compressor.next_scanline)) };
        for (size_t i = 0; i < row_buffer.size(); i++)
        {
            row_buffer[i] = static_cast<JSAMPLE>(255 - src_row[i]);
        }

        JSAMPROW row_pointer{ row_buffer.data() };
        jpeg_write_scanlines(&compressor, &row_pointer, 1);
    }
    jpeg_finish_compress(&compressor);
    jpeg_destroy_compress(&compressor);

    return std::ferror(file) == 0;
}

std::optional<JpegInfo> ProbeJpeg(const fs::path& path)
{
    FILE* file{ std::fopen(path.string().c_str(), "rb") };
    if (file == nullptr)
    {
        return std::nullopt;
    }
    AtScopeExit close_file{
        [file]()
        { std::fclose(file); }
    };

    jpeg_decompress_struct decompressor{};
    JpegErrorManager error_manager{};
    decompressor.err = jpeg_std_error(&error_manager.m_Pub);
    error_manager.m_Pub.error_exit = JpegErrorExit;

    if (setjmp(error_manager.m_Jump))
    {
        LogError("libjpeg failed reading {}: {}", path.string(), error_manager.m_Message);
        jpeg_destroy_decompress(&decompressor);
        return std::nullopt;
    }

    jpeg_create_decompress(&decompressor);
    jpeg_stdio_src(&decompressor, file);
    if (jpeg_read_header(&decompressor, TRUE) != JPEG_HEADER_OK)
    {
        jpeg_destroy_decompress(&decompressor);
        return std::nullopt;
    }

    std::optional<uint32_t> dpi{};
    if (decompressor.saw_JFIF_marker)
    {
        if (decompressor.density_unit == 1)
        {
            dpi = decompressor.X_density;
        }
        else if (decompressor.density_unit == 2)
        {
            dpi = static_cast<uint32_t>(decompressor.X_density * 2.54f + 0.5f);
        }
    }

    const JpegInfo info{
        .m_Width = decompressor.image_width,
        .m_Height = decompressor.image_height,
        .m_Components = static_cast<uint32_t>(decompressor.num_components),
        .m_ColorSpace = std::string{ ColorSpaceName(decompressor.jpeg_color_space) },
        .m_AdobeMarker = decompressor.saw_Adobe_marker != 0,
        .m_Dpi = dpi,
    };
    jpeg_destroy_decompress(&decompressor);
    return info;
}
