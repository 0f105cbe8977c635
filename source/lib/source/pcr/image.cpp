#include <pcr/image.hpp>

#include <algorithm>
#include <array>
#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <ranges>
#include <string_view>
#include <system_error>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <pcr/util/at_scope_exit.hpp>

namespace pngcrc
{
static uint32_t CRC(const uchar* buf, int len)
{
    static constexpr auto c_CrcTable{
        []()
        {
            std::array<uint32_t, 256> crc_table_bld{};
            for (int32_t n = 0; n < 256; n++)
            {
                uint32_t c{ static_cast<uint32_t>(n) };
                for (int32_t k = 0; k < 8; k++)
                {
                    if (c & 1)
                    {
                        c = 0xedb88320L ^ (c >> 1);
                    }
                    else
                    {
                        c = c >> 1;
                    }
                }
                crc_table_bld[n] = c;
            }
            return crc_table_bld;
        }()
    };
    uint32_t c{ 0xffffffffL };
    for (int32_t n = 0; n < len; n++)
    {
        c = c_CrcTable[(c ^ buf[n]) & 0xff] ^ (c >> 8);
    }
    return c ^ 0xffffffffL;
}
} // namespace pngcrc

namespace
{
bool WriteBuffer(const fs::path& path, const std::vector<uchar>& buf)
{
    FILE* file{ std::fopen(path.string().c_str(), "wb") };
    if (file == nullptr)
    {
        return false;
    }
    AtScopeExit close_file{
        [file]()
        { std::fclose(file); }
    };
    return std::fwrite(buf.data(), 1, buf.size(), file) == buf.size();
}

// Inserts a pHYs chunk in front of the first IDAT chunk
bool InsertPngDensity(std::vector<uchar>& buf, PixelDensity density)
{
    size_t idat_idx{ 0 };
    for (size_t j = 4; j + 4 <= buf.size(); j++)
    {
        if (std::string_view{ reinterpret_cast<const char*>(&buf[j]), 4 } == "IDAT")
        {
            idat_idx = j - 4;
            break;
        }
    }
    if (idat_idx == 0)
    {
        return false;
    }

    const uint32_t dots_per_meter{ ToDotsPerMeter(density) };

    struct
    {
        uint32_t m_Size;
        std::array<char, 4> m_Name;
        uint32_t m_DotsPerMeterX;
        uint32_t m_DotsPerMeterY;
        uint8_t m_Unit;
    } const phys_chunk{
        std::byteswap(9u),
        { 'p', 'H', 'Y', 's' },
        std::byteswap(dots_per_meter),
        std::byteswap(dots_per_meter),
        1, // meter
    };

    // size + name + data
    static constexpr uint32_t c_PhysChunkSize{ 4 + 4 + 9 };
    static_assert(sizeof(phys_chunk) == c_PhysChunkSize + 3);
    static_assert(offsetof(decltype(phys_chunk), m_Unit) == c_PhysChunkSize - 1);

    // crc covers only name and data
    const auto* crc_data{ reinterpret_cast<const uchar*>(&phys_chunk) + 4 };
    const uint32_t crc{ std::byteswap(pngcrc::CRC(crc_data, c_PhysChunkSize - 4)) };

    std::array<uchar, c_PhysChunkSize + 4> phys_buf;
    std::memcpy(phys_buf.data(), &phys_chunk, c_PhysChunkSize);
    std::memcpy(phys_buf.data() + c_PhysChunkSize, &crc, 4);
    buf.insert(buf.begin() + idat_idx, phys_buf.begin(), phys_buf.end());
    return true;
}

// Patches the density fields of the JFIF APP0 segment OpenCV writes
bool PatchJpegDensity(std::vector<uchar>& buf, PixelDensity density)
{
    if (buf.size() < 20 || buf[0] != 0xff || buf[1] != 0xd8 || buf[2] != 0xff || buf[3] != 0xe0)
    {
        return false;
    }

    const uint16_t dpi{ static_cast<uint16_t>(ToDotsPerInch(density)) };
    buf[4 + 9] = 1; // 0: pixel ratio only, 1: DPI, 2: dots per cm
    buf[4 + 9 + 1] = static_cast<uchar>(dpi >> 8);
    buf[4 + 9 + 2] = static_cast<uchar>(dpi & 0xff);
    buf[4 + 9 + 3] = buf[4 + 9 + 1];
    buf[4 + 9 + 4] = buf[4 + 9 + 2];
    return true;
}

int SafePixels(Pixel pixels)
{
    return std::max(0, static_cast<int>(pixels.value));
}
} // namespace

Image::Image(cv::Mat impl)
    : m_Impl{ std::move(impl) }
{
}

Image::~Image()
{
    Release();
}

Image::Image(Image&& rhs)
{
    *this = std::move(rhs);
}
Image::Image(const Image& rhs)
{
    *this = rhs;
}

Image& Image::operator=(Image&& rhs)
{
    m_Impl = std::move(rhs.m_Impl);
    return *this;
}
Image& Image::operator=(const Image& rhs)
{
    m_Impl = rhs.m_Impl.clone();
    return *this;
}

Image Image::Filled(PixelSize size, const ColorRGB8& color, uint8_t alpha)
{
    return Image{
        cv::Mat{
            static_cast<int>(size.y.value),
            static_cast<int>(size.x.value),
            CV_8UC4,
            ColorToScalar(color, alpha),
        },
    };
}

Image Image::Read(const fs::path& path)
{
    Image img{};
    std::error_code error;
    if (fs::is_regular_file(path, error))
    {
        img.m_Impl = cv::imread(path.string().c_str(), cv::IMREAD_UNCHANGED);
    }
    return img;
}

bool Image::Write(const fs::path& path,
                  std::optional<int32_t> png_compression,
                  std::optional<int32_t> jpg_quality,
                  PixelDensity density) const
{
    if (m_Impl.empty())
    {
        return false;
    }

    const fs::path ext{ path.extension() };
    if (ext == ".png")
    {
        std::vector<int> png_params;
        if (png_compression.has_value())
        {
            png_params = {
                cv::IMWRITE_PNG_COMPRESSION,
                png_compression.value(),
                cv::IMWRITE_PNG_STRATEGY,
                cv::IMWRITE_PNG_STRATEGY_DEFAULT,
            };
        }

        std::vector<uchar> buf;
        if (!cv::imencode(".png", m_Impl, buf, png_params) || !InsertPngDensity(buf, density))
        {
            return false;
        }
        return WriteBuffer(path, buf);
    }
    else if (ext == ".jpg" || ext == ".jpeg")
    {
        std::vector<int> jpg_params;
        if (jpg_quality.has_value())
        {
            jpg_params = {
                cv::IMWRITE_JPEG_QUALITY,
                jpg_quality.value(),
            };
        }

        std::vector<uchar> buf;
        if (!cv::imencode(".jpg", m_Impl, buf, jpg_params) || !PatchJpegDensity(buf, density))
        {
            return false;
        }
        return WriteBuffer(path, buf);
    }

    return cv::imwrite(path.string(), m_Impl);
}

Image::operator bool() const
{
    return !m_Impl.empty();
}

bool Image::Valid() const
{
    return static_cast<bool>(*this);
}

Image Image::ToBgra() const
{
    if (m_Impl.empty())
    {
        return Image{};
    }

    cv::Mat eight_bit;
    if (m_Impl.depth() == CV_16U)
    {
        m_Impl.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
    }
    else if (m_Impl.depth() != CV_8U)
    {
        m_Impl.convertTo(eight_bit, CV_8U);
    }
    else
    {
        eight_bit = m_Impl;
    }

    Image img{};
    switch (eight_bit.channels())
    {
    case 1:
        cv::cvtColor(eight_bit, img.m_Impl, cv::COLOR_GRAY2BGRA);
        break;
    case 3:
        cv::cvtColor(eight_bit, img.m_Impl, cv::COLOR_BGR2BGRA);
        break;
    case 4:
        img.m_Impl = eight_bit.clone();
        break;
    default:
        break;
    }
    return img;
}

Image Image::FlattenAlpha(const ColorRGB8& background) const
{
    const Image bgra{ ToBgra() };
    if (!bgra)
    {
        return Image{};
    }

    const cv::Mat& src{ bgra.m_Impl };
    cv::Mat dst(src.rows, src.cols, CV_8UC3);
    const std::array<float, 3> bg{
        static_cast<float>(background.b),
        static_cast<float>(background.g),
        static_cast<float>(background.r),
    };
    for (int y = 0; y < src.rows; y++)
    {
        const auto* src_row{ src.ptr<cv::Vec4b>(y) };
        auto* dst_row{ dst.ptr<cv::Vec3b>(y) };
        for (int x = 0; x < src.cols; x++)
        {
            const cv::Vec4b& px{ src_row[x] };
            const float alpha{ static_cast<float>(px[3]) / 255.0f };
            for (int c = 0; c < 3; c++)
            {
                dst_row[x][c] = static_cast<uchar>(std::round(px[c] * alpha + bg[c] * (1.0f - alpha)));
            }
        }
    }
    return Image{ std::move(dst) };
}

Image Image::Crop(Pixel left, Pixel top, Pixel right, Pixel bottom) const
{
    const int end_y{ m_Impl.rows - SafePixels(bottom) };
    const int end_x{ m_Impl.cols - SafePixels(right) };
    const int start_y{ SafePixels(top) };
    const int start_x{ SafePixels(left) };
    if (start_y >= end_y || start_x >= end_x)
    {
        return Image{};
    }

    Image img{};
    img.m_Impl = m_Impl(cv::Range(start_y, end_y), cv::Range(start_x, end_x)).clone();
    return img;
}

Image Image::AddSolidBorder(Pixel left, Pixel top, Pixel right, Pixel bottom, const ColorRGB8& color) const
{
    Image img{};
    cv::copyMakeBorder(m_Impl,
                       img.m_Impl,
                       SafePixels(top),
                       SafePixels(bottom),
                       SafePixels(left),
                       SafePixels(right),
                       cv::BORDER_CONSTANT,
                       ColorToScalar(color));
    return img;
}

Image Image::AddReflectBorder(Pixel left, Pixel top, Pixel right, Pixel bottom) const
{
    Image img{};
    cv::copyMakeBorder(m_Impl,
                       img.m_Impl,
                       SafePixels(top),
                       SafePixels(bottom),
                       SafePixels(left),
                       SafePixels(right),
                       cv::BORDER_REFLECT);
    return img;
}

template<int Channels>
struct CubeFilter
{
    const cv::Mat& m_ColorCube;
    const cv::Mat& m_InputImg;
    cv::Mat& m_OutputImg;

    using element_t = std::conditional_t<Channels == 3, cv::Vec3b, cv::Vec4b>;

    void operator()(int idx)
    {
        const int row{ idx / m_InputImg.cols };
        const int col{ idx % m_InputImg.cols };
        const auto& in_element{ m_InputImg.at<element_t>(row, col) };

        auto& out_element{ m_OutputImg.at<element_t>(row, col) };
        out_element = in_element;

        const int cube_size_minus_one{ m_ColorCube.size[0] - 1 };
        const float r{ (static_cast<float>(in_element[2]) / 255) * cube_size_minus_one };
        const float g{ (static_cast<float>(in_element[1]) / 255) * cube_size_minus_one };
        const float b{ (static_cast<float>(in_element[0]) / 255) * cube_size_minus_one };

        const int r_lo{ static_cast<int>(std::floor(r)) };
        const int r_hi{ static_cast<int>(std::ceil(r)) };
        const float r_frac{ r - static_cast<float>(r_lo) };

        const int g_lo{ static_cast<int>(std::floor(g)) };
        const int g_hi{ static_cast<int>(std::ceil(g)) };
        const float g_frac{ g - static_cast<float>(g_lo) };

        const int b_lo{ static_cast<int>(std::floor(b)) };
        const int b_hi{ static_cast<int>(std::ceil(b)) };
        const float b_frac{ b - static_cast<float>(b_lo) };

        static constexpr auto c_LinearInterpolate{
            [](std::array<ColorRGB32f, 2> values, float alpha)
            {
                return values[0] * (1 - alpha) + values[1] * alpha;
            },
        };

        static constexpr auto c_BilinearInterpolate{
            [](std::array<ColorRGB32f, 4> values, std::array<float, 2> alphas)
            {
                const std::array interim_values{
                    c_LinearInterpolate(std::array{ values[0], values[1] }, alphas[0]),
                    c_LinearInterpolate(std::array{ values[2], values[3] }, alphas[0]),
                };
                return c_LinearInterpolate(interim_values, alphas[1]);
            },
        };

        static constexpr auto c_TrilinearInterpolate{
            [](std::array<ColorRGB32f, 8> values, std::array<float, 3> alphas)
            {
                const std::array interim_values{
                    c_BilinearInterpolate(std::array{ values[0], values[1], values[2], values[3] }, std::array{ alphas[0], alphas[1] }),
                    c_BilinearInterpolate(std::array{ values[4], values[5], values[6], values[7] }, std::array{ alphas[0], alphas[1] }),
                };
                return c_LinearInterpolate(interim_values, alphas[2]);
            },
        };

        // Cube entries are rgb, indexed blue-major as stored in .cube files
        auto color_at{
            [&](int r, int g, int b)
            {
                const int index[]{ b, g, r };
                const auto v{ m_ColorCube.at<cv::Vec3b>(index) };
                return ColorRGB32f{
                    static_cast<float>(v[0]),
                    static_cast<float>(v[1]),
                    static_cast<float>(v[2]),
                };
            },
        };

        const std::array corners{
            color_at(r_lo, g_lo, b_lo),
            color_at(r_hi, g_lo, b_lo),

            color_at(r_lo, g_hi, b_lo),
            color_at(r_hi, g_hi, b_lo),

            color_at(r_lo, g_lo, b_hi),
            color_at(r_hi, g_lo, b_hi),

            color_at(r_lo, g_hi, b_hi),
            color_at(r_hi, g_hi, b_hi),
        };

        const ColorRGB32f interpolated{ c_TrilinearInterpolate(corners, { r_frac, g_frac, b_frac }) };
        out_element[0] = static_cast<uchar>(std::round(interpolated.b));
        out_element[1] = static_cast<uchar>(std::round(interpolated.g));
        out_element[2] = static_cast<uchar>(std::round(interpolated.r));
    }
};

Image Image::ApplyColorCube(const cv::Mat& color_cube) const
{
    if (m_Impl.channels() == 1 || color_cube.empty() || color_cube.dims != 3)
    {
        return *this;
    }

    Image filtered{ *this };
    auto flat_range{ std::views::iota(0, m_Impl.rows * m_Impl.cols) };
    switch (m_Impl.channels())
    {
    case 3:
        std::ranges::for_each(flat_range, CubeFilter<3>{ color_cube, m_Impl, filtered.m_Impl });
        break;
    case 4:
        std::ranges::for_each(flat_range, CubeFilter<4>{ color_cube, m_Impl, filtered.m_Impl });
        break;
    default:
        break;
    }
    return filtered;
}

Image Image::Resize(PixelSize size) const
{
    const cv::Size cv_size{ static_cast<int>(size.x.value), static_cast<int>(size.y.value) };
    if (m_Impl.empty() || cv_size.area() <= 0)
    {
        return Image{};
    }

    // Area averaging shrinks cleanly, cubic avoids blockiness when enlarging
    const bool shrinking{ cv_size.width <= m_Impl.cols && cv_size.height <= m_Impl.rows };
    Image img{};
    cv::resize(m_Impl, img.m_Impl, cv_size, 0, 0, shrinking ? cv::INTER_AREA : cv::INTER_CUBIC);
    return img;
}

Image Image::CoverResize(PixelSize size) const
{
    if (m_Impl.empty() || size.x.value <= 0 || size.y.value <= 0)
    {
        return Image{};
    }

    const float scale{
        std::max(size.x.value / static_cast<float>(m_Impl.cols), size.y.value / static_cast<float>(m_Impl.rows)),
    };
    const PixelSize scaled_size{
        Pixel(std::max(size.x.value, std::ceil(m_Impl.cols * scale))),
        Pixel(std::max(size.y.value, std::ceil(m_Impl.rows * scale))),
    };
    const Image scaled{ Resize(scaled_size) };

    const int overhang_x{ static_cast<int>(scaled_size.x.value - size.x.value) };
    const int overhang_y{ static_cast<int>(scaled_size.y.value - size.y.value) };
    const int left{ overhang_x / 2 };
    const int top{ overhang_y / 2 };
    return scaled.Crop(Pixel(static_cast<float>(left)),
                       Pixel(static_cast<float>(top)),
                       Pixel(static_cast<float>(overhang_x - left)),
                       Pixel(static_cast<float>(overhang_y - top)));
}

Pixel Image::Width() const
{
    return Size().x;
}

Pixel Image::Height() const
{
    return Size().y;
}

PixelSize Image::Size() const
{
    return ::PixelSize{
        Pixel(static_cast<float>(m_Impl.cols)),
        Pixel(static_cast<float>(m_Impl.rows)),
    };
}

int32_t Image::Channels() const
{
    return m_Impl.channels();
}

const cv::Mat& Image::GetUnderlying() const
{
    return m_Impl;
}

void Image::Release()
{
    m_Impl = cv::Mat{};
}
