#include <pcr/print/color_conversion.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <fstream>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

#include <pcr/errors.hpp>
#include <pcr/util.hpp>
#include <pcr/util/log.hpp>

namespace
{
cv::Mat ConvertToCmyk(const cv::Mat& bgr)
{
    cv::Mat cmyk(bgr.rows, bgr.cols, CV_8UC4);
    for (int y = 0; y < bgr.rows; y++)
    {
        const auto* src_row{ bgr.ptr<cv::Vec3b>(y) };
        auto* dst_row{ cmyk.ptr<cv::Vec4b>(y) };
        for (int x = 0; x < bgr.cols; x++)
        {
            const cv::Vec3b& px{ src_row[x] };
            dst_row[x] = RgbToCmyk(ColorRGB8{ px[2], px[1], px[0] });
        }
    }
    return cmyk;
}
} // namespace

cv::Vec4b RgbToCmyk(const ColorRGB8& color)
{
    const int r{ color.r };
    const int g{ color.g };
    const int b{ color.b };
    const int k{ 255 - std::max({ r, g, b }) };
    if (k == 255)
    {
        return cv::Vec4b{ 0, 0, 0, 255 };
    }

    const auto ink{
        [k](int channel)
        {
            const float ratio{ static_cast<float>(255 - channel - k) / static_cast<float>(255 - k) };
            return cv::saturate_cast<uchar>(std::round(ratio * 255.0f));
        }
    };
    return cv::Vec4b{ ink(r), ink(g), ink(b), static_cast<uchar>(k) };
}

std::string_view DirectCmykConverter::Name() const
{
    return "direct";
}

PrintColorModel DirectCmykConverter::ColorModel() const
{
    return PrintColorModel::Cmyk;
}

PrintImage DirectCmykConverter::Convert(const Image& bgr) const
{
    return PrintImage{
        ConvertToCmyk(bgr.GetUnderlying()),
        PrintColorModel::Cmyk,
    };
}

ColorCubeCmykConverter::ColorCubeCmykConverter(cv::Mat color_cube)
    : m_ColorCube{ std::move(color_cube) }
{
}

std::string_view ColorCubeCmykConverter::Name() const
{
    return "color cube";
}

PrintColorModel ColorCubeCmykConverter::ColorModel() const
{
    return PrintColorModel::Cmyk;
}

PrintImage ColorCubeCmykConverter::Convert(const Image& bgr) const
{
    const Image graded{ bgr.ApplyColorCube(m_ColorCube) };
    return PrintImage{
        ConvertToCmyk(graded.GetUnderlying()),
        PrintColorModel::Cmyk,
    };
}

std::string_view RgbConverter::Name() const
{
    return "rgb";
}

PrintColorModel RgbConverter::ColorModel() const
{
    return PrintColorModel::Rgb;
}

PrintImage RgbConverter::Convert(const Image& bgr) const
{
    return PrintImage{
        bgr.GetUnderlying().clone(),
        PrintColorModel::Rgb,
    };
}

cv::Mat LoadColorCube(const fs::path& file_path)
{
    std::ifstream file{ file_path };
    if (!file)
    {
        LogError("Could not open color cube {}", file_path.string());
        return {};
    }

    int cube_size{ 0 };
    std::vector<cv::Vec3b> entries;

    std::string line;
    while (std::getline(file, line))
    {
        const std::string_view trimmed{ Trim(line) };
        if (trimmed.empty() || trimmed.starts_with('#'))
        {
            continue;
        }

        if (trimmed.starts_with("LUT_3D_SIZE"))
        {
            const std::string_view size_str{ Trim(trimmed.substr(std::string_view{ "LUT_3D_SIZE" }.size())) };
            const auto [ptr, ec]{ std::from_chars(size_str.data(), size_str.data() + size_str.size(), cube_size) };
            if (ec != std::errc{} || cube_size < 2)
            {
                LogError("Invalid LUT_3D_SIZE '{}' in color cube {}", size_str, file_path.string());
                return {};
            }
            entries.reserve(static_cast<size_t>(cube_size) * cube_size * cube_size);
            continue;
        }

        // TITLE, DOMAIN_MIN and friends
        if (std::isalpha(static_cast<unsigned char>(trimmed.front())))
        {
            continue;
        }

        static constexpr auto c_ToStringViews{ std::views::transform(
            [](auto str)
            { return std::string_view(str.data(), str.size()); }) };
        const std::vector values{
            trimmed |
            std::views::split(' ') |
            c_ToStringViews |
            std::views::filter([](std::string_view str)
                               { return !str.empty(); }) |
            std::views::transform(ToFloat) |
            std::ranges::to<std::vector>()
        };
        if (values.size() != 3 || std::ranges::any_of(values, [](const auto& val)
                                                      { return !val.has_value(); }))
        {
            LogError("Malformed entry '{}' in color cube {}", trimmed, file_path.string());
            return {};
        }

        const auto to_byte{
            [](float val)
            { return cv::saturate_cast<uchar>(std::round(val * 255.0f)); }
        };
        entries.push_back(cv::Vec3b{ to_byte(values[0].value()), to_byte(values[1].value()), to_byte(values[2].value()) });
    }

    const size_t expected_entries{ static_cast<size_t>(cube_size) * cube_size * cube_size };
    if (cube_size < 2 || entries.size() != expected_entries)
    {
        LogError("Color cube {} has {} entries, expected {} for size {}", file_path.string(), entries.size(), expected_entries, cube_size);
        return {};
    }

    // Red changes fastest in .cube files, so entries are laid out blue-major
    const int sizes[]{ cube_size, cube_size, cube_size };
    cv::Mat color_cube(3, sizes, CV_8UC3);
    std::memcpy(color_cube.data, entries.data(), entries.size() * sizeof(cv::Vec3b));
    return color_cube;
}

std::unique_ptr<ColorConverter> MakeColorConverter(const Config& config)
{
    if (config.m_ColorModel == PrintColorModel::Rgb)
    {
        return std::make_unique<RgbConverter>();
    }

    if (config.m_ColorConversion == ColorConversion::ColorCube)
    {
        cv::Mat color_cube = LoadColorCube(config.m_ColorCube);
        if (color_cube.empty())
        {
            throw AssetNotFoundError{ "color cube", config.m_ColorCube };
        }
        LogInfo("Grading output through color cube {}", config.m_ColorCube.string());
        return std::make_unique<ColorCubeCmykConverter>(std::move(color_cube));
    }

    return std::make_unique<DirectCmykConverter>();
}
