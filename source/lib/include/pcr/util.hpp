#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <dla/literals.h>
#include <dla/vector.h>

namespace fs = std::filesystem;

using Length = dla::length_unit;

namespace dla::unit_name
{
struct pixel
{
    static constexpr const char* id = "pixels";
    static constexpr const char* symbol = "pixels";
};
} // namespace dla::unit_name
using pixel_tag = dla::unit_tag<dla::unit_name::pixel>;
using Pixel = dla::base_unit<pixel_tag>;

using Size = dla::tvec2<Length>;
using PixelSize = dla::tvec2<Pixel>;
using PixelDensity = decltype(Pixel{} / Length{});

// clang-format off
using namespace dla::literals;
using namespace dla::int_literals;

constexpr auto operator""_mm(long double v) { return Length{ float(v * 0.001L) }; }
constexpr auto operator""_mm(unsigned long long v) { return Length{ float(v * 0.001L) }; }

constexpr auto operator""_cm(long double v) { return Length{ float(v * 0.01L) }; }
constexpr auto operator""_cm(unsigned long long v) { return Length{ float(v * 0.01L) }; }

constexpr auto operator""_in(long double v) { return Length{ float(v * 0.0254L) }; }
constexpr auto operator""_in(unsigned long long v) { return Length{ float(v * 0.0254L) }; }

constexpr auto operator""_pts(long double v) { return 0.0138889_in * float(v); }
constexpr auto operator""_pts(unsigned long long v) { return 0.0138889_in * float(v); }

constexpr auto operator""_dpi(long double v) { return Pixel(float(v)) / 1_in; }
constexpr auto operator""_dpi(unsigned long long v) { return Pixel{ float(v) } / 1_in; }

constexpr auto operator""_pix(long double v) { return Pixel(float(v)); }
constexpr auto operator""_pix(unsigned long long v) { return Pixel{ float(v) }; }

inline auto operator""_p(const char *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const wchar_t *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const char16_t *str, size_t len) { return fs::path(str, str + len); }
inline auto operator""_p(const char32_t *str, size_t len) { return fs::path(str, str + len); }
// clang-format on

// Rounds a physical length to whole pixels at the given density
int32_t ToPixels(Length length, PixelDensity density);

// Dots per inch, as written into image headers
uint32_t ToDotsPerInch(PixelDensity density);
uint32_t ToDotsPerMeter(PixelDensity density);

std::string ToLower(std::string_view str);
std::string_view Trim(std::string_view str);

// Parses the whole string as a float, trailing characters are rejected
std::optional<float> ToFloat(std::string_view str);
