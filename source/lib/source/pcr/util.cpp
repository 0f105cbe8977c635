#include <pcr/util.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>

int32_t ToPixels(Length length, PixelDensity density)
{
    return static_cast<int32_t>(std::round(length * density / 1_pix));
}

uint32_t ToDotsPerInch(PixelDensity density)
{
    return static_cast<uint32_t>(std::round(density * 1_in / 1_pix));
}

uint32_t ToDotsPerMeter(PixelDensity density)
{
    return static_cast<uint32_t>(std::round(density * 1_m / 1_pix));
}

std::string ToLower(std::string_view str)
{
    std::string lower{ str };
    std::ranges::transform(lower,
                           lower.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string_view Trim(std::string_view str)
{
    static constexpr std::string_view c_Whitespace{ " \t\r\n\v\f" };
    const auto first{ str.find_first_not_of(c_Whitespace) };
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last{ str.find_last_not_of(c_Whitespace) };
    return str.substr(first, last - first + 1);
}

std::optional<float> ToFloat(std::string_view str)
{
    float val{};
#ifdef __clang__
    // Clang and AppleClang do not support std::from_chars overloads with floating points
    try
    {
        size_t consumed{};
        val = std::stof(std::string{ str }, &consumed);
        if (consumed != str.size())
        {
            return std::nullopt;
        }
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
#else
    const auto [ptr, ec]{ std::from_chars(str.data(), str.data() + str.size(), val) };
    if (ec != std::errc{} || ptr != str.data() + str.size())
    {
        return std::nullopt;
    }
#endif
    return val;
}
