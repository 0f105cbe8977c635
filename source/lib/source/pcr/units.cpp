#include <pcr/units.hpp>

#include <algorithm>
#include <ranges>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace
{
inline constexpr auto c_ToStringViews{ std::views::transform(
    [](auto str)
    { return std::string_view(str.data(), str.size()); }) };

std::vector<std::string_view> SplitParts(const std::string& str)
{
    return str |
           std::views::split(' ') |
           c_ToStringViews |
           std::views::filter([](std::string_view part)
                              { return !part.empty(); }) |
           std::ranges::to<std::vector>();
}
} // namespace

std::optional<Length> ParseLength(std::string_view str)
{
    std::string normalized{ Trim(str) };
    std::ranges::replace(normalized, ',', '.');

    const auto parts{ SplitParts(normalized) };
    if (parts.size() != 2)
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto length{ ToFloat(parts[0]) };
    if (!base_unit.has_value() || !length.has_value())
    {
        return std::nullopt;
    }

    return length.value() * UnitValue(base_unit.value());
}

std::optional<Size> ParseSize(std::string_view str)
{
    std::string normalized{ Trim(str) };
    std::ranges::replace(normalized, ',', '.');

    const auto parts{ SplitParts(normalized) };
    if (parts.size() != 4 || parts[1] != "x")
    {
        return std::nullopt;
    }

    const auto base_unit{ UnitFromName(parts.back()) };
    const auto width{ ToFloat(parts[0]) };
    const auto height{ ToFloat(parts[2]) };
    if (!base_unit.has_value() || !width.has_value() || !height.has_value())
    {
        return std::nullopt;
    }

    const Length unit_value{ UnitValue(base_unit.value()) };
    return Size{ width.value() * unit_value, height.value() * unit_value };
}

std::string LengthToString(Length length, Unit unit)
{
    return fmt::format("{:g} {}", length / UnitValue(unit), UnitShortName(unit));
}

std::string SizeToString(Size size, Unit unit)
{
    return fmt::format("{:g} x {:g} {}", size.x / UnitValue(unit), size.y / UnitValue(unit), UnitShortName(unit));
}
