#pragma once

#include <optional>
#include <string_view>

#include <pcr/util.hpp>

enum class Unit
{
    Millimeter,
    Centimeter,
    Inches,
    Points,
};

constexpr Length UnitValue(Unit unit);
constexpr std::string_view UnitName(Unit unit);
constexpr std::string_view UnitShortName(Unit unit);

// Accepts both the long and the short name, e.g. "inches" and "in"
constexpr std::optional<Unit> UnitFromName(std::string_view unit_name);

std::optional<Length> ParseLength(std::string_view str);
std::optional<Size> ParseSize(std::string_view str);
std::string LengthToString(Length length, Unit unit);
std::string SizeToString(Size size, Unit unit);

#include <pcr/units.inl>
