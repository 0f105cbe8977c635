#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <pcr/util.hpp>

enum class CardType
{
    Creature,
    Spell,
};

enum class CardColor
{
    White,
    Blue,
    Black,
    Red,
    Green,
};

std::string_view CardColorName(CardColor color);

struct CardRecord
{
    std::string m_Name;
    std::string m_Cost{};
    CardType m_Type;
    std::optional<std::string> m_Subtype{};
    CardColor m_Color;
    std::optional<fs::path> m_ArtFile{};
    std::optional<int32_t> m_Strength{};
    std::string m_Description{};

    // 1-based data row, the header is not counted
    size_t m_Row{ 0 };
};

struct CsvRow
{
    size_t m_Index;

    // Keyed by trimmed, lower-case header name
    std::map<std::string, std::string> m_Fields;

    // Cells beyond the header, always an error when parsed
    size_t m_ExtraCells{ 0 };
};

// Throws ValidationError naming the first offending field
CardRecord ParseCardRecord(const CsvRow& row);
