#include <pcr/card/card_record.hpp>

#include <charconv>

#include <fmt/format.h>

#include <magic_enum/magic_enum.hpp>

#include <pcr/errors.hpp>

namespace
{
std::string_view GetField(const CsvRow& row, std::string_view field)
{
    const auto it{ row.m_Fields.find(std::string{ field }) };
    if (it == row.m_Fields.end())
    {
        return {};
    }
    return Trim(it->second);
}

std::string UnescapeNewlines(std::string_view text)
{
    std::string unescaped;
    unescaped.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++)
    {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n')
        {
            unescaped += '\n';
            i++;
        }
        else
        {
            unescaped += text[i];
        }
    }
    return unescaped;
}
} // namespace

std::string_view CardColorName(CardColor color)
{
    return magic_enum::enum_name(color);
}

CardRecord ParseCardRecord(const CsvRow& row)
{
    if (row.m_ExtraCells > 0)
    {
        throw ValidationError{ "row", row.m_Index, fmt::format("{} cells more than there are columns", row.m_ExtraCells) };
    }

    const std::string_view name{ GetField(row, "name") };
    if (name.empty())
    {
        throw ValidationError{ "name", row.m_Index, "missing or empty" };
    }

    const std::string_view type_str{ GetField(row, "type") };
    const auto type{ magic_enum::enum_cast<CardType>(type_str, magic_enum::case_insensitive) };
    if (!type.has_value())
    {
        throw ValidationError{ "type", row.m_Index, fmt::format("'{}' is neither Creature nor Spell", type_str) };
    }

    const std::string_view color_str{ GetField(row, "color") };
    const auto color{ magic_enum::enum_cast<CardColor>(color_str, magic_enum::case_insensitive) };
    if (!color.has_value())
    {
        throw ValidationError{ "color", row.m_Index, fmt::format("'{}' is not a known color", color_str) };
    }

    // Older sheets call the column power
    std::string_view strength_field{ "strength" };
    std::string_view strength_str{ GetField(row, strength_field) };
    if (strength_str.empty() && !GetField(row, "power").empty())
    {
        strength_field = "power";
        strength_str = GetField(row, strength_field);
    }

    std::optional<int32_t> strength{};
    if (type.value() == CardType::Creature)
    {
        if (strength_str.empty())
        {
            throw ValidationError{ strength_field, row.m_Index, "required for creatures" };
        }

        int32_t value{};
        const char* const end{ strength_str.data() + strength_str.size() };
        const auto [ptr, ec]{ std::from_chars(strength_str.data(), end, value) };
        if (ec != std::errc{} || ptr != end)
        {
            throw ValidationError{ strength_field, row.m_Index, fmt::format("'{}' is not a whole number", strength_str) };
        }
        strength = value;
    }
    else if (!strength_str.empty())
    {
        throw ValidationError{ strength_field, row.m_Index, "spells have no strength" };
    }

    CardRecord record{
        .m_Name = std::string{ name },
        .m_Cost = std::string{ GetField(row, "cost") },
        .m_Type = type.value(),
        .m_Color = color.value(),
        .m_Strength = strength,
        .m_Description = UnescapeNewlines(GetField(row, "description")),
        .m_Row = row.m_Index,
    };

    if (const std::string_view subtype{ GetField(row, "subtype") }; !subtype.empty())
    {
        record.m_Subtype = std::string{ subtype };
    }
    if (const std::string_view art_file{ GetField(row, "art_file") }; !art_file.empty())
    {
        record.m_ArtFile = fs::path{ art_file };
    }

    return record;
}
