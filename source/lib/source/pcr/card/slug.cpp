#include <pcr/card/slug.hpp>

#include <array>
#include <cctype>

#include <pcr/util/utf8.hpp>

namespace
{
// Base letters for U+00C0 to U+00FF, empty where there is no letter
constexpr std::array<std::string_view, 64> c_Latin1Folding{
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "ss",
    "a", "a", "a", "a", "a", "a", "ae", "c", "e", "e", "e", "e", "i", "i", "i", "i",
    "d", "n", "o", "o", "o", "o", "o", "", "o", "u", "u", "u", "u", "y", "th", "y",
};
} // namespace

std::string Slugify(std::string_view name)
{
    std::string slug;
    slug.reserve(name.size());

    bool pending_separator{ false };
    const auto append{
        [&](std::string_view letters)
        {
            if (pending_separator && !slug.empty())
            {
                slug += '-';
            }
            pending_separator = false;
            slug += letters;
        }
    };

    for (size_t i = 0; i < name.size();)
    {
        const char32_t code_point{ NextCodePoint(name, i) };
        if (code_point < 0x80 && std::isalnum(static_cast<int>(code_point)))
        {
            const char lower{ static_cast<char>(std::tolower(static_cast<int>(code_point))) };
            append(std::string_view{ &lower, 1 });
        }
        else if (code_point >= 0xc0 && code_point <= 0xff && !c_Latin1Folding[code_point - 0xc0].empty())
        {
            append(c_Latin1Folding[code_point - 0xc0]);
        }
        else
        {
            pending_separator = true;
        }
    }

    return slug;
}
