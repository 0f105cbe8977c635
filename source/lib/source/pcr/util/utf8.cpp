#include <pcr/util/utf8.hpp>

char32_t NextCodePoint(std::string_view str, size_t& i)
{
    const auto lead{ static_cast<unsigned char>(str[i++]) };
    if (lead < 0x80)
    {
        return lead;
    }

    size_t trailing{ 0 };
    char32_t code_point{ 0 };
    if ((lead & 0xe0) == 0xc0)
    {
        trailing = 1;
        code_point = lead & 0x1f;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
        trailing = 2;
        code_point = lead & 0x0f;
    }
    else if ((lead & 0xf8) == 0xf0)
    {
        trailing = 3;
        code_point = lead & 0x07;
    }
    else
    {
        return U'\uFFFD';
    }

    for (size_t j = 0; j < trailing; j++)
    {
        if (i >= str.size() || (static_cast<unsigned char>(str[i]) & 0xc0) != 0x80)
        {
            return U'\uFFFD';
        }
        code_point = (code_point << 6) | (static_cast<unsigned char>(str[i++]) & 0x3f);
    }
    return code_point;
}

void PopCodePoint(std::string& str)
{
    while (!str.empty())
    {
        const auto last{ static_cast<unsigned char>(str.back()) };
        str.pop_back();
        if ((last & 0xc0) != 0x80)
        {
            break;
        }
    }
}

size_t CodePointCount(std::string_view str)
{
    size_t count{ 0 };
    for (size_t i = 0; i < str.size();)
    {
        NextCodePoint(str, i);
        count++;
    }
    return count;
}
