#pragma once

#include <string>
#include <string_view>

// Decodes one code point starting at i and advances i past it, malformed input yields U+FFFD
char32_t NextCodePoint(std::string_view str, size_t& i);

// Removes the last complete code point, no-op on an empty string
void PopCodePoint(std::string& str);

size_t CodePointCount(std::string_view str);
