#pragma once

#include <string>
#include <string_view>

// Lower-case ascii, words separated by single dashes, e.g. "Test Bear" -> "test-bear"
std::string Slugify(std::string_view name);
