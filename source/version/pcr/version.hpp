#pragma once

#include <string_view>

std::string_view PcrVersion();
std::string_view PcrBuildTime();

consteval std::string_view ConfigFormatVersion()
{
    return "PCR00001";
}
