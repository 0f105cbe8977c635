#pragma once

#include <cstdint>

#include <pcr/util/bit_field.hpp>

enum class LogFlags : uint32_t
{
    None = 0,
    Console = Bit(1u),
    File = Bit(2u),
    FatalQuit = Bit(3u),
    DetailTime = Bit(4u),
    DetailFile = Bit(5u),
    DetailLine = Bit(6u),
    DetailColumn = DetailLine | Bit(7u),
    DetailFunction = Bit(8u),
    DetailThread = Bit(9u),
    DetailContext = Bit(10u),

    DetailAll = DetailTime | DetailFile | DetailLine | DetailColumn | DetailFunction | DetailThread | DetailContext,
};
ENABLE_BITFIELD_OPERATORS(LogFlags);
