#pragma once

#include <type_traits>

// NOLINTBEGIN

namespace detail
{
template<typename BitFieldTy>
struct BitFieldOperatorsEnabled
{
    static constexpr bool value = false;
};
} // namespace detail

// Call this on the enum class type that shall have the operators enabled
#define ENABLE_BITFIELD_OPERATORS(bitfield)           \
    template<>                                        \
    struct detail::BitFieldOperatorsEnabled<bitfield> \
    {                                                 \
        static constexpr bool value = true;           \
    }

#define MAKE_BINARY_BITFIELD_OPERATOR(op)                                                              \
    template<typename BitFieldTy>                                                                      \
    inline constexpr std::enable_if_t<detail::BitFieldOperatorsEnabled<BitFieldTy>::value, BitFieldTy> \
    operator op(const BitFieldTy & lhs, const BitFieldTy & rhs)                                        \
    {                                                                                                  \
        using BaseTy = std::underlying_type_t<BitFieldTy>;                                             \
        return static_cast<BitFieldTy>(                                                                \
            static_cast<BaseTy>(lhs) op static_cast<BaseTy>(rhs));                                     \
    }

MAKE_BINARY_BITFIELD_OPERATOR(&)
MAKE_BINARY_BITFIELD_OPERATOR(|)

#undef MAKE_BINARY_BITFIELD_OPERATOR

template<typename BitFieldTy>
inline constexpr std::enable_if_t<detail::BitFieldOperatorsEnabled<BitFieldTy>::value, bool>
IsSet(const BitFieldTy& lhs, const BitFieldTy& rhs)
{
    return (lhs & rhs) == rhs;
}
template<typename BitFieldTy>
inline constexpr std::enable_if_t<detail::BitFieldOperatorsEnabled<BitFieldTy>::value, bool>
IsAnySet(const BitFieldTy& lhs, const BitFieldTy& rhs)
{
    using BaseTy = std::underlying_type_t<BitFieldTy>;
    return static_cast<BaseTy>(lhs & rhs) != BaseTy{};
}

template<class T>
consteval T Bit(T ith)
{
    return static_cast<T>(1 << (ith + 1));
}

// NOLINTEND
