#pragma once

#include <type_traits>

namespace tessel {

template<typename T>
struct IsEnumBitmask
{
    static constexpr bool enable = false;
};

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, T> operator|(T lhs, T rhs)
{
    using U = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<U>(lhs) | static_cast<U>(rhs));
}

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, T> operator&(T lhs, T rhs)
{
    using U = std::underlying_type_t<T>;
    return static_cast<T>(static_cast<U>(lhs) & static_cast<U>(rhs));
}

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, T> operator~(T value)
{
    using U = std::underlying_type_t<T>;
    return static_cast<T>(~static_cast<U>(value));
}

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, T&> operator|=(T& lhs, T rhs)
{
    lhs = lhs | rhs;
    return lhs;
}

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, T&> operator&=(T& lhs, T rhs)
{
    lhs = lhs & rhs;
    return lhs;
}

template<typename T>
constexpr std::enable_if_t<IsEnumBitmask<T>::enable, bool> any(T value)
{
    return static_cast<std::underlying_type_t<T>>(value) != 0;
}

} // namespace tessel
