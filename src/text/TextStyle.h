#pragma once

#include <EnumClassBitmask.h>
#include <cstdint>

namespace tessel {

enum class TextStyle : uint8_t {
    Normal = 0x0,
    Bold = 0x1,
    Italic = 0x2,
    Underline = 0x4
};

template<>
struct IsEnumBitmask<TextStyle> {
    static constexpr bool enable = true;
};

} // namespace tessel
