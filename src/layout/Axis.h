#pragma once

#include <Geometry.h>
#include <optional>
#include <string>

namespace tessel {

enum class Axis {
    Horizontal,
    Vertical
};

inline float axisMajor(Axis axis, const Size& size)
{
    return axis == Axis::Horizontal ? size.width : size.height;
}

inline float axisMinor(Axis axis, const Size& size)
{
    return axis == Axis::Horizontal ? size.height : size.width;
}

inline Size axisPack(Axis axis, float major, float minor)
{
    if (axis == Axis::Horizontal) {
        return { major, minor };
    }
    return { minor, major };
}

inline Point axisPackPoint(Axis axis, float major, float minor)
{
    if (axis == Axis::Horizontal) {
        return { major, minor };
    }
    return { minor, major };
}

std::optional<Axis> parseAxis(const std::string& name);

} // namespace tessel
