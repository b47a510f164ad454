#pragma once

#include <Geometry.h>

namespace tessel {

struct Padding
{
    float top = 0.f;
    float right = 0.f;
    float bottom = 0.f;
    float left = 0.f;

    static Padding all(float value) { return { value, value, value, value }; }
    static Padding symmetric(float vertical, float horizontal) { return { vertical, horizontal, vertical, horizontal }; }

    Size size() const { return { left + right, top + bottom }; }
    Point offset() const { return { left, top }; }

    bool operator==(const Padding& other) const = default;
};

} // namespace tessel
