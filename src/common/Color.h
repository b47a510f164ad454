#pragma once

#include <optional>
#include <string>

namespace tessel {

struct Color
{
    float r, g, b, a;

    bool operator==(const Color& other) const
    {
        // ### should do something for float compare
        return r == other.r
            && g == other.g
            && b == other.b
            && a == other.a;
    }

    static Color rgba(float r, float g, float b, float a = 1.f) { return { r, g, b, a }; }
    static Color transparent() { return { 0.f, 0.f, 0.f, 0.f }; }
    static Color black() { return { 0.f, 0.f, 0.f, 1.f }; }
    static Color white() { return { 1.f, 1.f, 1.f, 1.f }; }
};

// #rgb, #rgba, #rrggbb, #rrggbbaa, rgb(r, g, b) and rgba(r, g, b, a)
std::optional<Color> parseColor(const std::string& color);
Color premultiplied(const Color& color);
Color mix(const Color& from, const Color& to, float t);

} // namespace tessel
