#pragma once

#include <algorithm>
#include <cmath>
#include <limits>

namespace tessel {

constexpr float Infinity = std::numeric_limits<float>::infinity();

template<typename T>
struct PosT
{
    T x, y;

    PosT operator+(const PosT& other) const { return { x + other.x, y + other.y }; }
    PosT operator-(const PosT& other) const { return { x - other.x, y - other.y }; }
    bool operator==(const PosT& other) const = default;
};

template<typename T>
struct SizeT
{
    T width, height;

    SizeT operator+(const SizeT& other) const { return { width + other.width, height + other.height }; }
    SizeT operator-(const SizeT& other) const { return { width - other.width, height - other.height }; }
    bool operator==(const SizeT& other) const = default;

    bool isFinite() const { return std::isfinite(width) && std::isfinite(height); }
};

template<typename XY, typename WH>
struct RectT
{
    XY x, y;
    WH width, height;

    PosT<XY> pos() const { return { x, y }; }
    SizeT<WH> size() const { return { width, height }; }

    bool contains(const PosT<XY>& p) const
    {
        return p.x >= x && p.y >= y && p.x < x + width && p.y < y + height;
    }

    RectT translated(const PosT<XY>& p) const { return { x + p.x, y + p.y, width, height }; }

    bool operator==(const RectT& other) const = default;
};

using Point = PosT<float>;
using Size = SizeT<float>;
using Rect = RectT<float, float>;

inline Size clampSize(const Size& size, const Size& min, const Size& max)
{
    // std::clamp asserts min <= max which does not hold for min > max constraints
    return {
        std::max(std::min(size.width, max.width), min.width),
        std::max(std::min(size.height, max.height), min.height)
    };
}

// 2d affine transform, [a c tx; b d ty]
struct Affine
{
    float a = 1.f, b = 0.f, c = 0.f, d = 1.f, tx = 0.f, ty = 0.f;

    static Affine identity() { return {}; }
    static Affine translate(const Point& p) { return { 1.f, 0.f, 0.f, 1.f, p.x, p.y }; }
    static Affine scale(float sx, float sy) { return { sx, 0.f, 0.f, sy, 0.f, 0.f }; }

    Point translation() const { return { tx, ty }; }

    Point apply(const Point& p) const
    {
        return { a * p.x + c * p.y + tx, b * p.x + d * p.y + ty };
    }

    Affine operator*(const Affine& o) const
    {
        return {
            a * o.a + c * o.b,
            b * o.a + d * o.b,
            a * o.c + c * o.d,
            b * o.c + d * o.d,
            a * o.tx + c * o.ty + tx,
            b * o.tx + d * o.ty + ty
        };
    }

    Affine& operator*=(const Affine& o)
    {
        *this = *this * o;
        return *this;
    }

    bool operator==(const Affine& other) const = default;
};

// axis aligned bounds of a transformed rect
inline Rect transformRect(const Affine& t, const Rect& r)
{
    const Point p[4] = {
        t.apply({ r.x, r.y }),
        t.apply({ r.x + r.width, r.y }),
        t.apply({ r.x, r.y + r.height }),
        t.apply({ r.x + r.width, r.y + r.height })
    };
    float minX = p[0].x, minY = p[0].y, maxX = p[0].x, maxY = p[0].y;
    for (int i = 1; i < 4; ++i) {
        minX = std::min(minX, p[i].x);
        minY = std::min(minY, p[i].y);
        maxX = std::max(maxX, p[i].x);
        maxY = std::max(maxY, p[i].y);
    }
    return { minX, minY, maxX - minX, maxY - minY };
}

inline float mix(float from, float to, float t)
{
    return from + (to - from) * t;
}

} // namespace tessel
