#pragma once

#include <Geometry.h>

namespace tessel {

// min/max constraint handed to a view's layout
struct Space
{
    Size min = { 0.f, 0.f };
    Size max = { Infinity, Infinity };

    static Space unbounded() { return {}; }
    static Space exact(const Size& size) { return { size, size }; }
    static Space upTo(const Size& size) { return { { 0.f, 0.f }, size }; }

    Space loosen() const { return { { 0.f, 0.f }, max }; }

    // shrink both ends by size, used for padding
    Space shrink(const Size& size) const
    {
        return {
            { std::max(min.width - size.width, 0.f), std::max(min.height - size.height, 0.f) },
            { std::max(max.width - size.width, 0.f), std::max(max.height - size.height, 0.f) }
        };
    }

    Size fit(const Size& size) const { return clampSize(size, min, max); }

    bool operator==(const Space& other) const = default;
};

} // namespace tessel
