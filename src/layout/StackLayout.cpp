#include "StackLayout.h"
#include <algorithm>
#include <cmath>

using namespace tessel;

void StackLayout::measure(const Space& space, const std::vector<StackChild>& children, const MeasureFunction& measure,
                          float minMinor, float maxMinor, std::vector<float>& majors, std::vector<float>& minors) const
{
    const std::size_t n = children.size();
    const float maxMajor = axisMajor(axis, space.max);
    const float gaps = gap * static_cast<float>(n - 1);

    auto store = [&](std::size_t i, const Space& childSpace) -> float {
        const Size size = measure(i, childSpace);
        majors[i] = axisMajor(axis, size);
        minors[i] = axisMinor(axis, size);
        return majors[i];
    };

    float fixed = 0.f;
    float looseFlex = 0.f;
    float tightFlex = 0.f;
    for (std::size_t i = 0; i < n; ++i) {
        const StackChild& child = children[i];
        if (child.flex <= 0.f) {
            fixed += store(i, { axisPack(axis, 0.f, minMinor), axisPack(axis, Infinity, maxMinor) });
        } else if (child.tight) {
            tightFlex += child.flex;
        } else {
            looseFlex += child.flex;
        }
    }

    const float flexSum = looseFlex + tightFlex;
    if (flexSum <= 0.f) {
        return;
    }

    float remaining = std::max(maxMajor - gaps - fixed, 0.f);
    if (looseFlex > 0.f) {
        const float perFlex = remaining / flexSum;
        for (std::size_t i = 0; i < n; ++i) {
            const StackChild& child = children[i];
            if (child.flex > 0.f && !child.tight) {
                fixed += store(i, { axisPack(axis, 0.f, minMinor), axisPack(axis, perFlex * child.flex, maxMinor) });
            }
        }
        remaining = std::max(maxMajor - gaps - fixed, 0.f);
    }

    if (tightFlex > 0.f) {
        const float perFlex = remaining / tightFlex;
        for (std::size_t i = 0; i < n; ++i) {
            const StackChild& child = children[i];
            if (child.flex <= 0.f || !child.tight) {
                continue;
            }
            if (std::isfinite(perFlex)) {
                const float amount = perFlex * child.flex;
                store(i, { axisPack(axis, amount, minMinor), axisPack(axis, amount, maxMinor) });
            } else {
                store(i, { axisPack(axis, 0.f, minMinor), axisPack(axis, Infinity, maxMinor) });
            }
        }
    }
}

Size StackLayout::layout(const Space& space, const std::vector<StackChild>& children,
                         const MeasureFunction& measureChild, std::vector<Point>& offsets) const
{
    const std::size_t n = children.size();
    offsets.assign(n, Point { 0.f, 0.f });

    const float minMajor = axisMajor(axis, space.min);
    const float maxMajor = axisMajor(axis, space.max);
    const float minMinor = axisMinor(axis, space.min);
    const float maxMinor = axisMinor(axis, space.max);

    if (n == 0) {
        return axisPack(axis, minMajor, minMinor);
    }

    std::vector<float> majors(n, 0.f);
    std::vector<float> minors(n, 0.f);

    measure(space, children, measureChild, 0.f, maxMinor, majors, minors);

    auto containerMinor = [&]() {
        const float largest = *std::max_element(minors.begin(), minors.end());
        return std::max(std::min(largest, maxMinor), minMinor);
    };

    float minor = containerMinor();
    if (align == Align::Stretch) {
        measure(space, children, measureChild, minor, minor, majors, minors);
        minor = containerMinor();
    }

    float content = gap * static_cast<float>(n - 1);
    for (float m : majors) {
        content += m;
    }
    const float major = std::max(std::min(content, maxMajor), minMajor);

    const std::vector<float> positions = tessel::justify(justify, majors, major, gap);
    for (std::size_t i = 0; i < n; ++i) {
        offsets[i] = axisPackPoint(axis, positions[i], tessel::align(align, minor, minors[i]));
    }

    return axisPack(axis, major, minor);
}
