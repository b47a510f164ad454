#pragma once

#include "Align.h"
#include "Axis.h"
#include "Justify.h"
#include "Space.h"
#include <functional>
#include <vector>

namespace tessel {

struct WrapRun
{
    std::size_t start = 0;
    std::size_t end = 0;
    float major = 0.f;
    float minor = 0.f;
};

/* WrapLayout

   line wrapping layout. children are measured unconstrained and packed
   greedily into runs along the major axis. flex weights are ignored.
*/

class WrapLayout
{
public:
    using MeasureFunction = std::function<Size(std::size_t index, const Space& space)>;

    Axis axis = Axis::Horizontal;
    Justify justify = Justify::Start;
    Align align = Align::Center;
    Justify justifyCross = Justify::Start;
    float rowGap = 0.f;
    float columnGap = 0.f;

    float majorGap() const;
    float minorGap() const;

    Size layout(const Space& space, std::size_t count, const MeasureFunction& measure, std::vector<Point>& offsets) const;

    static std::vector<WrapRun> pack(const std::vector<float>& majors, const std::vector<float>& minors, float gap, float maxMajor);
};

inline float WrapLayout::majorGap() const
{
    return axis == Axis::Horizontal ? columnGap : rowGap;
}

inline float WrapLayout::minorGap() const
{
    return axis == Axis::Horizontal ? rowGap : columnGap;
}

} // namespace tessel
