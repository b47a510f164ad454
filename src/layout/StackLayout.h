#pragma once

#include "Align.h"
#include "Axis.h"
#include "Justify.h"
#include "Space.h"
#include <functional>
#include <vector>

namespace tessel {

struct StackChild
{
    // 0 is non-flex
    float flex = 0.f;
    bool tight = false;
};

/* StackLayout

   single line flex layout. non-flex children are measured first, loose
   flex children then get at most their share of what's left and tight
   flex children get exactly their share of the remainder. with
   Align::Stretch the children are measured again with their minor fixed to
   the container minor.
*/

class StackLayout
{
public:
    using MeasureFunction = std::function<Size(std::size_t index, const Space& space)>;

    Axis axis = Axis::Horizontal;
    Justify justify = Justify::Start;
    Align align = Align::Start;
    float gap = 0.f;

    // returns the container size, offsets receives one position per child
    Size layout(const Space& space, const std::vector<StackChild>& children,
                const MeasureFunction& measure, std::vector<Point>& offsets) const;

private:
    void measure(const Space& space, const std::vector<StackChild>& children, const MeasureFunction& measure,
                 float minMinor, float maxMinor, std::vector<float>& majors, std::vector<float>& minors) const;
};

} // namespace tessel
