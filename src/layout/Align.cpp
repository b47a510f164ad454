#include "Align.h"
#include "Axis.h"

namespace tessel {

std::optional<Align> parseAlign(const std::string& name)
{
    if (name == "start") {
        return Align::Start;
    } else if (name == "center") {
        return Align::Center;
    } else if (name == "end") {
        return Align::End;
    } else if (name == "stretch") {
        return Align::Stretch;
    }
    return {};
}

std::optional<Axis> parseAxis(const std::string& name)
{
    if (name == "horizontal" || name == "row") {
        return Axis::Horizontal;
    } else if (name == "vertical" || name == "column") {
        return Axis::Vertical;
    }
    return {};
}

} // namespace tessel
