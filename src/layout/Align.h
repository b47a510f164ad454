#pragma once

#include <optional>
#include <string>

namespace tessel {

enum class Align {
    Start,
    Center,
    End,
    Stretch
};

// offset of an item of size inside available
inline float align(Align align, float available, float size)
{
    switch (align) {
    case Align::Start:
    case Align::Stretch:
        return 0.f;
    case Align::Center:
        return (available - size) / 2.f;
    case Align::End:
        return available - size;
    }
    return 0.f;
}

std::optional<Align> parseAlign(const std::string& name);

} // namespace tessel
