#include "Justify.h"
#include <algorithm>
#include <cmath>

namespace tessel {

std::vector<float> justify(Justify justify, const std::vector<float>& sizes, float size, float gap)
{
    const std::size_t n = sizes.size();
    std::vector<float> positions(n, 0.f);
    if (n == 0) {
        return positions;
    }

    float total = gap * static_cast<float>(n - 1);
    for (float s : sizes) {
        total += s;
    }

    // nothing to distribute in unbounded space
    if (!std::isfinite(size)) {
        justify = Justify::Start;
    }

    const float remaining = size - total;
    const float free = std::max(remaining, 0.f);
    float start = 0.f;
    float spacing = gap;

    switch (justify) {
    case Justify::Start:
        break;
    case Justify::Center:
        start = remaining / 2.f;
        break;
    case Justify::End:
        start = remaining;
        break;
    case Justify::SpaceBetween:
        if (n > 1) {
            spacing = gap + free / static_cast<float>(n - 1);
        }
        break;
    case Justify::SpaceAround: {
        const float extra = free / static_cast<float>(n);
        start = extra / 2.f;
        spacing = gap + extra;
        break; }
    case Justify::SpaceEvenly: {
        const float extra = free / static_cast<float>(n + 1);
        start = extra;
        spacing = gap + extra;
        break; }
    }

    float pos = start;
    for (std::size_t i = 0; i < n; ++i) {
        positions[i] = pos;
        pos += sizes[i] + spacing;
    }
    return positions;
}

std::optional<Justify> parseJustify(const std::string& name)
{
    if (name == "start") {
        return Justify::Start;
    } else if (name == "center") {
        return Justify::Center;
    } else if (name == "end") {
        return Justify::End;
    } else if (name == "space-between") {
        return Justify::SpaceBetween;
    } else if (name == "space-around") {
        return Justify::SpaceAround;
    } else if (name == "space-evenly") {
        return Justify::SpaceEvenly;
    }
    return {};
}

} // namespace tessel
