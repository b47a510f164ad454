#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tessel {

enum class Justify {
    Start,
    Center,
    End,
    SpaceBetween,
    SpaceAround,
    SpaceEvenly
};

// positions along an axis of length size for items of the given sizes,
// separated by at least gap
std::vector<float> justify(Justify justify, const std::vector<float>& sizes, float size, float gap);

std::optional<Justify> parseJustify(const std::string& name);

} // namespace tessel
