#pragma once

#include <optional>
#include <string>
#include <cstdint>

namespace tessel {

enum class Ease : uint8_t {
    Linear,
    InSine,
    OutSine,
    InOutSine,
    InQuad,
    OutQuad,
    InOutQuad,
    InCubic,
    OutCubic,
    InOutCubic,
    InBack,
    OutBack,
    InOutBack
};

using EasingFunction = float (*)(float);

EasingFunction getEasingFunction(Ease ease);
// css-like names, "linear", "ease-in", "ease-out-cubic" etc
std::optional<Ease> parseEase(const std::string& name);

} // namespace tessel
