#include "Easing.h"
#include <array>
#include <cmath>
#include <utility>

namespace tessel {

static constexpr float HalfPi = 1.5707963f;
static constexpr float Pi = 3.1415926f;

static float easeLinear(float t)
{
    return t;
}

static float easeInSine(float t)
{
    return 1.f - cosf(HalfPi * t);
}

static float easeOutSine(float t)
{
    return sinf(HalfPi * t);
}

static float easeInOutSine(float t)
{
    return 0.5f * (1.f - cosf(Pi * t));
}

static float easeInQuad(float t)
{
    return t * t;
}

static float easeOutQuad(float t)
{
    return t * (2.f - t);
}

static float easeInOutQuad(float t)
{
    return t < 0.5f ? 2.f * t * t : -1.f + (4.f - 2.f * t) * t;
}

static float easeInCubic(float t)
{
    return t * t * t;
}

static float easeOutCubic(float t)
{
    const float u = t - 1.f;
    return 1.f + u * u * u;
}

static float easeInOutCubic(float t)
{
    if (t < 0.5f) {
        return 4.f * t * t * t;
    }
    const float u = 2.f * t - 2.f;
    return 1.f + 0.5f * u * u * u;
}

static float easeInBack(float t)
{
    return t * t * (2.70158f * t - 1.70158f);
}

static float easeOutBack(float t)
{
    const float u = t - 1.f;
    return 1.f + u * u * (2.70158f * u + 1.70158f);
}

static float easeInOutBack(float t)
{
    if (t < 0.5f) {
        return t * t * (7.f * t - 2.5f) * 2.f;
    }
    const float u = t - 1.f;
    return 1.f + u * u * 2.f * (7.f * u + 2.5f);
}

static const std::array<EasingFunction, 13> easingFunctions = {
    easeLinear,
    easeInSine,
    easeOutSine,
    easeInOutSine,
    easeInQuad,
    easeOutQuad,
    easeInOutQuad,
    easeInCubic,
    easeOutCubic,
    easeInOutCubic,
    easeInBack,
    easeOutBack,
    easeInOutBack
};

EasingFunction getEasingFunction(Ease ease)
{
    return easingFunctions[static_cast<std::underlying_type_t<Ease>>(ease)];
}

std::optional<Ease> parseEase(const std::string& name)
{
    static const std::array<std::pair<const char*, Ease>, 17> names = { {
        { "linear", Ease::Linear },
        { "ease", Ease::InOutSine },
        { "ease-in", Ease::InSine },
        { "ease-out", Ease::OutSine },
        { "ease-in-out", Ease::InOutSine },
        { "ease-in-sine", Ease::InSine },
        { "ease-out-sine", Ease::OutSine },
        { "ease-in-out-sine", Ease::InOutSine },
        { "ease-in-quad", Ease::InQuad },
        { "ease-out-quad", Ease::OutQuad },
        { "ease-in-out-quad", Ease::InOutQuad },
        { "ease-in-cubic", Ease::InCubic },
        { "ease-out-cubic", Ease::OutCubic },
        { "ease-in-out-cubic", Ease::InOutCubic },
        { "ease-in-back", Ease::InBack },
        { "ease-out-back", Ease::OutBack },
        { "ease-in-out-back", Ease::InOutBack }
    } };
    for (const auto& entry : names) {
        if (name == entry.first) {
            return entry.second;
        }
    }
    return {};
}

} // namespace tessel
