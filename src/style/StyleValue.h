#pragma once

#include "Easing.h"
#include <Align.h>
#include <Axis.h>
#include <Color.h>
#include <Geometry.h>
#include <Justify.h>
#include <Padding.h>
#include <fmt/core.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>

namespace tessel {

enum class LengthUnit : uint8_t {
    Px,
    Pt,
    Percent,
    Vw,
    Vh,
    Em
};

// pixels per em
constexpr float EmSize = 16.f;

struct Length
{
    float value = 0.f;
    LengthUnit unit = LengthUnit::Px;

    static Length px(float value) { return { value, LengthUnit::Px }; }

    // percentages are relative to percentBase
    float pixels(const Size& window, float percentBase = 0.f) const;

    bool operator==(const Length& other) const = default;
};

struct StyleString
{
    std::string value;

    bool operator==(const StyleString& other) const = default;
};

// bare identifier, e.g. center or space-between
struct StyleEnum
{
    std::string value;

    bool operator==(const StyleEnum& other) const = default;
};

using StyleValue = std::variant<StyleString, StyleEnum, Length, Color>;

struct StyleTransition
{
    // seconds
    float duration = 0.f;
    Ease ease = Ease::Linear;

    // eased progress in [0, 1] after elapsed seconds
    float progress(float elapsed) const;

    bool operator==(const StyleTransition& other) const = default;
};

struct StyleAttribute
{
    std::string key;
    StyleValue value;
    std::optional<StyleTransition> transition;
};

using StyleAttributes = std::vector<StyleAttribute>;

std::string toString(const StyleValue& value);

// typed reads, returns an empty optional when the value has a different type
template<typename T>
struct StyleConvert;

template<>
struct StyleConvert<float>
{
    static std::optional<float> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Length>
{
    static std::optional<Length> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Color>
{
    static std::optional<Color> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<std::string>
{
    static std::optional<std::string> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Padding>
{
    static std::optional<Padding> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Justify>
{
    static std::optional<Justify> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Align>
{
    static std::optional<Align> convert(const StyleValue& value, const Size& window);
};

template<>
struct StyleConvert<Axis>
{
    static std::optional<Axis> convert(const StyleValue& value, const Size& window);
};

// only these go through transitions, everything else snaps
template<typename T>
struct IsInterpolable
{
    static constexpr bool enable = false;
};

template<>
struct IsInterpolable<float>
{
    static constexpr bool enable = true;
};

template<>
struct IsInterpolable<Color>
{
    static constexpr bool enable = true;
};

} // namespace tessel

template<>
struct fmt::formatter<tessel::StyleValue> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const tessel::StyleValue& value, Context& ctx) const {
        return formatter<std::string_view>::format(tessel::toString(value), ctx);
    }
};
