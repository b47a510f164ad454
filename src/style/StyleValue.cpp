#include "StyleValue.h"
#include <algorithm>

namespace tessel {

float Length::pixels(const Size& window, float percentBase) const
{
    switch (unit) {
    case LengthUnit::Px:
        return value;
    case LengthUnit::Pt:
        return value * 4.f / 3.f;
    case LengthUnit::Percent:
        return percentBase * value / 100.f;
    case LengthUnit::Vw:
        return window.width * value / 100.f;
    case LengthUnit::Vh:
        return window.height * value / 100.f;
    case LengthUnit::Em:
        return value * EmSize;
    }
    return value;
}

float StyleTransition::progress(float elapsed) const
{
    if (duration <= 0.f) {
        return 1.f;
    }
    const float t = std::clamp(elapsed / duration, 0.f, 1.f);
    return getEasingFunction(ease)(t);
}

static const char* unitName(LengthUnit unit)
{
    switch (unit) {
    case LengthUnit::Px:
        return "px";
    case LengthUnit::Pt:
        return "pt";
    case LengthUnit::Percent:
        return "%";
    case LengthUnit::Vw:
        return "vw";
    case LengthUnit::Vh:
        return "vh";
    case LengthUnit::Em:
        return "em";
    }
    return "";
}

std::string toString(const StyleValue& value)
{
    if (const auto* str = std::get_if<StyleString>(&value)) {
        return fmt::format("\"{}\"", str->value);
    } else if (const auto* e = std::get_if<StyleEnum>(&value)) {
        return e->value;
    } else if (const auto* length = std::get_if<Length>(&value)) {
        return fmt::format("{}{}", length->value, unitName(length->unit));
    }
    const Color& c = std::get<Color>(value);
    return fmt::format("rgba({}, {}, {}, {})", c.r * 255.f, c.g * 255.f, c.b * 255.f, c.a);
}

std::optional<float> StyleConvert<float>::convert(const StyleValue& value, const Size& window)
{
    if (const auto* length = std::get_if<Length>(&value)) {
        return length->pixels(window);
    }
    return {};
}

std::optional<Length> StyleConvert<Length>::convert(const StyleValue& value, const Size&)
{
    if (const auto* length = std::get_if<Length>(&value)) {
        return *length;
    }
    return {};
}

std::optional<Color> StyleConvert<Color>::convert(const StyleValue& value, const Size&)
{
    if (const auto* color = std::get_if<Color>(&value)) {
        return *color;
    }
    return {};
}

std::optional<std::string> StyleConvert<std::string>::convert(const StyleValue& value, const Size&)
{
    if (const auto* str = std::get_if<StyleString>(&value)) {
        return str->value;
    } else if (const auto* e = std::get_if<StyleEnum>(&value)) {
        return e->value;
    }
    return {};
}

std::optional<Padding> StyleConvert<Padding>::convert(const StyleValue& value, const Size& window)
{
    if (const auto* length = std::get_if<Length>(&value)) {
        return Padding::all(length->pixels(window));
    }
    return {};
}

std::optional<Justify> StyleConvert<Justify>::convert(const StyleValue& value, const Size&)
{
    if (const auto* e = std::get_if<StyleEnum>(&value)) {
        return parseJustify(e->value);
    }
    return {};
}

std::optional<Align> StyleConvert<Align>::convert(const StyleValue& value, const Size&)
{
    if (const auto* e = std::get_if<StyleEnum>(&value)) {
        return parseAlign(e->value);
    }
    return {};
}

std::optional<Axis> StyleConvert<Axis>::convert(const StyleValue& value, const Size&)
{
    if (const auto* e = std::get_if<StyleEnum>(&value)) {
        return parseAxis(e->value);
    }
    return {};
}

} // namespace tessel
