#pragma once

#include "Styled.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <Pod.h>
#include <Space.h>
#include <TextMeasurer.h>
#include <string>
#include <utility>
#include <vector>

namespace tessel {

struct TextState
{
    TextMetrics metrics;
    FontAttributes font;
};

/* Text

   a run of text, wrapped to the width it is offered. styled as element
   text with text.font-size, text.font-family and text.color.
*/

class Text
{
public:
    using State = TextState;

    Text(std::string text);

    Text classes(std::vector<std::string> classes) &&;
    Text color(Styled<Color> color) &&;
    Text fontSize(Styled<float> size) &&;

    const std::string& text() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Text& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    StyleSelector selector() const;

private:
    std::string mText;
    std::vector<std::string> mClasses;
    Styled<Color> mColor;
    Styled<float> mFontSize;
};

inline Text::Text(std::string text)
    : mText(std::move(text))
{
}

inline Text Text::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

inline Text Text::color(Styled<Color> color) &&
{
    mColor = std::move(color);
    return std::move(*this);
}

inline Text Text::fontSize(Styled<float> size) &&
{
    mFontSize = std::move(size);
    return std::move(*this);
}

inline const std::string& Text::text() const
{
    return mText;
}

inline StyleSelector Text::selector() const
{
    return { "text", mClasses, {} };
}

template<typename T>
Text::State Text::build(BuildCx&, T&)
{
    return {};
}

template<typename T>
void Text::rebuild(State&, RebuildCx& cx, T&, const Text& old)
{
    if (mText != old.mText || mClasses != old.mClasses || mFontSize != old.mFontSize) {
        cx.requestLayout();
    } else if (mColor != old.mColor) {
        cx.requestDraw();
    }
}

template<typename T>
void Text::event(State&, EventCx&, T&, const Event&)
{
}

template<typename T>
Size Text::layout(State& state, LayoutCx& cx, T&, const Space& space)
{
    SelectorScope scope(cx, selector());
    state.font.size = mFontSize.resolve(cx, "text.font-size", FontAttributes().size);
    state.font.family = cx.styleOr<std::string>("text.font-family", FontAttributes().family);
    state.metrics = cx.measurer().measure(mText, state.font, space.max.width);
    return space.fit(state.metrics.size);
}

template<typename T>
void Text::draw(State& state, DrawCx& cx, T&, Canvas& canvas)
{
    SelectorScope scope(cx, selector());
    const Color color = mColor.resolve(cx, "text.color", Color::black());
    for (const auto& line : state.metrics.lines) {
        // baselines are measured from the top of the text
        canvas.text(mText.substr(line.start, line.length), { 0.f, line.baseline }, state.font, color);
    }
}

} // namespace tessel
