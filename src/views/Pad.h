#pragma once

#include "Styled.h"
#include <Contexts.h>
#include <Event.h>
#include <Padding.h>
#include <Pod.h>
#include <Space.h>
#include <utility>

namespace tessel {

// insets its content, pad.padding when no inline padding is given
template<typename V>
class Pad
{
public:
    using State = typename Pod<V>::State;

    Pad(Styled<Padding> padding, V view);

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Pad& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    Styled<Padding> mPadding;
    Pod<V> mContent;
};

template<typename V>
inline Pad<V>::Pad(Styled<Padding> padding, V view)
    : mPadding(std::move(padding)), mContent(std::move(view))
{
}

template<typename V>
template<typename T>
typename Pad<V>::State Pad<V>::build(BuildCx& cx, T& data)
{
    return mContent.build(cx, data);
}

template<typename V>
template<typename T>
void Pad<V>::rebuild(State& state, RebuildCx& cx, T& data, const Pad& old)
{
    if (mPadding != old.mPadding) {
        cx.requestLayout();
    }
    mContent.rebuild(state, cx, data, old.mContent);
}

template<typename V>
template<typename T>
void Pad<V>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    mContent.event(state, cx, data, event);
}

template<typename V>
template<typename T>
Size Pad<V>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    const Padding padding = mPadding.resolve(cx, "pad.padding", Padding {});
    const Size inset = padding.size();
    const Size content = mContent.layout(state, cx, data, space.shrink(inset));
    Pod<V>::translate(state, padding.offset());
    return space.fit({ content.width + inset.width, content.height + inset.height });
}

template<typename V>
template<typename T>
void Pad<V>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    mContent.draw(state, cx, data, canvas);
}

template<typename V>
Pad<V> pad(Styled<Padding> padding, V view)
{
    return Pad<V>(std::move(padding), std::move(view));
}

} // namespace tessel
