#pragma once

#include "Styled.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <Padding.h>
#include <Pod.h>
#include <Space.h>
#include <string>
#include <utility>
#include <vector>

namespace tessel {

/* Container

   a box around a single child, styled as element container with the
   classes given. reads container.padding, container.background,
   container.border-color, container.border-width and container.radius.
   container.overflow: hidden clips the child to the container's rect.
*/

template<typename V>
class Container
{
public:
    using State = typename Pod<V>::State;

    Container(V view);

    Container classes(std::vector<std::string> classes) &&;
    Container background(Styled<Color> color) &&;
    Container padding(Styled<Padding> padding) &&;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Container& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    StyleSelector selector() const;

private:
    Pod<V> mContent;
    std::vector<std::string> mClasses;
    Styled<Color> mBackground;
    Styled<Padding> mPadding;
};

template<typename V>
inline Container<V>::Container(V view)
    : mContent(std::move(view))
{
}

template<typename V>
inline Container<V> Container<V>::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

template<typename V>
inline Container<V> Container<V>::background(Styled<Color> color) &&
{
    mBackground = std::move(color);
    return std::move(*this);
}

template<typename V>
inline Container<V> Container<V>::padding(Styled<Padding> padding) &&
{
    mPadding = std::move(padding);
    return std::move(*this);
}

template<typename V>
inline StyleSelector Container<V>::selector() const
{
    return { "container", mClasses, {} };
}

template<typename V>
template<typename T>
typename Container<V>::State Container<V>::build(BuildCx& cx, T& data)
{
    SelectorScope scope(cx, selector());
    return mContent.build(cx, data);
}

template<typename V>
template<typename T>
void Container<V>::rebuild(State& state, RebuildCx& cx, T& data, const Container& old)
{
    if (mClasses != old.mClasses || mPadding != old.mPadding) {
        cx.requestLayout();
    } else if (mBackground != old.mBackground) {
        cx.requestDraw();
    }
    SelectorScope scope(cx, selector());
    mContent.rebuild(state, cx, data, old.mContent);
}

template<typename V>
template<typename T>
void Container<V>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    SelectorScope scope(cx, selector());
    mContent.event(state, cx, data, event);
}

template<typename V>
template<typename T>
Size Container<V>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    SelectorScope scope(cx, selector());
    const Padding padding = mPadding.resolve(cx, "container.padding", Padding {});
    const float border = cx.styleOr<float>("container.border-width", 0.f);
    const Size inset = { padding.left + padding.right + border * 2.f, padding.top + padding.bottom + border * 2.f };

    const Size content = mContent.layout(state, cx, data, space.shrink(inset));
    Pod<V>::translate(state, { padding.left + border, padding.top + border });
    return space.fit({ content.width + inset.width, content.height + inset.height });
}

template<typename V>
template<typename T>
void Container<V>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    SelectorScope scope(cx, selector());
    const Color background = mBackground.resolve(cx, "container.background", Color::transparent());
    const float radius = cx.styleOr<float>("container.radius", 0.f);
    const float border = cx.styleOr<float>("container.border-width", 0.f);

    if (background.a > 0.f) {
        canvas.fillRect(cx.rect(), background, radius);
    }
    if (border > 0.f) {
        const Color borderColor = cx.styleOr<Color>("container.border-color", Color::black());
        canvas.strokeRect(cx.rect(), borderColor, border, radius);
    }

    if (cx.styleOr<std::string>("container.overflow", "visible") == "hidden") {
        canvas.save();
        canvas.clip(cx.rect());
        mContent.draw(state, cx, data, canvas);
        canvas.restore();
    } else {
        mContent.draw(state, cx, data, canvas);
    }
}

template<typename V>
Container<V> container(V view)
{
    return Container<V>(std::move(view));
}

} // namespace tessel
