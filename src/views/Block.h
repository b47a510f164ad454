#pragma once

#include "Styled.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <Pod.h>
#include <Space.h>
#include <string>
#include <utility>
#include <vector>

namespace tessel {

/* Block

   a filled rectangle with a preferred size, the simplest leaf there is.
   styled as element block with block.color and block.radius.
*/

class Block
{
public:
    using State = EmptyState;

    Block(const Size& size, Styled<Color> color = {});

    Block classes(std::vector<std::string> classes) &&;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Block& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    StyleSelector selector() const;

private:
    Size mSize;
    Styled<Color> mColor;
    std::vector<std::string> mClasses;
};

inline Block::Block(const Size& size, Styled<Color> color)
    : mSize(size), mColor(std::move(color))
{
}

inline Block Block::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

inline StyleSelector Block::selector() const
{
    return { "block", mClasses, {} };
}

template<typename T>
Block::State Block::build(BuildCx&, T&)
{
    return {};
}

template<typename T>
void Block::rebuild(State&, RebuildCx& cx, T&, const Block& old)
{
    if (mSize != old.mSize || mClasses != old.mClasses) {
        cx.requestLayout();
    } else if (mColor != old.mColor) {
        cx.requestDraw();
    }
}

template<typename T>
void Block::event(State&, EventCx&, T&, const Event&)
{
}

template<typename T>
Size Block::layout(State&, LayoutCx&, T&, const Space& space)
{
    return space.fit(mSize);
}

template<typename T>
void Block::draw(State&, DrawCx& cx, T&, Canvas& canvas)
{
    SelectorScope scope(cx, selector());
    const Color color = mColor.resolve(cx, "block.color", Color::rgba(0.5f, 0.5f, 0.5f));
    const float radius = cx.styleOr<float>("block.radius", 0.f);
    canvas.fillRect(cx.rect(), color, radius);
}

} // namespace tessel
