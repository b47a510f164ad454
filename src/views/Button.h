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

template<typename S>
struct ButtonState
{
    PodState<S> content;
    bool hovered = false;
};

/* Button

   clickable box around a single child. styled as element button with the
   hover, active and focus states while they apply, the states are visible
   to the button's own style lookups and to everything inside it.

   onClick is called with the app data when the primary button is released
   over a button it was pressed on, or when enter or space is released while
   the button has focus.
*/

template<typename V, typename F>
class Button
{
public:
    using State = ButtonState<typename V::State>;

    Button(V view, F onClick);

    Button classes(std::vector<std::string> classes) &&;
    Button background(Styled<Color> color) &&;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Button& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    StyleSelector selector(bool hovered, const ViewCx& cx) const;

private:
    Pod<V> mContent;
    F mOnClick;
    std::vector<std::string> mClasses;
    Styled<Color> mBackground;
};

template<typename V, typename F>
inline Button<V, F>::Button(V view, F onClick)
    : mContent(std::move(view)), mOnClick(std::move(onClick))
{
}

template<typename V, typename F>
inline Button<V, F> Button<V, F>::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

template<typename V, typename F>
inline Button<V, F> Button<V, F>::background(Styled<Color> color) &&
{
    mBackground = std::move(color);
    return std::move(*this);
}

template<typename V, typename F>
StyleSelector Button<V, F>::selector(bool hovered, const ViewCx& cx) const
{
    StyleSelector selector = { "button", mClasses, {} };
    if (hovered) {
        selector.states.push_back("hover");
    }
    if (cx.isActive()) {
        selector.states.push_back("active");
    }
    if (cx.isFocused()) {
        selector.states.push_back("focus");
    }
    return selector;
}

template<typename V, typename F>
template<typename T>
typename Button<V, F>::State Button<V, F>::build(BuildCx& cx, T& data)
{
    cx.setFocusable(true);
    cx.setCursor(Cursor::Pointer);

    SelectorScope scope(cx, selector(false, cx));
    return State { mContent.build(cx, data), false };
}

template<typename V, typename F>
template<typename T>
void Button<V, F>::rebuild(State& state, RebuildCx& cx, T& data, const Button& old)
{
    if (mClasses != old.mClasses) {
        cx.requestLayout();
    } else if (mBackground != old.mBackground) {
        cx.requestDraw();
    }
    SelectorScope scope(cx, selector(state.hovered, cx));
    mContent.rebuild(state.content, cx, data, old.mContent);
}

template<typename V, typename F>
template<typename T>
void Button<V, F>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    {
        SelectorScope scope(cx, selector(state.hovered, cx));
        mContent.event(state.content, cx, data, event);
    }

    // hasHot is only known once the content has propagated into us
    const bool hovered = cx.isHot() || cx.hasHot();
    if (hovered != state.hovered) {
        state.hovered = hovered;
        // the hover state may select different padding
        cx.requestLayout();
    }

    if (const auto* pointer = event.get<PointerEvent>()) {
        if (pointer->button != PointerButton::Primary) {
            return;
        }
        if (pointer->type == PointerEvent::Type::Pressed && hovered && !event.isHandled()) {
            cx.setActive(true);
            cx.focus();
            event.setHandled();
        } else if (pointer->type == PointerEvent::Type::Released && cx.isActive()) {
            cx.setActive(false);
            if (hovered) {
                spdlog::debug("button {} clicked", cx.id());
                mOnClick(data);
                cx.requestLayout();
            }
            event.setHandled();
        } else if (pointer->type == PointerEvent::Type::Left && cx.isActive()) {
            cx.setActive(false);
        }
    } else if (const auto* key = event.get<KeyEvent>()) {
        if (cx.isFocused() && !key->pressed && (key->key == Key::Enter || key->key == Key::Space)) {
            mOnClick(data);
            cx.requestLayout();
            event.setHandled();
        }
    }
}

template<typename V, typename F>
template<typename T>
Size Button<V, F>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    SelectorScope scope(cx, selector(state.hovered, cx));
    const Padding padding = cx.styleOr<Padding>("button.padding", Padding::symmetric(6.f, 12.f));
    const Size inset = padding.size();
    const Size content = mContent.layout(state.content, cx, data, space.shrink(inset));
    Pod<V>::translate(state.content, padding.offset());
    return space.fit({ content.width + inset.width, content.height + inset.height });
}

template<typename V, typename F>
template<typename T>
void Button<V, F>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    SelectorScope scope(cx, selector(state.hovered, cx));
    const Color background = mBackground.resolve(cx, "button.background", Color::rgba(0.85f, 0.85f, 0.85f));
    const float radius = cx.styleOr<float>("button.radius", 4.f);
    canvas.fillRect(cx.rect(), background, radius);

    const float border = cx.styleOr<float>("button.border-width", 0.f);
    if (border > 0.f) {
        canvas.strokeRect(cx.rect(), cx.styleOr<Color>("button.border-color", Color::black()), border, radius);
    }

    mContent.draw(state.content, cx, data, canvas);
}

template<typename V, typename F>
Button<V, F> button(V view, F onClick)
{
    return Button<V, F>(std::move(view), std::move(onClick));
}

} // namespace tessel
