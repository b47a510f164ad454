#pragma once

#include "Contexts.h"
#include "ViewState.h"
#include <Canvas.h>
#include <Event.h>
#include <Space.h>
#include <type_traits>
#include <utility>

namespace tessel {

// state for views that don't need any
struct EmptyState
{
};

/* PodPass

   the per-pass discipline shared by Pod and the sequences. each pass
   prepares the view's own ViewState, zooms the context into it, runs the
   view and finally propagates the result into the parent's ViewState. f is
   handed the child context.
*/

struct PodPass
{
    template<typename F>
    static auto build(BuildCx& cx, F&& f) -> std::pair<ViewState, std::invoke_result_t<F, BuildCx&>>;

    template<typename F>
    static void rebuild(ViewState& state, RebuildCx& cx, F&& f);

    template<typename F>
    static void event(ViewState& state, EventCx& cx, const Event& event, F&& f);

    template<typename F>
    static Size layout(ViewState& state, LayoutCx& cx, F&& f);

    template<typename F>
    static void draw(ViewState& state, DrawCx& cx, Canvas& canvas, F&& f);
};

template<typename F>
auto PodPass::build(BuildCx& cx, F&& f) -> std::pair<ViewState, std::invoke_result_t<F, BuildCx&>>
{
    ViewState state;
    state.prepare();
    BuildCx child = cx.child(state);
    auto content = f(child);
    cx.viewState().propagate(state);
    return { std::move(state), std::move(content) };
}

template<typename F>
void PodPass::rebuild(ViewState& state, RebuildCx& cx, F&& f)
{
    state.prepare();
    RebuildCx child = cx.child(state);
    f(child);
    cx.viewState().propagate(state);
}

template<typename F>
void PodPass::event(ViewState& state, EventCx& cx, const Event& event, F&& f)
{
    if (const auto* animate = event.get<AnimateEvent>()) {
        if (!state.needsAnimate()) {
            cx.viewState().propagate(state);
            return;
        }
        state.markAnimated();
        if (state.transitions().update(animate->delta)) {
            state.requestAnimate();
        }
        // animated style values feed both layout and draw
        state.requestLayout();
    }

    state.setHot(cx.window().isHovered(state.id()));
    state.setFocused(cx.window().isFocused(state.id()));
    state.prepare();

    EventCx child = cx.child(state);
    state.setGlobalTransform(child.transform());
    f(child);

    // children ran first so the deepest hovered view gets its cursor
    if ((state.isHot() || state.hasHot()) && state.cursor().has_value()) {
        cx.window().requestCursor(*state.cursor());
    }
    cx.viewState().propagate(state);
}

template<typename F>
Size PodPass::layout(ViewState& state, LayoutCx& cx, F&& f)
{
    state.prepare();
    state.markLayedOut();
    LayoutCx child = cx.child(state);
    const Size size = f(child);
    state.setSize(size);
    cx.viewState().propagate(state);
    return size;
}

template<typename F>
void PodPass::draw(ViewState& state, DrawCx& cx, Canvas& canvas, F&& f)
{
    state.prepare();
    state.markDrawn();
    DrawCx child = cx.child(state);
    state.setGlobalTransform(child.transform());
    cx.window().addHit(state.id(), state.globalRect());

    canvas.save();
    canvas.transform(state.transform());
    f(child);
    canvas.restore();

    state.transitions().sweep();
    cx.viewState().propagate(state);
}

template<typename S>
struct PodState
{
    ViewState viewState;
    S content;
};

/* Pod

   gives a single child view its own ViewState
*/

template<typename V>
class Pod
{
public:
    using State = PodState<typename V::State>;

    Pod(V view);

    V& view();
    const V& view() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Pod& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

    static void translate(State& state, const Point& offset);

private:
    V mView;
};

template<typename V>
inline Pod<V>::Pod(V view)
    : mView(std::move(view))
{
}

template<typename V>
inline V& Pod<V>::view()
{
    return mView;
}

template<typename V>
inline const V& Pod<V>::view() const
{
    return mView;
}

template<typename V>
template<typename T>
typename Pod<V>::State Pod<V>::build(BuildCx& cx, T& data)
{
    auto [viewState, content] = PodPass::build(cx, [&](BuildCx& child) {
        return mView.build(child, data);
    });
    return State { std::move(viewState), std::move(content) };
}

template<typename V>
template<typename T>
void Pod<V>::rebuild(State& state, RebuildCx& cx, T& data, const Pod& old)
{
    PodPass::rebuild(state.viewState, cx, [&](RebuildCx& child) {
        mView.rebuild(state.content, child, data, old.mView);
    });
}

template<typename V>
template<typename T>
void Pod<V>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    PodPass::event(state.viewState, cx, event, [&](EventCx& child) {
        mView.event(state.content, child, data, event);
    });
}

template<typename V>
template<typename T>
Size Pod<V>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    return PodPass::layout(state.viewState, cx, [&](LayoutCx& child) {
        return mView.layout(state.content, child, data, space);
    });
}

template<typename V>
template<typename T>
void Pod<V>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    PodPass::draw(state.viewState, cx, canvas, [&](DrawCx& child) {
        mView.draw(state.content, child, data, canvas);
    });
}

template<typename V>
inline void Pod<V>::translate(State& state, const Point& offset)
{
    state.viewState.translate(offset);
}

} // namespace tessel
