#pragma once

#include "Pod.h"
#include <Logger.h>
#include <memory>
#include <utility>

namespace tessel {

/* AnyView

   type erasure for views. a BoxedView<T> hides the concrete view type
   behind a virtual interface so views of different types can share a
   std::vector. the state is erased the same way and recovered with a
   dynamic_cast, a failed cast is logged and the pass carries on.
*/

struct AnyState
{
    virtual ~AnyState() = default;
};

template<typename S>
struct AnyStateOf : public AnyState
{
    AnyStateOf(S&& s)
        : state(std::move(s))
    {
    }

    S state;
};

template<typename T>
class AnyView
{
public:
    virtual ~AnyView() = default;

    virtual std::unique_ptr<AnyState> build(BuildCx& cx, T& data) = 0;
    // may replace state when old is a different kind of view
    virtual void rebuild(std::unique_ptr<AnyState>& state, RebuildCx& cx, T& data, const AnyView& old) = 0;
    virtual void event(AnyState& state, EventCx& cx, T& data, const Event& event) = 0;
    virtual Size layout(AnyState& state, LayoutCx& cx, T& data, const Space& space) = 0;
    virtual void draw(AnyState& state, DrawCx& cx, T& data, Canvas& canvas) = 0;
};

template<typename T, typename V>
class AnyViewImpl : public AnyView<T>
{
public:
    using ViewState_t = typename V::State;

    AnyViewImpl(V view);

    std::unique_ptr<AnyState> build(BuildCx& cx, T& data) override;
    void rebuild(std::unique_ptr<AnyState>& state, RebuildCx& cx, T& data, const AnyView<T>& old) override;
    void event(AnyState& state, EventCx& cx, T& data, const Event& event) override;
    Size layout(AnyState& state, LayoutCx& cx, T& data, const Space& space) override;
    void draw(AnyState& state, DrawCx& cx, T& data, Canvas& canvas) override;

private:
    AnyStateOf<ViewState_t>* downcast(AnyState& state, const char* pass) const;

private:
    V mView;
};

template<typename T, typename V>
inline AnyViewImpl<T, V>::AnyViewImpl(V view)
    : mView(std::move(view))
{
}

template<typename T, typename V>
std::unique_ptr<AnyState> AnyViewImpl<T, V>::build(BuildCx& cx, T& data)
{
    return std::make_unique<AnyStateOf<ViewState_t>>(mView.build(cx, data));
}

template<typename T, typename V>
void AnyViewImpl<T, V>::rebuild(std::unique_ptr<AnyState>& state, RebuildCx& cx, T& data, const AnyView<T>& old)
{
    const auto* prev = dynamic_cast<const AnyViewImpl*>(&old);
    auto* typed = state ? dynamic_cast<AnyStateOf<ViewState_t>*>(state.get()) : nullptr;
    if (prev == nullptr || typed == nullptr) {
        // a different kind of view took this slot, start over with fresh state
        spdlog::debug("view {} changed type, rebuilding its state", cx.id());
        cx.viewState() = ViewState();
        BuildCx buildCx(cx, cx.viewState(), cx.transform());
        state = build(buildCx, data);
        cx.requestLayout();
        return;
    }
    mView.rebuild(typed->state, cx, data, prev->mView);
}

template<typename T, typename V>
void AnyViewImpl<T, V>::event(AnyState& state, EventCx& cx, T& data, const Event& event)
{
    if (auto* typed = downcast(state, "event")) {
        mView.event(typed->state, cx, data, event);
    }
}

template<typename T, typename V>
Size AnyViewImpl<T, V>::layout(AnyState& state, LayoutCx& cx, T& data, const Space& space)
{
    if (auto* typed = downcast(state, "layout")) {
        return mView.layout(typed->state, cx, data, space);
    }
    return space.min;
}

template<typename T, typename V>
void AnyViewImpl<T, V>::draw(AnyState& state, DrawCx& cx, T& data, Canvas& canvas)
{
    if (auto* typed = downcast(state, "draw")) {
        mView.draw(typed->state, cx, data, canvas);
    }
}

template<typename T, typename V>
AnyStateOf<typename V::State>* AnyViewImpl<T, V>::downcast(AnyState& state, const char* pass) const
{
    auto* typed = dynamic_cast<AnyStateOf<ViewState_t>*>(&state);
    if (typed == nullptr) {
        spdlog::warn("state type mismatch in {} pass, skipping view", pass);
    }
    return typed;
}

template<typename T>
class BoxedView
{
public:
    using State = std::unique_ptr<AnyState>;

    BoxedView(std::unique_ptr<AnyView<T>> view);

    State build(BuildCx& cx, T& data);
    void rebuild(State& state, RebuildCx& cx, T& data, const BoxedView& old);
    void event(State& state, EventCx& cx, T& data, const Event& event);
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    std::unique_ptr<AnyView<T>> mView;
};

template<typename T>
inline BoxedView<T>::BoxedView(std::unique_ptr<AnyView<T>> view)
    : mView(std::move(view))
{
}

template<typename T>
inline typename BoxedView<T>::State BoxedView<T>::build(BuildCx& cx, T& data)
{
    return mView->build(cx, data);
}

template<typename T>
inline void BoxedView<T>::rebuild(State& state, RebuildCx& cx, T& data, const BoxedView& old)
{
    mView->rebuild(state, cx, data, *old.mView);
}

template<typename T>
inline void BoxedView<T>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    if (state) {
        mView->event(*state, cx, data, event);
    }
}

template<typename T>
inline Size BoxedView<T>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    if (!state) {
        return space.min;
    }
    return mView->layout(*state, cx, data, space);
}

template<typename T>
inline void BoxedView<T>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    if (state) {
        mView->draw(*state, cx, data, canvas);
    }
}

template<typename T, typename V>
BoxedView<T> boxed(V view)
{
    return BoxedView<T>(std::make_unique<AnyViewImpl<T, V>>(std::move(view)));
}

} // namespace tessel
