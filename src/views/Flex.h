#pragma once

#include <Contexts.h>
#include <Event.h>
#include <Space.h>
#include <utility>

namespace tessel {

/* Flex

   marks its content as a flex child of the enclosing stack. the weight
   lives in the ViewState of the sequence slot, so Flex has to be the
   direct child of a stack to have any effect. a tight child is forced to
   exactly its share, a loose one may end up smaller.
*/

template<typename V>
class Flex
{
public:
    using State = typename V::State;

    Flex(float flex, bool tight, V view);

    float weight() const;
    bool isTight() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Flex& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    V mView;
    float mFlex;
    bool mTight;
};

template<typename V>
inline Flex<V>::Flex(float flex, bool tight, V view)
    : mView(std::move(view)), mFlex(flex), mTight(tight)
{
}

template<typename V>
inline float Flex<V>::weight() const
{
    return mFlex;
}

template<typename V>
inline bool Flex<V>::isTight() const
{
    return mTight;
}

template<typename V>
template<typename T>
typename Flex<V>::State Flex<V>::build(BuildCx& cx, T& data)
{
    cx.viewState().setFlex(mFlex, mTight);
    return mView.build(cx, data);
}

template<typename V>
template<typename T>
void Flex<V>::rebuild(State& state, RebuildCx& cx, T& data, const Flex& old)
{
    if (mFlex != old.mFlex || mTight != old.mTight) {
        cx.viewState().setFlex(mFlex, mTight);
        cx.requestLayout();
    }
    mView.rebuild(state, cx, data, old.mView);
}

template<typename V>
template<typename T>
void Flex<V>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    mView.event(state, cx, data, event);
}

template<typename V>
template<typename T>
Size Flex<V>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    return mView.layout(state, cx, data, space);
}

template<typename V>
template<typename T>
void Flex<V>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    mView.draw(state, cx, data, canvas);
}

// forced to exactly its share
template<typename V>
Flex<V> flex(float weight, V view)
{
    return Flex<V>(weight, true, std::move(view));
}

// takes at most its share
template<typename V>
Flex<V> expand(float weight, V view)
{
    return Flex<V>(weight, false, std::move(view));
}

} // namespace tessel
