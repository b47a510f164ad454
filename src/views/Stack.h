#pragma once

#include "Styled.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <Sequence.h>
#include <Space.h>
#include <StackLayout.h>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace tessel {

/* Stack

   lays out a sequence of views in a single line along its axis. styled as
   element stack, reads stack.gap, stack.justify and stack.align unless set
   inline. children wrapped in flex() or expand() share what's left after
   the other children were measured.
*/

template<typename Seq>
class Stack
{
public:
    using State = typename PodSeq<Seq>::State;

    Stack(Axis axis, Seq seq);

    Stack classes(std::vector<std::string> classes) &&;
    Stack gap(Styled<float> gap) &&;
    Stack justify(Styled<Justify> justify) &&;
    Stack align(Styled<Align> align) &&;

    Axis axis() const;
    std::size_t size() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Stack& old);
    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layout(State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

private:
    StyleSelector selector() const;

private:
    Axis mAxis;
    PodSeq<Seq> mSeq;
    std::vector<std::string> mClasses;
    Styled<float> mGap;
    Styled<Justify> mJustify;
    Styled<Align> mAlign;
};

template<typename Seq>
inline Stack<Seq>::Stack(Axis axis, Seq seq)
    : mAxis(axis), mSeq(std::move(seq))
{
}

template<typename Seq>
inline Stack<Seq> Stack<Seq>::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

template<typename Seq>
inline Stack<Seq> Stack<Seq>::gap(Styled<float> gap) &&
{
    mGap = std::move(gap);
    return std::move(*this);
}

template<typename Seq>
inline Stack<Seq> Stack<Seq>::justify(Styled<Justify> justify) &&
{
    mJustify = std::move(justify);
    return std::move(*this);
}

template<typename Seq>
inline Stack<Seq> Stack<Seq>::align(Styled<Align> align) &&
{
    mAlign = std::move(align);
    return std::move(*this);
}

template<typename Seq>
inline Axis Stack<Seq>::axis() const
{
    return mAxis;
}

template<typename Seq>
inline std::size_t Stack<Seq>::size() const
{
    return mSeq.size();
}

template<typename Seq>
inline StyleSelector Stack<Seq>::selector() const
{
    return { "stack", mClasses, {} };
}

template<typename Seq>
template<typename T>
typename Stack<Seq>::State Stack<Seq>::build(BuildCx& cx, T& data)
{
    SelectorScope scope(cx, selector());
    return mSeq.build(cx, data);
}

template<typename Seq>
template<typename T>
void Stack<Seq>::rebuild(State& state, RebuildCx& cx, T& data, const Stack& old)
{
    if (mAxis != old.mAxis || mClasses != old.mClasses || mGap != old.mGap
        || mJustify != old.mJustify || mAlign != old.mAlign) {
        cx.requestLayout();
    }
    SelectorScope scope(cx, selector());
    mSeq.rebuild(state, cx, data, old.mSeq);
}

template<typename Seq>
template<typename T>
void Stack<Seq>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    SelectorScope scope(cx, selector());
    mSeq.event(state, cx, data, event);
}

template<typename Seq>
template<typename T>
Size Stack<Seq>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    SelectorScope scope(cx, selector());

    StackLayout stack;
    stack.axis = mAxis;
    stack.gap = mGap.resolve(cx, "stack.gap", 0.f);
    stack.justify = mJustify.resolve(cx, "stack.justify", Justify::Start);
    stack.align = mAlign.resolve(cx, "stack.align", Align::Start);

    const std::size_t count = mSeq.size();
    std::vector<StackChild> children(count);
    for (std::size_t n = 0; n < count; ++n) {
        children[n] = { mSeq.flexNth(n, state), mSeq.tightNth(n, state) };
    }

    std::vector<Point> offsets;
    const Size size = stack.layout(space, children, [&](std::size_t n, const Space& childSpace) {
        return mSeq.layoutNth(n, state, cx, data, childSpace);
    }, offsets);

    for (std::size_t n = 0; n < count && n < offsets.size(); ++n) {
        mSeq.translateNth(n, state, offsets[n]);
    }
    return size;
}

template<typename Seq>
template<typename T>
void Stack<Seq>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    SelectorScope scope(cx, selector());
    mSeq.draw(state, cx, data, canvas);
}

// seq is a std::tuple of views, a std::vector of views or a std::vector of BoxedView
template<typename Seq>
Stack<Seq> hstack(Seq seq)
{
    return Stack<Seq>(Axis::Horizontal, std::move(seq));
}

template<typename Seq>
Stack<Seq> vstack(Seq seq)
{
    return Stack<Seq>(Axis::Vertical, std::move(seq));
}

} // namespace tessel
