#pragma once

#include "Styled.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <Sequence.h>
#include <Space.h>
#include <WrapLayout.h>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace tessel {

/* Wrap

   lays out a sequence of views in runs along its axis, starting a new run
   when the next child doesn't fit. styled as element wrap, reads
   wrap.row-gap, wrap.column-gap, wrap.justify, wrap.align and
   wrap.justify-cross unless set inline. flex weights are ignored.
*/

template<typename Seq>
class Wrap
{
public:
    using State = typename PodSeq<Seq>::State;

    Wrap(Axis axis, Seq seq);

    Wrap classes(std::vector<std::string> classes) &&;
    Wrap rowGap(Styled<float> gap) &&;
    Wrap columnGap(Styled<float> gap) &&;
    Wrap justify(Styled<Justify> justify) &&;
    Wrap align(Styled<Align> align) &&;
    Wrap justifyCross(Styled<Justify> justify) &&;

    Axis axis() const;
    std::size_t size() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const Wrap& old);
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
    Styled<float> mRowGap;
    Styled<float> mColumnGap;
    Styled<Justify> mJustify;
    Styled<Align> mAlign;
    Styled<Justify> mJustifyCross;
};

template<typename Seq>
inline Wrap<Seq>::Wrap(Axis axis, Seq seq)
    : mAxis(axis), mSeq(std::move(seq))
{
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::classes(std::vector<std::string> classes) &&
{
    mClasses = std::move(classes);
    return std::move(*this);
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::rowGap(Styled<float> gap) &&
{
    mRowGap = std::move(gap);
    return std::move(*this);
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::columnGap(Styled<float> gap) &&
{
    mColumnGap = std::move(gap);
    return std::move(*this);
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::justify(Styled<Justify> justify) &&
{
    mJustify = std::move(justify);
    return std::move(*this);
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::align(Styled<Align> align) &&
{
    mAlign = std::move(align);
    return std::move(*this);
}

template<typename Seq>
inline Wrap<Seq> Wrap<Seq>::justifyCross(Styled<Justify> justify) &&
{
    mJustifyCross = std::move(justify);
    return std::move(*this);
}

template<typename Seq>
inline Axis Wrap<Seq>::axis() const
{
    return mAxis;
}

template<typename Seq>
inline std::size_t Wrap<Seq>::size() const
{
    return mSeq.size();
}

template<typename Seq>
inline StyleSelector Wrap<Seq>::selector() const
{
    return { "wrap", mClasses, {} };
}

template<typename Seq>
template<typename T>
typename Wrap<Seq>::State Wrap<Seq>::build(BuildCx& cx, T& data)
{
    SelectorScope scope(cx, selector());
    return mSeq.build(cx, data);
}

template<typename Seq>
template<typename T>
void Wrap<Seq>::rebuild(State& state, RebuildCx& cx, T& data, const Wrap& old)
{
    if (mAxis != old.mAxis || mClasses != old.mClasses || mRowGap != old.mRowGap || mColumnGap != old.mColumnGap
        || mJustify != old.mJustify || mAlign != old.mAlign || mJustifyCross != old.mJustifyCross) {
        cx.requestLayout();
    }
    SelectorScope scope(cx, selector());
    mSeq.rebuild(state, cx, data, old.mSeq);
}

template<typename Seq>
template<typename T>
void Wrap<Seq>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    SelectorScope scope(cx, selector());
    mSeq.event(state, cx, data, event);
}

template<typename Seq>
template<typename T>
Size Wrap<Seq>::layout(State& state, LayoutCx& cx, T& data, const Space& space)
{
    SelectorScope scope(cx, selector());

    WrapLayout wrap;
    wrap.axis = mAxis;
    wrap.rowGap = mRowGap.resolve(cx, "wrap.row-gap", 0.f);
    wrap.columnGap = mColumnGap.resolve(cx, "wrap.column-gap", 0.f);
    wrap.justify = mJustify.resolve(cx, "wrap.justify", Justify::Start);
    wrap.align = mAlign.resolve(cx, "wrap.align", Align::Center);
    wrap.justifyCross = mJustifyCross.resolve(cx, "wrap.justify-cross", Justify::Start);

    const std::size_t count = mSeq.size();
    std::vector<Point> offsets;
    const Size size = wrap.layout(space, count, [&](std::size_t n, const Space& childSpace) {
        return mSeq.layoutNth(n, state, cx, data, childSpace);
    }, offsets);

    for (std::size_t n = 0; n < count && n < offsets.size(); ++n) {
        mSeq.translateNth(n, state, offsets[n]);
    }
    return size;
}

template<typename Seq>
template<typename T>
void Wrap<Seq>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    SelectorScope scope(cx, selector());
    mSeq.draw(state, cx, data, canvas);
}

template<typename Seq>
Wrap<Seq> hwrap(Seq seq)
{
    return Wrap<Seq>(Axis::Horizontal, std::move(seq));
}

template<typename Seq>
Wrap<Seq> vwrap(Seq seq)
{
    return Wrap<Seq>(Axis::Vertical, std::move(seq));
}

} // namespace tessel
