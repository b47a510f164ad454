#pragma once

#include "Pod.h"
#include <algorithm>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace tessel {

/* ViewSeq

   the per index operations of a sequence of views, without any ViewState
   handling. specialized for std::tuple<Vs...> and std::vector<V>, a vector
   of BoxedView<T> covers sequences of mixed types.

   using State;
   size(seq)
   build(viewStates, cx, data, seq) -> State
   resize(state, viewStates, cx, data, seq)
   rebuildNth / eventNth / layoutNth / drawNth(n, state, cx, data, seq, ...)
*/

template<typename Seq>
struct ViewSeq;

template<typename... Vs>
struct ViewSeq<std::tuple<Vs...>>
{
    using Seq = std::tuple<Vs...>;
    using State = std::tuple<typename Vs::State...>;

    static constexpr std::size_t size(const Seq&)
    {
        return sizeof...(Vs);
    }

    template<typename T>
    static State build(std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq)
    {
        return buildAll(viewStates, cx, data, seq, std::index_sequence_for<Vs...> {});
    }

    // a tuple never changes length
    template<typename T>
    static void resize(State&, std::vector<ViewState>&, BuildCx&, T&, Seq&)
    {
    }

    template<typename T>
    static void rebuildNth(std::size_t n, State& state, RebuildCx& cx, T& data, Seq& seq, const Seq& old)
    {
        visit(n, [&](auto index) {
            constexpr std::size_t I = decltype(index)::value;
            std::get<I>(seq).rebuild(std::get<I>(state), cx, data, std::get<I>(old));
        });
    }

    template<typename T>
    static void eventNth(std::size_t n, State& state, EventCx& cx, T& data, Seq& seq, const Event& event)
    {
        visit(n, [&](auto index) {
            constexpr std::size_t I = decltype(index)::value;
            std::get<I>(seq).event(std::get<I>(state), cx, data, event);
        });
    }

    template<typename T>
    static Size layoutNth(std::size_t n, State& state, LayoutCx& cx, T& data, Seq& seq, const Space& space)
    {
        Size size = { 0.f, 0.f };
        visit(n, [&](auto index) {
            constexpr std::size_t I = decltype(index)::value;
            size = std::get<I>(seq).layout(std::get<I>(state), cx, data, space);
        });
        return size;
    }

    template<typename T>
    static void drawNth(std::size_t n, State& state, DrawCx& cx, T& data, Seq& seq, Canvas& canvas)
    {
        visit(n, [&](auto index) {
            constexpr std::size_t I = decltype(index)::value;
            std::get<I>(seq).draw(std::get<I>(state), cx, data, canvas);
        });
    }

private:
    template<typename T, std::size_t... Is>
    static State buildAll(std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq, std::index_sequence<Is...>)
    {
        viewStates.reserve(sizeof...(Vs));
        // braced init evaluates left to right, viewStates ends up in index order
        return State { buildOne<Is>(viewStates, cx, data, seq)... };
    }

    template<std::size_t I, typename T>
    static auto buildOne(std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq)
    {
        auto built = PodPass::build(cx, [&](BuildCx& child) {
            return std::get<I>(seq).build(child, data);
        });
        viewStates.push_back(std::move(built.first));
        return std::move(built.second);
    }

    template<std::size_t I = 0, typename F>
    static void visit(std::size_t n, F&& f)
    {
        if constexpr (I < sizeof...(Vs)) {
            if (n == I) {
                f(std::integral_constant<std::size_t, I> {});
            } else {
                visit<I + 1>(n, std::forward<F>(f));
            }
        }
    }
};

template<typename V>
struct ViewSeq<std::vector<V>>
{
    using Seq = std::vector<V>;
    using State = std::vector<typename V::State>;

    static std::size_t size(const Seq& seq)
    {
        return seq.size();
    }

    template<typename T>
    static State build(std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq)
    {
        State state;
        state.reserve(seq.size());
        viewStates.reserve(seq.size());
        for (std::size_t n = 0; n < seq.size(); ++n) {
            buildOne(n, state, viewStates, cx, data, seq);
        }
        return state;
    }

    // drop states past the end, build the ones that are new
    template<typename T>
    static void resize(State& state, std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq)
    {
        while (state.size() > seq.size()) {
            state.pop_back();
            viewStates.pop_back();
        }
        for (std::size_t n = state.size(); n < seq.size(); ++n) {
            buildOne(n, state, viewStates, cx, data, seq);
        }
    }

    template<typename T>
    static void rebuildNth(std::size_t n, State& state, RebuildCx& cx, T& data, Seq& seq, const Seq& old)
    {
        seq[n].rebuild(state[n], cx, data, old[n]);
    }

    template<typename T>
    static void eventNth(std::size_t n, State& state, EventCx& cx, T& data, Seq& seq, const Event& event)
    {
        seq[n].event(state[n], cx, data, event);
    }

    template<typename T>
    static Size layoutNth(std::size_t n, State& state, LayoutCx& cx, T& data, Seq& seq, const Space& space)
    {
        return seq[n].layout(state[n], cx, data, space);
    }

    template<typename T>
    static void drawNth(std::size_t n, State& state, DrawCx& cx, T& data, Seq& seq, Canvas& canvas)
    {
        seq[n].draw(state[n], cx, data, canvas);
    }

private:
    template<typename T>
    static void buildOne(std::size_t n, State& state, std::vector<ViewState>& viewStates, BuildCx& cx, T& data, Seq& seq)
    {
        auto built = PodPass::build(cx, [&](BuildCx& child) {
            return seq[n].build(child, data);
        });
        viewStates.push_back(std::move(built.first));
        state.push_back(std::move(built.second));
    }
};

template<typename Seq>
struct SeqState
{
    std::vector<ViewState> viewStates;
    typename ViewSeq<Seq>::State content;
};

/* PodSeq

   a sequence of views where every index has its own ViewState. children
   are matched by index between rebuilds, there are no keys, so reordering
   children moves their hover, focus and transition state along with the
   index and not with the view.
*/

template<typename Seq>
class PodSeq
{
public:
    using Traits = ViewSeq<Seq>;
    using State = SeqState<Seq>;

    PodSeq(Seq seq);

    std::size_t size() const;
    Seq& sequence();
    const Seq& sequence() const;

    template<typename T>
    State build(BuildCx& cx, T& data);
    // resizes to the new length, then rebuilds every index both have
    template<typename T>
    void rebuild(State& state, RebuildCx& cx, T& data, const PodSeq& old);

    template<typename T>
    void rebuildNth(std::size_t n, State& state, RebuildCx& cx, T& data, const PodSeq& old);
    template<typename T>
    void eventNth(std::size_t n, State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    Size layoutNth(std::size_t n, State& state, LayoutCx& cx, T& data, const Space& space);
    template<typename T>
    void drawNth(std::size_t n, State& state, DrawCx& cx, T& data, Canvas& canvas);

    template<typename T>
    void event(State& state, EventCx& cx, T& data, const Event& event);
    template<typename T>
    void draw(State& state, DrawCx& cx, T& data, Canvas& canvas);

    void translateNth(std::size_t n, State& state, const Point& offset) const;
    float flexNth(std::size_t n, const State& state) const;
    bool tightNth(std::size_t n, const State& state) const;

private:
    Seq mSeq;
};

template<typename Seq>
inline PodSeq<Seq>::PodSeq(Seq seq)
    : mSeq(std::move(seq))
{
}

template<typename Seq>
inline std::size_t PodSeq<Seq>::size() const
{
    return Traits::size(mSeq);
}

template<typename Seq>
inline Seq& PodSeq<Seq>::sequence()
{
    return mSeq;
}

template<typename Seq>
inline const Seq& PodSeq<Seq>::sequence() const
{
    return mSeq;
}

template<typename Seq>
template<typename T>
typename PodSeq<Seq>::State PodSeq<Seq>::build(BuildCx& cx, T& data)
{
    std::vector<ViewState> viewStates;
    auto content = Traits::build(viewStates, cx, data, mSeq);
    return State { std::move(viewStates), std::move(content) };
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::rebuild(State& state, RebuildCx& cx, T& data, const PodSeq& old)
{
    if (size() != old.size()) {
        BuildCx buildCx(cx, cx.viewState(), cx.transform());
        Traits::resize(state.content, state.viewStates, buildCx, data, mSeq);
        cx.requestLayout();
    }
    const std::size_t common = std::min(size(), old.size());
    for (std::size_t n = 0; n < common; ++n) {
        rebuildNth(n, state, cx, data, old);
    }
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::rebuildNth(std::size_t n, State& state, RebuildCx& cx, T& data, const PodSeq& old)
{
    if (n >= size() || n >= old.size()) {
        return;
    }
    PodPass::rebuild(state.viewStates[n], cx, [&](RebuildCx& child) {
        Traits::rebuildNth(n, state.content, child, data, mSeq, old.mSeq);
    });
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::eventNth(std::size_t n, State& state, EventCx& cx, T& data, const Event& event)
{
    if (n >= size()) {
        return;
    }
    PodPass::event(state.viewStates[n], cx, event, [&](EventCx& child) {
        Traits::eventNth(n, state.content, child, data, mSeq, event);
    });
}

template<typename Seq>
template<typename T>
Size PodSeq<Seq>::layoutNth(std::size_t n, State& state, LayoutCx& cx, T& data, const Space& space)
{
    if (n >= size()) {
        return { 0.f, 0.f };
    }
    return PodPass::layout(state.viewStates[n], cx, [&](LayoutCx& child) {
        return Traits::layoutNth(n, state.content, child, data, mSeq, space);
    });
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::drawNth(std::size_t n, State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    if (n >= size()) {
        return;
    }
    PodPass::draw(state.viewStates[n], cx, canvas, [&](DrawCx& child) {
        Traits::drawNth(n, state.content, child, data, mSeq, canvas);
    });
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::event(State& state, EventCx& cx, T& data, const Event& event)
{
    for (std::size_t n = 0; n < size(); ++n) {
        eventNth(n, state, cx, data, event);
    }
}

template<typename Seq>
template<typename T>
void PodSeq<Seq>::draw(State& state, DrawCx& cx, T& data, Canvas& canvas)
{
    for (std::size_t n = 0; n < size(); ++n) {
        drawNth(n, state, cx, data, canvas);
    }
}

template<typename Seq>
inline void PodSeq<Seq>::translateNth(std::size_t n, State& state, const Point& offset) const
{
    if (n < state.viewStates.size()) {
        state.viewStates[n].translate(offset);
    }
}

template<typename Seq>
inline float PodSeq<Seq>::flexNth(std::size_t n, const State& state) const
{
    return n < state.viewStates.size() ? state.viewStates[n].flex() : 0.f;
}

template<typename Seq>
inline bool PodSeq<Seq>::tightNth(std::size_t n, const State& state) const
{
    return n < state.viewStates.size() && state.viewStates[n].isTight();
}

} // namespace tessel
