#include "Contexts.h"

using namespace tessel;

BaseCx::BaseCx(const Stylesheet& stylesheet, StyleCache& cache, WindowState& window,
               const TextMeasurer& measurer, StyleSelectors& selectors)
    : mStylesheet(&stylesheet), mCache(&cache), mWindow(&window), mMeasurer(&measurer), mSelectors(&selectors)
{
}

std::optional<StyleMatch> BaseCx::resolve(const std::string& key, const StyleAttributes* inlineAttributes) const
{
    return resolveStyle(*mStylesheet, *mCache, *mSelectors, key, inlineAttributes);
}

ViewCx::ViewCx(const BaseCx& base, ViewState& state, const Affine& transform)
    : BaseCx(base), mViewState(&state), mTransform(transform)
{
}

void ViewCx::setActive(bool active)
{
    if (mViewState->isActive() != active) {
        mViewState->setActive(active);
        mViewState->requestDraw();
    }
}

void ViewCx::setFocusable(bool focusable)
{
    mViewState->setFocusable(focusable);
}

void ViewCx::focus()
{
    if (!mViewState->isFocusable()) {
        spdlog::warn("focus requested by {} which is not focusable", mViewState->id());
        return;
    }
    mWindow->setFocused(mViewState->id());
    mViewState->setFocused(true);
    mViewState->requestDraw();
}

void ViewCx::setCursor(std::optional<Cursor> cursor)
{
    mViewState->setCursor(cursor);
}

BuildCx BuildCx::child(ViewState& state) const
{
    BuildCx cx = *this;
    cx.mViewState = &state;
    return cx;
}

RebuildCx RebuildCx::child(ViewState& state) const
{
    RebuildCx cx = *this;
    cx.mViewState = &state;
    return cx;
}

EventCx EventCx::child(ViewState& state) const
{
    EventCx cx = *this;
    cx.mViewState = &state;
    cx.mTransform = mTransform * state.transform();
    return cx;
}

LayoutCx LayoutCx::child(ViewState& state) const
{
    LayoutCx cx = *this;
    cx.mViewState = &state;
    return cx;
}

DrawCx DrawCx::child(ViewState& state) const
{
    DrawCx cx = *this;
    cx.mViewState = &state;
    cx.mTransform = mTransform * state.transform();
    return cx;
}

SelectorScope::SelectorScope(const BaseCx& cx, StyleSelector selector)
    : mSelectors(cx.selectors())
{
    mSelectors.push(std::move(selector));
}

SelectorScope::~SelectorScope()
{
    mSelectors.pop();
}
