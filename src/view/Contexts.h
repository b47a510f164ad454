#pragma once

#include "ViewState.h"
#include <Logger.h>
#include <Selector.h>
#include <StyleCache.h>
#include <StyleValue.h>
#include <Stylesheet.h>
#include <TextMeasurer.h>
#include <WindowState.h>
#include <initializer_list>
#include <optional>
#include <string>

namespace tessel {

/* Contexts

   every pass gets its own context type. all of them share the stylesheet,
   the style cache, the window and the selector path of the view being
   visited, and point at the ViewState of the view being visited. child()
   zooms into the state of a child, which is how Pod keeps siblings apart.
*/

class BaseCx
{
public:
    BaseCx(const Stylesheet& stylesheet, StyleCache& cache, WindowState& window,
           const TextMeasurer& measurer, StyleSelectors& selectors);

    const Stylesheet& stylesheet() const;
    StyleCache& styleCache() const;
    WindowState& window() const;
    const TextMeasurer& measurer() const;
    StyleSelectors& selectors() const;

    std::optional<StyleMatch> resolve(const std::string& key, const StyleAttributes* inlineAttributes = nullptr) const;

protected:
    const Stylesheet* mStylesheet;
    StyleCache* mCache;
    WindowState* mWindow;
    const TextMeasurer* mMeasurer;
    StyleSelectors* mSelectors;
};

class ViewCx : public BaseCx
{
public:
    ViewCx(const BaseCx& base, ViewState& state, const Affine& transform = {});

    ViewState& viewState() const;
    ViewId id() const;

    bool isHot() const;
    bool hasHot() const;
    bool isFocused() const;
    bool isActive() const;
    void setActive(bool active);
    void setFocusable(bool focusable);
    void focus();
    void setCursor(std::optional<Cursor> cursor);

    Size size() const;
    Rect rect() const;
    // window coordinates of this view's origin
    const Affine& transform() const;

    void requestLayout();
    void requestDraw();
    void requestAnimate();

    // typed style lookup, lengths and colors go through this view's transitions
    template<typename T>
    std::optional<T> style(const std::string& key, const StyleAttributes* inlineAttributes = nullptr);
    template<typename T>
    T styleOr(const std::string& key, const T& fallback, const StyleAttributes* inlineAttributes = nullptr);
    // the most specific of several keys, the earlier key wins a tie
    template<typename T>
    std::optional<T> styleGroup(std::initializer_list<std::string> keys, const StyleAttributes* inlineAttributes = nullptr);

protected:
    template<typename T>
    std::optional<T> convert(const std::string& key, const StyleMatch& match);

protected:
    ViewState* mViewState;
    Affine mTransform;
};

class BuildCx : public ViewCx
{
public:
    using ViewCx::ViewCx;

    BuildCx child(ViewState& state) const;
};

class RebuildCx : public ViewCx
{
public:
    using ViewCx::ViewCx;

    RebuildCx child(ViewState& state) const;
};

class EventCx : public ViewCx
{
public:
    using ViewCx::ViewCx;

    EventCx child(ViewState& state) const;
};

class LayoutCx : public ViewCx
{
public:
    using ViewCx::ViewCx;

    LayoutCx child(ViewState& state) const;
};

class DrawCx : public ViewCx
{
public:
    using ViewCx::ViewCx;

    DrawCx child(ViewState& state) const;
};

// pushes a selector level for the lifetime of the scope
class SelectorScope
{
public:
    SelectorScope(const BaseCx& cx, StyleSelector selector);
    ~SelectorScope();

private:
    SelectorScope(const SelectorScope&) = delete;
    SelectorScope& operator=(const SelectorScope&) = delete;

private:
    StyleSelectors& mSelectors;
};

inline const Stylesheet& BaseCx::stylesheet() const
{
    return *mStylesheet;
}

inline StyleCache& BaseCx::styleCache() const
{
    return *mCache;
}

inline WindowState& BaseCx::window() const
{
    return *mWindow;
}

inline const TextMeasurer& BaseCx::measurer() const
{
    return *mMeasurer;
}

inline StyleSelectors& BaseCx::selectors() const
{
    return *mSelectors;
}

inline ViewState& ViewCx::viewState() const
{
    return *mViewState;
}

inline ViewId ViewCx::id() const
{
    return mViewState->id();
}

inline bool ViewCx::isHot() const
{
    return mViewState->isHot();
}

inline bool ViewCx::hasHot() const
{
    return mViewState->hasHot();
}

inline bool ViewCx::isFocused() const
{
    return mViewState->isFocused();
}

inline bool ViewCx::isActive() const
{
    return mViewState->isActive();
}

inline Size ViewCx::size() const
{
    return mViewState->size();
}

inline Rect ViewCx::rect() const
{
    const Size s = mViewState->size();
    return { 0.f, 0.f, s.width, s.height };
}

inline const Affine& ViewCx::transform() const
{
    return mTransform;
}

inline void ViewCx::requestLayout()
{
    mViewState->requestLayout();
}

inline void ViewCx::requestDraw()
{
    mViewState->requestDraw();
}

inline void ViewCx::requestAnimate()
{
    mViewState->requestAnimate();
}

template<typename T>
std::optional<T> ViewCx::convert(const std::string& key, const StyleMatch& match)
{
    auto value = StyleConvert<T>::convert(match.attribute.value, mWindow->size());
    if (!value.has_value()) {
        spdlog::warn("style {} = {} has the wrong type for this view", key, match.attribute.value);
        return {};
    }
    if constexpr (IsInterpolable<T>::enable) {
        TransitionStates& transitions = mViewState->transitions();
        const T current = transitions.get<T>(key, *value, match.attribute.transition);
        if (transitions.isRunning()) {
            requestAnimate();
        }
        return current;
    } else {
        return value;
    }
}

template<typename T>
std::optional<T> ViewCx::style(const std::string& key, const StyleAttributes* inlineAttributes)
{
    const auto match = resolve(key, inlineAttributes);
    if (!match.has_value()) {
        return {};
    }
    return convert<T>(key, *match);
}

template<typename T>
T ViewCx::styleOr(const std::string& key, const T& fallback, const StyleAttributes* inlineAttributes)
{
    return style<T>(key, inlineAttributes).value_or(fallback);
}

template<typename T>
std::optional<T> ViewCx::styleGroup(std::initializer_list<std::string> keys, const StyleAttributes* inlineAttributes)
{
    std::optional<StyleMatch> best;
    const std::string* bestKey = nullptr;
    for (const auto& key : keys) {
        auto match = resolve(key, inlineAttributes);
        if (match.has_value() && (!best.has_value() || match->specificity > best->specificity)) {
            best = std::move(match);
            bestKey = &key;
        }
    }
    if (!best.has_value()) {
        return {};
    }
    return convert<T>(*bestKey, *best);
}

} // namespace tessel
