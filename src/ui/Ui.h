#pragma once

#include "WindowState.h"
#include <Canvas.h>
#include <Contexts.h>
#include <Event.h>
#include <EventEmitter.h>
#include <Logger.h>
#include <MonospaceMeasurer.h>
#include <Pod.h>
#include <Result.h>
#include <Space.h>
#include <StyleCache.h>
#include <Stylesheet.h>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace tessel {

/* Ui

   owns the app data and the view tree built from it, and drives the
   passes. render() rebuilds the tree from the data, lays it out against
   the window and draws it. input goes through the event pass, hover is
   resolved against the rects of the previous draw.
*/

template<typename T, typename V>
class Ui
{
public:
    using Builder = std::function<V(T&)>;

    Ui(T data, Builder builder, const Size& size,
       std::unique_ptr<TextMeasurer> measurer = std::make_unique<MonospaceMeasurer>());

    T& data();
    const T& data() const;
    WindowState& window();
    const WindowState& window() const;
    const Stylesheet& stylesheet() const;
    StyleCache& styleCache();
    const ViewState& rootState() const;

    void setStylesheet(Stylesheet stylesheet);
    // keeps the current stylesheet if text doesn't parse
    Result<void> loadStylesheet(const std::string& text);
    Result<void> loadStylesheetFile(const std::filesystem::path& path);

    void rebuild();
    void render(Canvas& canvas);

    void resize(const Size& size);
    void pointerMoved(const Point& position, Modifiers modifiers = Modifiers::None);
    void pointerLeft();
    void pointerPressed(PointerButton button, Modifiers modifiers = Modifiers::None);
    void pointerReleased(PointerButton button, Modifiers modifiers = Modifiers::None);
    void key(KeyEvent event);
    void animate(float delta);

    bool needsLayout() const;
    bool needsDraw() const;
    bool needsAnimate() const;

    EventEmitter<void()>& onAnimationRequested();

private:
    BaseCx base();
    void dispatch(const Event& event);
    void pointer(PointerEvent::Type type, PointerButton button, Modifiers modifiers);
    void checkAnimate();

private:
    Ui(const Ui&) = delete;
    Ui& operator=(const Ui&) = delete;

private:
    T mData;
    Builder mBuilder;
    Stylesheet mStylesheet;
    StyleCache mCache;
    WindowState mWindow;
    std::unique_ptr<TextMeasurer> mMeasurer;
    StyleSelectors mSelectors;
    // parent of the root, collects what the tree propagates
    ViewState mParentState;
    std::optional<Pod<V>> mRoot;
    std::optional<typename Pod<V>::State> mState;
    EventEmitter<void()> mOnAnimationRequested;
};

template<typename T, typename V>
Ui<T, V>::Ui(T data, Builder builder, const Size& size, std::unique_ptr<TextMeasurer> measurer)
    : mData(std::move(data)), mBuilder(std::move(builder)), mWindow(size), mMeasurer(std::move(measurer))
{
    mRoot.emplace(mBuilder(mData));
    BuildCx cx(base(), mParentState);
    mState.emplace(mRoot->build(cx, mData));
}

template<typename T, typename V>
inline T& Ui<T, V>::data()
{
    return mData;
}

template<typename T, typename V>
inline const T& Ui<T, V>::data() const
{
    return mData;
}

template<typename T, typename V>
inline WindowState& Ui<T, V>::window()
{
    return mWindow;
}

template<typename T, typename V>
inline const WindowState& Ui<T, V>::window() const
{
    return mWindow;
}

template<typename T, typename V>
inline const Stylesheet& Ui<T, V>::stylesheet() const
{
    return mStylesheet;
}

template<typename T, typename V>
inline StyleCache& Ui<T, V>::styleCache()
{
    return mCache;
}

template<typename T, typename V>
inline const ViewState& Ui<T, V>::rootState() const
{
    return mState->viewState;
}

template<typename T, typename V>
inline EventEmitter<void()>& Ui<T, V>::onAnimationRequested()
{
    return mOnAnimationRequested;
}

template<typename T, typename V>
inline BaseCx Ui<T, V>::base()
{
    return BaseCx(mStylesheet, mCache, mWindow, *mMeasurer, mSelectors);
}

template<typename T, typename V>
void Ui<T, V>::setStylesheet(Stylesheet stylesheet)
{
    mStylesheet = std::move(stylesheet);
    mState->viewState.requestLayout();
}

template<typename T, typename V>
Result<void> Ui<T, V>::loadStylesheet(const std::string& text)
{
    auto sheet = Stylesheet::parse(text);
    if (!sheet.ok()) {
        spdlog::error("failed to load stylesheet, keeping the previous one: {}", sheet.error().message);
        return std::move(sheet).error();
    }
    setStylesheet(std::move(sheet).data());
    return {};
}

template<typename T, typename V>
Result<void> Ui<T, V>::loadStylesheetFile(const std::filesystem::path& path)
{
    auto sheet = Stylesheet::load(path);
    if (!sheet.ok()) {
        spdlog::error("failed to load stylesheet {}, keeping the previous one: {}", path, sheet.error().message);
        return std::move(sheet).error();
    }
    setStylesheet(std::move(sheet).data());
    return {};
}

template<typename T, typename V>
void Ui<T, V>::rebuild()
{
    Pod<V> next(mBuilder(mData));
    RebuildCx cx(base(), mParentState);
    next.rebuild(*mState, cx, mData, *mRoot);
    mRoot.emplace(std::move(next));
}

template<typename T, typename V>
void Ui<T, V>::render(Canvas& canvas)
{
    mCache.clear();
    rebuild();

    LayoutCx layoutCx(base(), mParentState);
    const Size window = mWindow.size();
    mRoot->layout(*mState, layoutCx, mData, Space { { 0.f, 0.f }, window });

    canvas.clear();
    mWindow.clearHits();
    DrawCx drawCx(base(), mParentState);
    mRoot->draw(*mState, drawCx, mData, canvas);

    // the hit list changed, what's under the pointer may have too
    mWindow.updateHovered();
    spdlog::trace("rendered {} primitives", canvas.primitives().size());
    checkAnimate();
}

template<typename T, typename V>
void Ui<T, V>::dispatch(const Event& event)
{
    mWindow.resetCursorRequest();
    EventCx cx(base(), mParentState);
    mRoot->event(*mState, cx, mData, event);
    mWindow.commitCursor();
    checkAnimate();
}

template<typename T, typename V>
void Ui<T, V>::resize(const Size& size)
{
    mWindow.setSize(size);
    // viewport lengths change with the window
    mCache.clear();
    mState->viewState.requestLayout();
    dispatch(Event(ResizeEvent { size }));
}

template<typename T, typename V>
void Ui<T, V>::pointerMoved(const Point& position, Modifiers modifiers)
{
    mWindow.setPointer(position);
    if (mWindow.updateHovered()) {
        spdlog::trace("hovered {}", mWindow.hovered().has_value() ? mWindow.hovered()->value() : 0);
    }
    dispatch(Event(PointerEvent { PointerEvent::Type::Moved, position, PointerButton::Primary, modifiers }));
}

template<typename T, typename V>
void Ui<T, V>::pointerLeft()
{
    const Point last = mWindow.pointer();
    mWindow.setPointer({});
    mWindow.updateHovered();
    dispatch(Event(PointerEvent { PointerEvent::Type::Left, last, PointerButton::Primary, Modifiers::None }));
}

template<typename T, typename V>
void Ui<T, V>::pointer(PointerEvent::Type type, PointerButton button, Modifiers modifiers)
{
    dispatch(Event(PointerEvent { type, mWindow.pointer(), button, modifiers }));
}

template<typename T, typename V>
void Ui<T, V>::pointerPressed(PointerButton button, Modifiers modifiers)
{
    // whoever takes the press takes focus, a press on nothing clears it
    mWindow.setFocused({});
    pointer(PointerEvent::Type::Pressed, button, modifiers);
}

template<typename T, typename V>
void Ui<T, V>::pointerReleased(PointerButton button, Modifiers modifiers)
{
    pointer(PointerEvent::Type::Released, button, modifiers);
}

template<typename T, typename V>
void Ui<T, V>::key(KeyEvent event)
{
    dispatch(Event(std::move(event)));
}

template<typename T, typename V>
void Ui<T, V>::animate(float delta)
{
    dispatch(Event(AnimateEvent { delta }));
}

template<typename T, typename V>
inline bool Ui<T, V>::needsLayout() const
{
    return mState->viewState.needsLayout();
}

template<typename T, typename V>
inline bool Ui<T, V>::needsDraw() const
{
    return mState->viewState.needsDraw();
}

template<typename T, typename V>
inline bool Ui<T, V>::needsAnimate() const
{
    return mState->viewState.needsAnimate();
}

template<typename T, typename V>
void Ui<T, V>::checkAnimate()
{
    if (needsAnimate()) {
        mOnAnimationRequested.emit();
    }
}

} // namespace tessel
