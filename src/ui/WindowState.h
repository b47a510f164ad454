#pragma once

#include <EventEmitter.h>
#include <Geometry.h>
#include <ViewId.h>
#include <ViewState.h>
#include <optional>
#include <utility>
#include <vector>

namespace tessel {

/* WindowState

   what the view tree knows about the window it lives in. hover is resolved
   against the rects registered during the previous draw, the last
   registered rect containing the pointer wins since it was drawn on top.
*/

class WindowState
{
public:
    explicit WindowState(const Size& size);

    Size size() const;
    void setSize(const Size& size);

    Point pointer() const;
    void setPointer(const std::optional<Point>& pointer);

    const std::optional<ViewId>& hovered() const;
    bool isHovered(ViewId id) const;

    const std::optional<ViewId>& focused() const;
    bool isFocused(ViewId id) const;
    void setFocused(std::optional<ViewId> id);

    Cursor cursor() const;
    // the cursor asked for during the current pass, applied by commitCursor().
    // the first request of a pass wins
    void requestCursor(Cursor cursor);
    void resetCursorRequest();
    void commitCursor();

    void clearHits();
    void addHit(ViewId id, const Rect& rect);
    std::optional<ViewId> hitTest(const Point& point) const;
    // recompute hovered from the pointer, returns true if it changed
    bool updateHovered();

    EventEmitter<void(Cursor)>& onCursorChanged();

private:
    WindowState(const WindowState&) = delete;
    WindowState& operator=(const WindowState&) = delete;

private:
    Size mSize;
    std::optional<Point> mPointer;
    std::optional<ViewId> mHovered, mFocused;
    Cursor mCursor = Cursor::Default;
    Cursor mRequestedCursor = Cursor::Default;
    bool mCursorRequested = false;
    std::vector<std::pair<ViewId, Rect>> mHits;
    EventEmitter<void(Cursor)> mOnCursorChanged;
};

inline Size WindowState::size() const
{
    return mSize;
}

inline void WindowState::setSize(const Size& size)
{
    mSize = size;
}

inline Point WindowState::pointer() const
{
    return mPointer.value_or(Point { -1.f, -1.f });
}

inline const std::optional<ViewId>& WindowState::hovered() const
{
    return mHovered;
}

inline bool WindowState::isHovered(ViewId id) const
{
    return mHovered.has_value() && *mHovered == id;
}

inline const std::optional<ViewId>& WindowState::focused() const
{
    return mFocused;
}

inline bool WindowState::isFocused(ViewId id) const
{
    return mFocused.has_value() && *mFocused == id;
}

inline void WindowState::setFocused(std::optional<ViewId> id)
{
    mFocused = id;
}

inline Cursor WindowState::cursor() const
{
    return mCursor;
}

inline void WindowState::requestCursor(Cursor cursor)
{
    if (!mCursorRequested) {
        mRequestedCursor = cursor;
        mCursorRequested = true;
    }
}

inline void WindowState::resetCursorRequest()
{
    mRequestedCursor = Cursor::Default;
    mCursorRequested = false;
}

inline EventEmitter<void(Cursor)>& WindowState::onCursorChanged()
{
    return mOnCursorChanged;
}

} // namespace tessel
