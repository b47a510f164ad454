#include "WindowState.h"
#include <Logger.h>

using namespace tessel;

WindowState::WindowState(const Size& size)
    : mSize(size)
{
}

void WindowState::setPointer(const std::optional<Point>& pointer)
{
    mPointer = pointer;
}

void WindowState::commitCursor()
{
    if (mRequestedCursor != mCursor) {
        mCursor = mRequestedCursor;
        spdlog::debug("cursor changed to {}", static_cast<int>(mCursor));
        mOnCursorChanged.emit(mCursor);
    }
}

void WindowState::clearHits()
{
    mHits.clear();
}

void WindowState::addHit(ViewId id, const Rect& rect)
{
    mHits.emplace_back(id, rect);
}

std::optional<ViewId> WindowState::hitTest(const Point& point) const
{
    for (auto it = mHits.rbegin(); it != mHits.rend(); ++it) {
        if (it->second.contains(point)) {
            return it->first;
        }
    }
    return {};
}

bool WindowState::updateHovered()
{
    const std::optional<ViewId> hovered = mPointer.has_value() ? hitTest(*mPointer) : std::optional<ViewId> {};
    if (hovered == mHovered) {
        return false;
    }
    mHovered = hovered;
    return true;
}
