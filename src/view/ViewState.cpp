#include "ViewState.h"

using namespace tessel;

ViewState::ViewState()
    : mId(ViewId::next())
{
}

Rect ViewState::localRect() const
{
    const Point offset = mTransform.translation();
    return { offset.x, offset.y, mSize.width, mSize.height };
}

Rect ViewState::globalRect() const
{
    return transformRect(mGlobalTransform, Rect { 0.f, 0.f, mSize.width, mSize.height });
}

void ViewState::prepare()
{
    mFlags &= ~(ViewFlags::HasHot | ViewFlags::HasFocused | ViewFlags::HasActive | ViewFlags::HasCursor);
}

void ViewState::propagate(const ViewState& child)
{
    if (child.isHot() || child.hasHot()) {
        mFlags |= ViewFlags::HasHot;
    }
    if (child.isFocused() || child.hasFocused()) {
        mFlags |= ViewFlags::HasFocused;
    }
    if (child.isActive() || child.hasActive()) {
        mFlags |= ViewFlags::HasActive;
    }
    if (child.mCursor.has_value() || child.hasCursor()) {
        mFlags |= ViewFlags::HasCursor;
    }
    mUpdate |= child.mUpdate;
}
