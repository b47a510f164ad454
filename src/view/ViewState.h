#pragma once

#include "ViewId.h"
#include <EnumClassBitmask.h>
#include <Geometry.h>
#include <Transition.h>
#include <optional>
#include <cstdint>

namespace tessel {

enum class Update : uint8_t {
    None = 0x0,
    Layout = 0x1,
    Draw = 0x2,
    Animate = 0x4
};

template<>
struct IsEnumBitmask<Update> {
    static constexpr bool enable = true;
};

enum class ViewFlags : uint8_t {
    None = 0x0,
    Hot = 0x1,
    Focused = 0x2,
    Active = 0x4,
    HasHot = 0x8,
    HasFocused = 0x10,
    HasActive = 0x20,
    HasCursor = 0x40,
    Focusable = 0x80
};

template<>
struct IsEnumBitmask<ViewFlags> {
    static constexpr bool enable = true;
};

enum class Cursor : uint8_t {
    Default,
    Pointer,
    Text,
    Crosshair,
    NotAllowed,
    ResizeHorizontal,
    ResizeVertical
};

/* ViewState

   the framework owned state of a single view. the has-bits are rebuilt
   every pass, prepare() clears them and propagate() ors in what the
   children report. the update bits accumulate until the matching mark
   call.
*/

class ViewState
{
public:
    ViewState();

    ViewId id() const;

    bool isHot() const;
    void setHot(bool hot);
    bool isFocused() const;
    void setFocused(bool focused);
    bool isActive() const;
    void setActive(bool active);
    bool isFocusable() const;
    void setFocusable(bool focusable);

    bool hasHot() const;
    bool hasFocused() const;
    bool hasActive() const;
    bool hasCursor() const;

    const std::optional<Cursor>& cursor() const;
    void setCursor(std::optional<Cursor> cursor);

    float flex() const;
    bool isTight() const;
    void setFlex(float flex, bool tight);

    Size size() const;
    void setSize(const Size& size);

    // offset in the parent, written by the parent's layout
    const Affine& transform() const;
    void setTransform(const Affine& transform);
    void translate(const Point& offset);

    const Affine& globalTransform() const;
    void setGlobalTransform(const Affine& transform);

    Rect localRect() const;
    // only valid once the parent has reached this view in the current pass
    Rect globalRect() const;

    TransitionStates& transitions();
    const TransitionStates& transitions() const;

    Update update() const;
    bool needsLayout() const;
    bool needsDraw() const;
    bool needsAnimate() const;

    void requestLayout();
    void requestDraw();
    void requestAnimate();

    void markLayedOut();
    void markDrawn();
    void markAnimated();

    void prepare();
    void propagate(const ViewState& child);

private:
    bool flag(ViewFlags flag) const;
    void setFlag(ViewFlags flag, bool on);

private:
    ViewId mId;
    ViewFlags mFlags = ViewFlags::None;
    Update mUpdate = Update::Layout | Update::Draw;
    std::optional<Cursor> mCursor;
    float mFlex = 0.f;
    bool mTight = false;
    Size mSize = { 0.f, 0.f };
    Affine mTransform;
    Affine mGlobalTransform;
    TransitionStates mTransitions;
};

inline ViewId ViewState::id() const
{
    return mId;
}

inline bool ViewState::flag(ViewFlags f) const
{
    return any(mFlags & f);
}

inline void ViewState::setFlag(ViewFlags f, bool on)
{
    if (on) {
        mFlags |= f;
    } else {
        mFlags &= ~f;
    }
}

inline bool ViewState::isHot() const
{
    return flag(ViewFlags::Hot);
}

inline void ViewState::setHot(bool hot)
{
    setFlag(ViewFlags::Hot, hot);
}

inline bool ViewState::isFocused() const
{
    return flag(ViewFlags::Focused);
}

inline void ViewState::setFocused(bool focused)
{
    setFlag(ViewFlags::Focused, focused);
}

inline bool ViewState::isActive() const
{
    return flag(ViewFlags::Active);
}

inline void ViewState::setActive(bool active)
{
    setFlag(ViewFlags::Active, active);
}

inline bool ViewState::isFocusable() const
{
    return flag(ViewFlags::Focusable);
}

inline void ViewState::setFocusable(bool focusable)
{
    setFlag(ViewFlags::Focusable, focusable);
}

inline bool ViewState::hasHot() const
{
    return flag(ViewFlags::HasHot);
}

inline bool ViewState::hasFocused() const
{
    return flag(ViewFlags::HasFocused);
}

inline bool ViewState::hasActive() const
{
    return flag(ViewFlags::HasActive);
}

inline bool ViewState::hasCursor() const
{
    return flag(ViewFlags::HasCursor);
}

inline const std::optional<Cursor>& ViewState::cursor() const
{
    return mCursor;
}

inline void ViewState::setCursor(std::optional<Cursor> cursor)
{
    mCursor = cursor;
}

inline float ViewState::flex() const
{
    return mFlex;
}

inline bool ViewState::isTight() const
{
    return mTight;
}

inline void ViewState::setFlex(float flex, bool tight)
{
    mFlex = flex;
    mTight = tight;
}

inline Size ViewState::size() const
{
    return mSize;
}

inline void ViewState::setSize(const Size& size)
{
    mSize = size;
}

inline const Affine& ViewState::transform() const
{
    return mTransform;
}

inline void ViewState::setTransform(const Affine& transform)
{
    mTransform = transform;
}

inline void ViewState::translate(const Point& offset)
{
    mTransform = Affine::translate(offset);
}

inline const Affine& ViewState::globalTransform() const
{
    return mGlobalTransform;
}

inline void ViewState::setGlobalTransform(const Affine& transform)
{
    mGlobalTransform = transform;
}

inline TransitionStates& ViewState::transitions()
{
    return mTransitions;
}

inline const TransitionStates& ViewState::transitions() const
{
    return mTransitions;
}

inline Update ViewState::update() const
{
    return mUpdate;
}

inline bool ViewState::needsLayout() const
{
    return any(mUpdate & Update::Layout);
}

inline bool ViewState::needsDraw() const
{
    return any(mUpdate & Update::Draw);
}

inline bool ViewState::needsAnimate() const
{
    return any(mUpdate & Update::Animate);
}

inline void ViewState::requestLayout()
{
    mUpdate |= Update::Layout | Update::Draw;
}

inline void ViewState::requestDraw()
{
    mUpdate |= Update::Draw;
}

inline void ViewState::requestAnimate()
{
    mUpdate |= Update::Animate;
}

inline void ViewState::markLayedOut()
{
    mUpdate &= ~Update::Layout;
}

inline void ViewState::markDrawn()
{
    mUpdate &= ~Update::Draw;
}

inline void ViewState::markAnimated()
{
    mUpdate &= ~Update::Animate;
}

} // namespace tessel
