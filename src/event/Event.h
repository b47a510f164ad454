#pragma once

#include <EnumClassBitmask.h>
#include <Geometry.h>
#include <string>
#include <variant>
#include <cstdint>

namespace tessel {

enum class Modifiers : uint8_t {
    None = 0x0,
    Shift = 0x1,
    Control = 0x2,
    Alt = 0x4,
    Super = 0x8
};

template<>
struct IsEnumBitmask<Modifiers> {
    static constexpr bool enable = true;
};

enum class PointerButton : uint8_t {
    Primary,
    Secondary,
    Tertiary
};

struct PointerEvent
{
    enum class Type : uint8_t {
        Moved,
        Pressed,
        Released,
        Left
    };

    Type type = Type::Moved;
    Point position = {};
    PointerButton button = PointerButton::Primary;
    Modifiers modifiers = Modifiers::None;
};

enum class Key : uint16_t {
    Unknown,
    Enter,
    Space,
    Escape,
    Tab,
    Backspace,
    Left,
    Right,
    Up,
    Down,
    Character
};

struct KeyEvent
{
    Key key = Key::Unknown;
    bool pressed = true;
    // utf-8, set for Key::Character
    std::string text;
    Modifiers modifiers = Modifiers::None;
};

struct AnimateEvent
{
    // seconds since the previous frame
    float delta = 0.f;
};

struct ResizeEvent
{
    Size size = {};
};

class Event
{
public:
    template<typename T>
    Event(T data);

    template<typename T>
    bool is() const;
    template<typename T>
    const T* get() const;

    bool isHandled() const;
    void setHandled() const;

private:
    std::variant<PointerEvent, KeyEvent, AnimateEvent, ResizeEvent> mData;
    mutable bool mHandled = false;
};

template<typename T>
inline Event::Event(T data)
    : mData(std::move(data))
{
}

template<typename T>
inline bool Event::is() const
{
    return std::holds_alternative<T>(mData);
}

template<typename T>
inline const T* Event::get() const
{
    return std::get_if<T>(&mData);
}

inline bool Event::isHandled() const
{
    return mHandled;
}

inline void Event::setHandled() const
{
    mHandled = true;
}

} // namespace tessel
