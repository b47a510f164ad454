#pragma once

#include "StyleValue.h"
#include <Color.h>
#include <Geometry.h>
#include <UnorderedDense.h>
#include <optional>
#include <string>

namespace tessel {

inline float interpolate(float from, float to, float t)
{
    return mix(from, to, t);
}

inline Color interpolate(const Color& from, const Color& to, float t)
{
    return mix(from, to, t);
}

/* TransitionState

   animates one value towards the last target it was given. the first
   target is taken as is, later targets start a transition from whatever the
   current value is at that point.
*/

template<typename T>
class TransitionState
{
public:
    TransitionState() = default;

    // current value for target, starts a new transition when target changed
    T get(const T& target, const std::optional<StyleTransition>& transition);
    T current() const;

    // advance by delta seconds, returns true if still running
    bool update(float delta);
    bool isRunning() const;

private:
    std::optional<T> mFrom, mTo;
    std::optional<StyleTransition> mTransition;
    float mElapsed = 0.f;
};

template<typename T>
T TransitionState<T>::get(const T& target, const std::optional<StyleTransition>& transition)
{
    if (!mTo.has_value()) {
        mFrom = target;
        mTo = target;
        mTransition = transition;
        mElapsed = 0.f;
        return target;
    }
    if (!(*mTo == target)) {
        if (!transition.has_value() || transition->duration <= 0.f) {
            mFrom = target;
        } else {
            mFrom = current();
        }
        mTo = target;
        mTransition = transition;
        mElapsed = 0.f;
    } else if (transition != mTransition && transition.has_value() && mTransition.has_value()
               && mTransition->duration > 0.f) {
        // keep progress when only the timing changed
        mElapsed = mElapsed / mTransition->duration * transition->duration;
        mTransition = transition;
    }
    return current();
}

template<typename T>
T TransitionState<T>::current() const
{
    if (!mTransition.has_value() || mTransition->duration <= 0.f) {
        return *mTo;
    }
    return interpolate(*mFrom, *mTo, mTransition->progress(mElapsed));
}

template<typename T>
bool TransitionState<T>::update(float delta)
{
    if (!isRunning()) {
        return false;
    }
    mElapsed += delta;
    return isRunning();
}

template<typename T>
bool TransitionState<T>::isRunning() const
{
    return mTo.has_value() && mTransition.has_value() && mElapsed < mTransition->duration && !(*mFrom == *mTo);
}

/* TransitionStates

   the transitions of a single node keyed by attribute name. entries that
   are not read between two sweeps are dropped.
*/

class TransitionStates
{
public:
    TransitionStates() = default;

    float unit(const std::string& key, float target, const std::optional<StyleTransition>& transition);
    Color color(const std::string& key, const Color& target, const std::optional<StyleTransition>& transition);

    template<typename T>
    T get(const std::string& key, const T& target, const std::optional<StyleTransition>& transition);

    bool update(float delta);
    bool isRunning() const;

    void sweep();
    std::size_t size() const;

private:
    template<typename T>
    struct Entry
    {
        TransitionState<T> state;
        bool used = true;
    };

    unordered_dense::map<std::string, Entry<float>> mUnits;
    unordered_dense::map<std::string, Entry<Color>> mColors;
};

template<>
inline float TransitionStates::get<float>(const std::string& key, const float& target, const std::optional<StyleTransition>& transition)
{
    return unit(key, target, transition);
}

template<>
inline Color TransitionStates::get<Color>(const std::string& key, const Color& target, const std::optional<StyleTransition>& transition)
{
    return color(key, target, transition);
}

inline std::size_t TransitionStates::size() const
{
    return mUnits.size() + mColors.size();
}

} // namespace tessel
