#include "Transition.h"
#include <vector>

using namespace tessel;

float TransitionStates::unit(const std::string& key, float target, const std::optional<StyleTransition>& transition)
{
    auto& entry = mUnits[key];
    entry.used = true;
    return entry.state.get(target, transition);
}

Color TransitionStates::color(const std::string& key, const Color& target, const std::optional<StyleTransition>& transition)
{
    auto& entry = mColors[key];
    entry.used = true;
    return entry.state.get(target, transition);
}

bool TransitionStates::update(float delta)
{
    bool running = false;
    for (auto& [key, entry] : mUnits) {
        running = entry.state.update(delta) || running;
    }
    for (auto& [key, entry] : mColors) {
        running = entry.state.update(delta) || running;
    }
    return running;
}

bool TransitionStates::isRunning() const
{
    for (const auto& [key, entry] : mUnits) {
        if (entry.state.isRunning()) {
            return true;
        }
    }
    for (const auto& [key, entry] : mColors) {
        if (entry.state.isRunning()) {
            return true;
        }
    }
    return false;
}

template<typename Map>
static void sweepMap(Map& map)
{
    // erase invalidates iterators on a dense map, collect first
    std::vector<std::string> unused;
    for (auto& [key, entry] : map) {
        if (!entry.used) {
            unused.push_back(key);
        }
        entry.used = false;
    }
    for (const auto& key : unused) {
        map.erase(key);
    }
}

void TransitionStates::sweep()
{
    sweepMap(mUnits);
    sweepMap(mColors);
}
