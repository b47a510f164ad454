#pragma once

#include <functional>
#include <utility>
#include <vector>
#include <cstdint>

namespace tessel {

template<typename T>
class EventEmitter;

// single threaded, slots run synchronously in connection order
template<typename ...Args>
class EventEmitter<void(Args...)>
{
public:
    using ConnectKey = uint32_t;

    EventEmitter() = default;

    template<typename ...EmitArgs>
    void emit(EmitArgs&& ...args);

    template<typename Func>
    ConnectKey connect(Func&& func);
    bool disconnect(ConnectKey key);
    void disconnectAll();

    std::size_t size() const;

private:
    EventEmitter(EventEmitter&&) = delete;
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(EventEmitter&&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

private:
    std::vector<std::pair<ConnectKey, std::function<void(Args...)>>> mFuncs;
    ConnectKey mConnectKey = 0;
};

template<typename ...Args>
template<typename ...EmitArgs>
void EventEmitter<void(Args...)>::emit(EmitArgs&& ...args)
{
    if (mFuncs.empty()) {
        return;
    }
    // slots may connect or disconnect while we're emitting
    const auto funcs = mFuncs;
    for (const auto& func : funcs) {
        func.second(args...);
    }
}

template<typename ...Args>
template<typename Func>
typename EventEmitter<void(Args...)>::ConnectKey EventEmitter<void(Args...)>::connect(Func&& func)
{
    // 0 is an invalid key
    const ConnectKey id = ++mConnectKey;
    mFuncs.push_back(std::make_pair(id, std::function<void(Args...)>(std::forward<Func>(func))));
    return id;
}

template<typename ...Args>
bool EventEmitter<void(Args...)>::disconnect(ConnectKey key)
{
    for (auto it = mFuncs.begin(); it != mFuncs.end(); ++it) {
        if (it->first == key) {
            mFuncs.erase(it);
            return true;
        }
    }
    return false;
}

template<typename ...Args>
void EventEmitter<void(Args...)>::disconnectAll()
{
    mFuncs.clear();
}

template<typename ...Args>
std::size_t EventEmitter<void(Args...)>::size() const
{
    return mFuncs.size();
}

} // namespace tessel
