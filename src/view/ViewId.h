#pragma once

#include <fmt/core.h>
#include <atomic>
#include <cstdint>

namespace tessel {

// process unique, never reused
class ViewId
{
public:
    static ViewId next();

    uint64_t value() const;

    bool operator==(const ViewId& other) const = default;

private:
    explicit ViewId(uint64_t id);

private:
    uint64_t mId;
};

inline ViewId::ViewId(uint64_t id)
    : mId(id)
{
}

inline ViewId ViewId::next()
{
    static std::atomic<uint64_t> sNext = 0;
    return ViewId(++sNext);
}

inline uint64_t ViewId::value() const
{
    return mId;
}

} // namespace tessel

template<>
struct fmt::formatter<tessel::ViewId>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::ViewId id, Context& ctx) const {
        return format_to(ctx.out(), "ViewId({})", id.value());
    }
};
