#pragma once

#include <Color.h>
#include <Geometry.h>
#include <Result.h>
#include <fmt/core.h>
#include <fmt/color.h>
#include <algorithm>
#include <filesystem>
#include <vector>
#include <cstdint>

constexpr auto vectorColor = fmt::terminal_color::bright_yellow;

template<>
struct fmt::formatter<std::filesystem::path> : formatter<std::string_view>
{
    template <typename Context>
    constexpr auto format(const std::filesystem::path& path, Context& ctx) const {
        return formatter<std::string_view>::format(path.string(), ctx);
    }
};

template<>
struct fmt::formatter<tessel::Error>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (const tessel::Error& err, Context& ctx) const {
        if (err.span.has_value()) {
            return format_to(ctx.out(), "{} (at {}+{})", err.message, err.span->offset, err.span->length);
        }
        return format_to(ctx.out(), "{}", err.message);
    }
};

template<>
struct fmt::formatter<tessel::Color>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::Color c, Context& ctx) const {
        return format_to(ctx.out(), "Color r={:.2f} g={:.2f} b={:.2f} a={:.2f}", c.r, c.g, c.b, c.a);
    }
};

template<>
struct fmt::formatter<tessel::Point>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::Point p, Context& ctx) const {
        return format_to(ctx.out(), "({}, {})", p.x, p.y);
    }
};

template<>
struct fmt::formatter<tessel::Size>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::Size s, Context& ctx) const {
        return format_to(ctx.out(), "{}x{}", s.width, s.height);
    }
};

template<>
struct fmt::formatter<tessel::Rect>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::Rect r, Context& ctx) const {
        return format_to(ctx.out(), "Rect {},{} {}x{}", r.x, r.y, r.width, r.height);
    }
};

template<typename T>
struct fmt::formatter<std::vector<T>>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (const std::vector<T>& vec, Context& ctx) const {
        auto it = ctx.out();
        it = format_to(it, "std::vector size={} [ ", vec.size());
        // first 100 elements?
        const auto num = std::min<std::size_t>(vec.size(), 100);
        for (std::size_t n = 0; n < num; ++n) {
            it = format_to(it, fg(vectorColor), "{}", vec[n]);
            if (n + 1 < num) {
                it = format_to(it, ", ");
            }
        }
        if (num < vec.size()) {
            it = format_to(it, ", ");
            it = format_to(it, fg(vectorColor), "...");
            it = format_to(it, "]");
        } else {
            it = format_to(it, " ]");
        }
        return it;
    }
};
