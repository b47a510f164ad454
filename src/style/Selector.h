#pragma once

#include <fmt/core.h>
#include <compare>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace tessel {

// (classes + states, element names), compared in that order
struct StyleSpecificity
{
    uint32_t classes = 0;
    uint32_t tags = 0;

    // node-local attributes, beats anything a stylesheet can declare
    static StyleSpecificity inlined();

    StyleSpecificity operator+(const StyleSpecificity& other) const;
    auto operator<=>(const StyleSpecificity& other) const = default;
};

// one level of a selector: element.class.class:state
struct StyleSelector
{
    std::optional<std::string> element;
    std::vector<std::string> classes;
    std::vector<std::string> states;

    // this is the rule level, node is a level of a live path
    bool matches(const StyleSelector& node) const;
    StyleSpecificity specificity() const;
    uint64_t hash() const;
    std::string toString() const;

    bool operator==(const StyleSelector& other) const = default;
};

/* StyleSelectors

   an ordered path of selector levels. the same type serves as a stylesheet
   rule selector and as the live path from the root to a node. a rule
   selects a path when its last level matches the node's own level and the
   rest of its levels are found in order among the path's earlier levels,
   not necessarily next to each other, so "a .b .c" selects "a .b .x .c".
*/

class StyleSelectors
{
public:
    StyleSelectors() = default;
    StyleSelectors(std::vector<StyleSelector> selectors);

    void push(StyleSelector selector);
    void pop();
    StyleSelectors with(StyleSelector selector) const;

    bool empty() const;
    std::size_t size() const;
    const StyleSelector& operator[](std::size_t idx) const;
    const StyleSelector& last() const;

    std::vector<StyleSelector>::const_iterator begin() const;
    std::vector<StyleSelector>::const_iterator end() const;

    // this is the rule selector
    bool select(const StyleSelectors& path) const;
    StyleSpecificity specificity() const;
    uint64_t hash() const;
    std::string toString() const;

    bool operator==(const StyleSelectors& other) const;

private:
    std::vector<StyleSelector> mSelectors;
    // mHashes[n] is the hash of levels [0, n]
    std::vector<uint64_t> mHashes;
};

inline StyleSelectors StyleSelectors::with(StyleSelector selector) const
{
    StyleSelectors ret = *this;
    ret.push(std::move(selector));
    return ret;
}

inline bool StyleSelectors::empty() const
{
    return mSelectors.empty();
}

inline std::size_t StyleSelectors::size() const
{
    return mSelectors.size();
}

inline const StyleSelector& StyleSelectors::operator[](std::size_t idx) const
{
    return mSelectors[idx];
}

inline const StyleSelector& StyleSelectors::last() const
{
    return mSelectors.back();
}

inline std::vector<StyleSelector>::const_iterator StyleSelectors::begin() const
{
    return mSelectors.begin();
}

inline std::vector<StyleSelector>::const_iterator StyleSelectors::end() const
{
    return mSelectors.end();
}

inline bool StyleSelectors::operator==(const StyleSelectors& other) const
{
    return mSelectors == other.mSelectors;
}

} // namespace tessel

template<>
struct fmt::formatter<tessel::StyleSpecificity>
{
public:
    constexpr auto parse (format_parse_context& ctx) { return ctx.begin(); }
    template <typename Context>
    constexpr auto format (tessel::StyleSpecificity s, Context& ctx) const {
        return format_to(ctx.out(), "({}, {})", s.classes, s.tags);
    }
};

template<>
struct fmt::formatter<tessel::StyleSelectors> : formatter<std::string_view>
{
    template <typename Context>
    auto format(const tessel::StyleSelectors& selectors, Context& ctx) const {
        return formatter<std::string_view>::format(selectors.toString(), ctx);
    }
};
