#include "Selector.h"
#include <UnorderedDense.h>
#include <algorithm>
#include <limits>

using namespace tessel;

static inline uint64_t hashCombine(uint64_t seed, uint64_t value)
{
    return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

static inline uint64_t hashString(const std::string& str)
{
    return unordered_dense::hash<std::string>{}(str);
}

template<typename T>
static inline bool isSubset(const std::vector<T>& subset, const std::vector<T>& set)
{
    for (const auto& item : subset) {
        if (std::find(set.begin(), set.end(), item) == set.end()) {
            return false;
        }
    }
    return true;
}

StyleSpecificity StyleSpecificity::inlined()
{
    return { std::numeric_limits<uint32_t>::max(), std::numeric_limits<uint32_t>::max() };
}

StyleSpecificity StyleSpecificity::operator+(const StyleSpecificity& other) const
{
    return { classes + other.classes, tags + other.tags };
}

bool StyleSelector::matches(const StyleSelector& node) const
{
    if (element.has_value() && element != node.element) {
        return false;
    }
    return isSubset(classes, node.classes) && isSubset(states, node.states);
}

StyleSpecificity StyleSelector::specificity() const
{
    return {
        static_cast<uint32_t>(classes.size() + states.size()),
        element.has_value() ? 1u : 0u
    };
}

uint64_t StyleSelector::hash() const
{
    uint64_t h = element.has_value() ? hashString(*element) : 0x51ed270b27a6c1f3ull;
    for (const auto& c : classes) {
        h = hashCombine(h, hashString(c));
    }
    // keep .a:b apart from .b:a
    h = hashCombine(h, 0x2545f4914f6cdd1dull);
    for (const auto& s : states) {
        h = hashCombine(h, hashString(s));
    }
    return h;
}

std::string StyleSelector::toString() const
{
    std::string ret = element.value_or(std::string());
    for (const auto& c : classes) {
        ret += '.';
        ret += c;
    }
    for (const auto& s : states) {
        ret += ':';
        ret += s;
    }
    if (ret.empty()) {
        ret = "*";
    }
    return ret;
}

StyleSelectors::StyleSelectors(std::vector<StyleSelector> selectors)
{
    mSelectors.reserve(selectors.size());
    for (auto& selector : selectors) {
        push(std::move(selector));
    }
}

void StyleSelectors::push(StyleSelector selector)
{
    const uint64_t prev = mHashes.empty() ? 0xcbf29ce484222325ull : mHashes.back();
    mHashes.push_back(hashCombine(prev, selector.hash()));
    mSelectors.push_back(std::move(selector));
}

void StyleSelectors::pop()
{
    if (mSelectors.empty()) {
        return;
    }
    mSelectors.pop_back();
    mHashes.pop_back();
}

bool StyleSelectors::select(const StyleSelectors& path) const
{
    if (mSelectors.empty()) {
        return true;
    }
    if (path.mSelectors.empty()) {
        return false;
    }

    auto sel = mSelectors.rbegin();
    auto node = path.mSelectors.rbegin();
    const auto selEnd = mSelectors.rend();
    const auto nodeEnd = path.mSelectors.rend();

    // the last level has to be the node itself
    if (!sel->matches(*node)) {
        return false;
    }
    ++sel;
    ++node;

    while (sel != selEnd) {
        while (node != nodeEnd && !sel->matches(*node)) {
            ++node;
        }
        if (node == nodeEnd) {
            return false;
        }
        ++sel;
        ++node;
    }
    return true;
}

StyleSpecificity StyleSelectors::specificity() const
{
    StyleSpecificity ret;
    for (const auto& selector : mSelectors) {
        ret = ret + selector.specificity();
    }
    return ret;
}

uint64_t StyleSelectors::hash() const
{
    return mHashes.empty() ? 0xcbf29ce484222325ull : mHashes.back();
}

std::string StyleSelectors::toString() const
{
    std::string ret;
    for (const auto& selector : mSelectors) {
        if (!ret.empty()) {
            ret += ' ';
        }
        ret += selector.toString();
    }
    return ret;
}
