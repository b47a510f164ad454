#pragma once

#include "Selector.h"
#include "StyleCache.h"
#include "StyleValue.h"
#include <Result.h>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tessel {

struct StyleRule
{
    StyleSelectors selectors;
    StyleAttributes attributes;
};

class Stylesheet
{
public:
    Stylesheet();

    void addRule(StyleRule rule);
    void extend(const Stylesheet& other);
    void clear();

    const std::vector<StyleRule>& rules() const;
    bool empty() const;

    // changes every time rules are added or removed
    uint64_t generation() const;

    // highest specificity match for key, a later rule wins a tie
    std::optional<StyleMatch> attribute(const StyleSelectors& path, const std::string& key) const;

    static Result<Stylesheet> parse(const std::string& text);
    static Result<Stylesheet> load(const std::filesystem::path& path);

private:
    void bump();

private:
    std::vector<StyleRule> mRules;
    uint64_t mGeneration = 0;
};

inline const std::vector<StyleRule>& Stylesheet::rules() const
{
    return mRules;
}

inline bool Stylesheet::empty() const
{
    return mRules.empty();
}

inline uint64_t Stylesheet::generation() const
{
    return mGeneration;
}

// inline attributes first, then the cache, then the stylesheet
std::optional<StyleMatch> resolveStyle(const Stylesheet& stylesheet, StyleCache& cache, const StyleSelectors& path,
                                       const std::string& key, const StyleAttributes* inlineAttributes = nullptr);

} // namespace tessel
