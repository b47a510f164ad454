#pragma once

#include "Selector.h"
#include "StyleValue.h"
#include <UnorderedDense.h>
#include <optional>
#include <string>
#include <cstdint>

namespace tessel {

struct StyleMatch
{
    StyleAttribute attribute;
    StyleSpecificity specificity;
};

/* StyleCache

   memo of (selector path hash, key) to the resolved match, or to the fact
   that nothing matched. only valid for one frame and for the stylesheet
   generation it was filled from.
*/

class StyleCache
{
public:
    using Entry = std::optional<StyleMatch>;

    StyleCache() = default;

    // nullptr on a miss, an empty entry is a cached "no match"
    const Entry* find(uint64_t hash, const std::string& key) const;
    void insert(uint64_t hash, const std::string& key, Entry entry);
    void clear();

    // drop everything if the stylesheet changed since the last sync
    void sync(uint64_t generation);

    std::size_t size() const;
    uint64_t hits() const;
    uint64_t misses() const;

private:
    unordered_dense::map<uint64_t, unordered_dense::map<std::string, Entry>> mEntries;
    std::size_t mSize = 0;
    uint64_t mGeneration = 0;
    mutable uint64_t mHits = 0, mMisses = 0;
};

inline std::size_t StyleCache::size() const
{
    return mSize;
}

inline uint64_t StyleCache::hits() const
{
    return mHits;
}

inline uint64_t StyleCache::misses() const
{
    return mMisses;
}

} // namespace tessel
