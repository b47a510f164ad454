#include "StyleCache.h"
#include <Logger.h>

using namespace tessel;

const StyleCache::Entry* StyleCache::find(uint64_t hash, const std::string& key) const
{
    auto it = mEntries.find(hash);
    if (it != mEntries.end()) {
        auto eit = it->second.find(key);
        if (eit != it->second.end()) {
            ++mHits;
            return &eit->second;
        }
    }
    ++mMisses;
    return nullptr;
}

void StyleCache::insert(uint64_t hash, const std::string& key, Entry entry)
{
    auto& entries = mEntries[hash];
    auto it = entries.find(key);
    if (it == entries.end()) {
        entries.emplace(key, std::move(entry));
        ++mSize;
    } else {
        it->second = std::move(entry);
    }
}

void StyleCache::clear()
{
    mEntries.clear();
    mSize = 0;
}

void StyleCache::sync(uint64_t generation)
{
    if (generation != mGeneration) {
        spdlog::debug("style cache invalidated, generation {} -> {} ({} entries)", mGeneration, generation, mSize);
        clear();
        mGeneration = generation;
    }
}
