#include "Stylesheet.h"
#include "StyleParser.h"
#include <Logger.h>
#include <atomic>
#include <fstream>
#include <sstream>

using namespace tessel;

static std::atomic<uint64_t> sGeneration = 0;

Stylesheet::Stylesheet()
{
    bump();
}

void Stylesheet::bump()
{
    mGeneration = ++sGeneration;
}

void Stylesheet::addRule(StyleRule rule)
{
    mRules.push_back(std::move(rule));
    bump();
}

void Stylesheet::extend(const Stylesheet& other)
{
    mRules.insert(mRules.end(), other.mRules.begin(), other.mRules.end());
    bump();
}

void Stylesheet::clear()
{
    mRules.clear();
    bump();
}

std::optional<StyleMatch> Stylesheet::attribute(const StyleSelectors& path, const std::string& key) const
{
    std::optional<StyleMatch> best;
    for (const auto& rule : mRules) {
        if (!rule.selectors.select(path)) {
            continue;
        }
        const StyleSpecificity specificity = rule.selectors.specificity();
        if (best.has_value() && specificity < best->specificity) {
            continue;
        }
        for (const auto& attr : rule.attributes) {
            if (attr.key == key) {
                best = StyleMatch { attr, specificity };
            }
        }
    }
    return best;
}

Result<Stylesheet> Stylesheet::parse(const std::string& text)
{
    return StyleParser(text).parse();
}

Result<Stylesheet> Stylesheet::load(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return makeError(fmt::format("unable to open stylesheet {}", path));
    }
    std::stringstream contents;
    contents << file.rdbuf();
    auto sheet = parse(contents.str());
    if (sheet.hasError()) {
        return makeError(fmt::format("{}: {}", path, sheet.error().message), sheet.error().span);
    }
    spdlog::info("loaded stylesheet {} with {} rules", path, sheet->rules().size());
    return sheet;
}

std::optional<StyleMatch> tessel::resolveStyle(const Stylesheet& stylesheet, StyleCache& cache, const StyleSelectors& path,
                                               const std::string& key, const StyleAttributes* inlineAttributes)
{
    if (inlineAttributes != nullptr) {
        for (auto it = inlineAttributes->rbegin(); it != inlineAttributes->rend(); ++it) {
            if (it->key == key) {
                return StyleMatch { *it, StyleSpecificity::inlined() };
            }
        }
    }

    cache.sync(stylesheet.generation());
    const uint64_t hash = path.hash();
    if (const auto* entry = cache.find(hash, key)) {
        return *entry;
    }

    auto match = stylesheet.attribute(path, key);
    cache.insert(hash, key, match);
    return match;
}
