#pragma once

#include "TextStyle.h"
#include <Geometry.h>
#include <string>
#include <vector>

namespace tessel {

struct FontAttributes
{
    std::string family = "sans-serif";
    // pixels
    float size = 14.f;
    TextStyle style = TextStyle::Normal;

    bool operator==(const FontAttributes& other) const = default;
};

struct TextLineMetrics
{
    // byte range in the measured text
    std::size_t start = 0;
    std::size_t length = 0;
    float width = 0.f;
    float height = 0.f;
    float baseline = 0.f;
};

struct TextMetrics
{
    std::vector<TextLineMetrics> lines;
    Size size = { 0.f, 0.f };
};

// font capability used by layout, implemented by the text backend
class TextMeasurer
{
public:
    virtual ~TextMeasurer() = default;

    virtual TextMetrics measure(const std::string& text, const FontAttributes& font, float maxWidth) const = 0;
};

} // namespace tessel
