#pragma once

#include "TextMeasurer.h"

namespace tessel {

// fixed advance per character, used headless and in tests
class MonospaceMeasurer : public TextMeasurer
{
public:
    MonospaceMeasurer(float advance = 0.5f, float lineHeight = 1.2f);

    TextMetrics measure(const std::string& text, const FontAttributes& font, float maxWidth) const override;

private:
    float mAdvance, mLineHeight;
};

} // namespace tessel
