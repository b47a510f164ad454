#include "MonospaceMeasurer.h"
#include <algorithm>

using namespace tessel;

MonospaceMeasurer::MonospaceMeasurer(float advance, float lineHeight)
    : mAdvance(advance), mLineHeight(lineHeight)
{
}

static inline bool isContinuationByte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xc0) == 0x80;
}

TextMetrics MonospaceMeasurer::measure(const std::string& text, const FontAttributes& font, float maxWidth) const
{
    const float advance = font.size * mAdvance;
    const float lineHeight = font.size * mLineHeight;

    TextMetrics metrics;
    auto addLine = [&](std::size_t start, std::size_t end, std::size_t chars) {
        TextLineMetrics line;
        line.start = start;
        line.length = end - start;
        line.width = static_cast<float>(chars) * advance;
        line.height = lineHeight;
        line.baseline = metrics.size.height + font.size;
        metrics.size.width = std::max(metrics.size.width, line.width);
        metrics.size.height += lineHeight;
        metrics.lines.push_back(line);
    };

    // greedy word wrap, a word longer than maxWidth gets a line of its own
    std::size_t lineStart = 0, lineChars = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        if (pos == text.size() || text[pos] == '\n') {
            addLine(lineStart, pos, lineChars);
            lineStart = pos + 1;
            lineChars = 0;
            ++pos;
            continue;
        }

        std::size_t wordEnd = pos;
        std::size_t wordChars = 0;
        while (wordEnd < text.size() && text[wordEnd] != ' ' && text[wordEnd] != '\n') {
            if (!isContinuationByte(text[wordEnd])) {
                ++wordChars;
            }
            ++wordEnd;
        }
        if (wordEnd == pos) {
            // a space
            ++lineChars;
            ++pos;
            continue;
        }

        const float width = static_cast<float>(lineChars + wordChars) * advance;
        if (lineChars > 0 && width > maxWidth) {
            // drop the trailing space from the wrapped line
            const std::size_t end = pos > lineStart && text[pos - 1] == ' ' ? pos - 1 : pos;
            addLine(lineStart, end, lineChars > 0 && end < pos ? lineChars - 1 : lineChars);
            lineStart = pos;
            lineChars = 0;
        }
        lineChars += wordChars;
        pos = wordEnd;
    }
    return metrics;
}
