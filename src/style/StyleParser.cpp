#include "StyleParser.h"
#include <Logger.h>
#include <cctype>
#include <cmath>
#include <cstdlib>

using namespace tessel;

static inline bool isIdentChar(char ch)
{
    return isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_';
}

static inline bool isSpace(char ch)
{
    return isspace(static_cast<unsigned char>(ch));
}

StyleParser::StyleParser(std::string text)
    : mText(std::move(text))
{
}

bool StyleParser::fail(const std::string& message, std::size_t offset, std::size_t length)
{
    std::size_t line = 1, column = 1;
    for (std::size_t i = 0; i < offset && i < mText.size(); ++i) {
        if (mText[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
    mError = makeError(fmt::format("line {}, column {}: {}", line, column, message), Span { offset, length });
    return false;
}

Error StyleParser::takeError()
{
    if (!mError.has_value()) {
        return makeError("unknown error", Span { mPos, 0 });
    }
    Error err = std::move(*mError);
    mError.reset();
    return err;
}

void StyleParser::skipWhitespace()
{
    while (!atEnd()) {
        const char ch = mText[mPos];
        if (isSpace(ch)) {
            ++mPos;
        } else if (ch == '/' && mPos + 1 < mText.size() && mText[mPos + 1] == '/') {
            while (!atEnd() && mText[mPos] != '\n') {
                ++mPos;
            }
        } else if (ch == '/' && mPos + 1 < mText.size() && mText[mPos + 1] == '*') {
            const auto end = mText.find("*/", mPos + 2);
            mPos = end == std::string::npos ? mText.size() : end + 2;
        } else {
            break;
        }
    }
}

std::string StyleParser::identifier(bool allowDots)
{
    const std::size_t start = mPos;
    while (!atEnd() && (isIdentChar(mText[mPos]) || (allowDots && mText[mPos] == '.'))) {
        ++mPos;
    }
    return mText.substr(start, mPos - start);
}

bool StyleParser::ruleAhead() const
{
    bool quoted = false;
    for (std::size_t i = mPos; i < mText.size(); ++i) {
        const char ch = mText[i];
        if (ch == '"') {
            quoted = !quoted;
        } else if (!quoted && (ch == '{' || ch == ';' || ch == '}')) {
            return ch == '{';
        }
    }
    return false;
}

Result<Stylesheet> StyleParser::parse()
{
    std::vector<StyleRule> rules;

    skipWhitespace();
    while (!atEnd()) {
        if (peek() == '}') {
            fail("unexpected '}'", mPos);
            return takeError();
        }
        if (!ruleAhead()) {
            fail("declaration outside of a rule", mPos);
            return takeError();
        }
        std::vector<StyleSelectors> selectors;
        if (!parseSelectorList(selectors, {})) {
            return takeError();
        }
        ++mPos; // '{'
        if (!parseBlock(rules, selectors)) {
            return takeError();
        }
        skipWhitespace();
    }

    Stylesheet sheet;
    for (auto& rule : rules) {
        if (!rule.attributes.empty()) {
            sheet.addRule(std::move(rule));
        }
    }
    spdlog::debug("parsed stylesheet with {} rules", sheet.rules().size());
    return sheet;
}

bool StyleParser::parseBlock(std::vector<StyleRule>& rules, const std::vector<StyleSelectors>& selectors)
{
    const std::size_t open = mPos - 1;
    std::vector<std::size_t> indices;
    for (const auto& selector : selectors) {
        indices.push_back(rules.size());
        rules.push_back(StyleRule { selector, {} });
    }

    for (;;) {
        skipWhitespace();
        if (atEnd()) {
            return fail("expected '}' to close block", open);
        }
        if (peek() == '}') {
            ++mPos;
            return true;
        }
        if (ruleAhead()) {
            std::vector<StyleSelectors> nested;
            if (!parseSelectorList(nested, selectors)) {
                return false;
            }
            ++mPos; // '{'
            if (!parseBlock(rules, nested)) {
                return false;
            }
            continue;
        }
        StyleAttribute attribute;
        if (!parseDeclaration(attribute)) {
            return false;
        }
        for (std::size_t idx : indices) {
            rules[idx].attributes.push_back(attribute);
        }
    }
}

bool StyleParser::parseLevel(StyleSelector& level, bool& ampersand)
{
    const std::size_t start = mPos;
    if (peek() == '&') {
        ampersand = true;
        ++mPos;
    }
    if (peek() == '*') {
        ++mPos;
    } else if (isIdentChar(peek())) {
        level.element = identifier();
    }
    for (;;) {
        const char ch = peek();
        if (ch != '.' && ch != ':') {
            break;
        }
        ++mPos;
        const std::size_t nameStart = mPos;
        std::string name = identifier();
        if (name.empty()) {
            return fail(ch == '.' ? "expected class name" : "expected state name", nameStart);
        }
        if (ch == '.') {
            level.classes.push_back(std::move(name));
        } else {
            level.states.push_back(std::move(name));
        }
    }
    if (mPos == start) {
        return fail(fmt::format("unexpected '{}' in selector", peek()), mPos);
    }
    return true;
}

bool StyleParser::parseSelectorList(std::vector<StyleSelectors>& out, const std::vector<StyleSelectors>& parents)
{
    for (;;) {
        skipWhitespace();
        const std::size_t start = mPos;
        std::vector<StyleSelector> levels;
        bool ampersand = false;
        while (!atEnd() && peek() != '{' && peek() != ',') {
            StyleSelector level;
            bool levelAmpersand = false;
            const std::size_t levelStart = mPos;
            if (!parseLevel(level, levelAmpersand)) {
                return false;
            }
            if (levelAmpersand) {
                if (!levels.empty()) {
                    return fail("'&' has to start a selector", levelStart);
                }
                ampersand = true;
            }
            levels.push_back(std::move(level));
            skipWhitespace();
        }
        if (levels.empty()) {
            return fail("expected selector", start);
        }
        if (atEnd()) {
            return fail("expected '{'", mPos);
        }

        if (parents.empty()) {
            if (ampersand) {
                return fail("'&' outside of a nested rule", start);
            }
            out.push_back(StyleSelectors(std::move(levels)));
        } else {
            for (const auto& parent : parents) {
                StyleSelectors selectors = parent;
                std::size_t first = 0;
                if (ampersand && !selectors.empty()) {
                    StyleSelector merged = selectors.last();
                    const StyleSelector& level = levels[0];
                    if (level.element.has_value()) {
                        merged.element = level.element;
                    }
                    merged.classes.insert(merged.classes.end(), level.classes.begin(), level.classes.end());
                    merged.states.insert(merged.states.end(), level.states.begin(), level.states.end());
                    selectors.pop();
                    selectors.push(std::move(merged));
                    first = 1;
                }
                for (std::size_t i = first; i < levels.size(); ++i) {
                    selectors.push(levels[i]);
                }
                out.push_back(std::move(selectors));
            }
        }

        if (peek() == ',') {
            ++mPos;
            continue;
        }
        return true;
    }
}

bool StyleParser::parseDeclaration(StyleAttribute& attribute)
{
    const std::size_t keyStart = mPos;
    attribute.key = identifier(true);
    if (attribute.key.empty()) {
        return fail("expected property name", keyStart);
    }
    skipWhitespace();
    if (peek() != ':') {
        return fail("expected ':'", mPos);
    }
    ++mPos;

    const std::size_t valueStart = mPos;
    bool quoted = false;
    int parens = 0;
    while (!atEnd()) {
        const char ch = mText[mPos];
        if (ch == '"') {
            quoted = !quoted;
        } else if (!quoted) {
            if (ch == '(') {
                ++parens;
            } else if (ch == ')') {
                --parens;
            } else if (parens == 0 && (ch == ';' || ch == '}')) {
                break;
            }
        }
        ++mPos;
    }
    if (atEnd()) {
        return fail("expected ';'", mPos > 0 ? mPos - 1 : 0);
    }

    const std::string raw = mText.substr(valueStart, mPos - valueStart);
    if (peek() == ';') {
        ++mPos;
    }
    return parseValue(raw, valueStart, attribute);
}

bool StyleParser::parseLength(const std::string& token, std::size_t offset, Length& length)
{
    char* end;
    length.value = strtof(token.c_str(), &end);
    if (end == token.c_str() || !std::isfinite(length.value)) {
        return fail(fmt::format("invalid number '{}'", token), offset, token.size());
    }
    const std::string unit(end);
    if (unit.empty() || unit == "px") {
        length.unit = LengthUnit::Px;
    } else if (unit == "pt") {
        length.unit = LengthUnit::Pt;
    } else if (unit == "%") {
        length.unit = LengthUnit::Percent;
    } else if (unit == "vw") {
        length.unit = LengthUnit::Vw;
    } else if (unit == "vh") {
        length.unit = LengthUnit::Vh;
    } else if (unit == "em") {
        length.unit = LengthUnit::Em;
    } else {
        return fail(fmt::format("unknown unit '{}'", unit), offset + (end - token.c_str()), unit.size());
    }
    return true;
}

bool StyleParser::parseValue(const std::string& raw, std::size_t offset, StyleAttribute& attribute)
{
    // split into whitespace separated tokens, keeping strings and rgb() in one piece
    std::vector<std::pair<std::string, std::size_t>> tokens;
    std::size_t i = 0;
    while (i < raw.size()) {
        if (isSpace(raw[i])) {
            ++i;
            continue;
        }
        const std::size_t start = i;
        if (raw[i] == '"') {
            const auto close = raw.find('"', i + 1);
            if (close == std::string::npos) {
                return fail("unterminated string", offset + i);
            }
            i = close + 1;
        } else {
            int parens = 0;
            while (i < raw.size() && (parens > 0 || !isSpace(raw[i]))) {
                if (raw[i] == '(') {
                    ++parens;
                } else if (raw[i] == ')') {
                    --parens;
                }
                ++i;
            }
        }
        tokens.emplace_back(raw.substr(start, i - start), offset + start);
    }

    if (tokens.empty()) {
        return fail(fmt::format("missing value for '{}'", attribute.key), offset);
    }
    if (tokens.size() > 3) {
        return fail("unexpected trailing input", tokens[3].second, tokens[3].first.size());
    }

    const auto& [value, valueOffset] = tokens[0];
    const char first = value[0];
    if (first == '"') {
        attribute.value = StyleString { value.substr(1, value.size() - 2) };
    } else if (first == '#' || value.compare(0, 4, "rgb(") == 0 || value.compare(0, 5, "rgba(") == 0) {
        auto color = parseColor(value);
        if (!color.has_value()) {
            return fail(fmt::format("invalid color '{}'", value), valueOffset, value.size());
        }
        attribute.value = *color;
    } else if (isdigit(static_cast<unsigned char>(first)) || first == '-' || first == '+' || first == '.') {
        Length length;
        if (!parseLength(value, valueOffset, length)) {
            return false;
        }
        attribute.value = length;
    } else if (isIdentChar(first)) {
        for (char ch : value) {
            if (!isIdentChar(ch)) {
                return fail(fmt::format("invalid identifier '{}'", value), valueOffset, value.size());
            }
        }
        attribute.value = StyleEnum { value };
    } else {
        return fail(fmt::format("invalid value '{}'", value), valueOffset, value.size());
    }

    if (tokens.size() == 1) {
        return true;
    }

    const auto& [duration, durationOffset] = tokens[1];
    char* end;
    float seconds = strtof(duration.c_str(), &end);
    const std::string unit(end);
    if (end == duration.c_str() || !std::isfinite(seconds) || seconds < 0.f || (unit != "s" && unit != "ms")) {
        return fail(fmt::format("invalid transition duration '{}'", duration), durationOffset, duration.size());
    }
    if (unit == "ms") {
        seconds /= 1000.f;
    }
    StyleTransition transition { seconds, Ease::Linear };

    if (tokens.size() == 3) {
        const auto& [ease, easeOffset] = tokens[2];
        auto parsed = parseEase(ease);
        if (!parsed.has_value()) {
            return fail(fmt::format("unknown easing '{}'", ease), easeOffset, ease.size());
        }
        transition.ease = *parsed;
    }
    attribute.transition = transition;
    return true;
}

Result<StyleSelectors> StyleParser::parseSelectors(const std::string& text)
{
    StyleParser parser(text + " {");
    std::vector<StyleSelectors> selectors;
    if (!parser.parseSelectorList(selectors, {})) {
        return parser.takeError();
    }
    if (selectors.size() != 1) {
        return makeError("expected a single selector", Span { 0, text.size() });
    }
    return std::move(selectors[0]);
}
