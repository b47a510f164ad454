#pragma once

#include "Stylesheet.h"
#include <Result.h>
#include <optional>
#include <string>
#include <vector>

namespace tessel {

/* StyleParser

   css-like stylesheets

   button.primary:hover container {
       button.color: #336699 0.2s ease-out;
       button.padding: 8px;

       &:active {
           button.color: rgb(20, 40, 60);
       }

       text {
           text.font-size: 1.5em;
       }
   }

   selector levels are separated by whitespace and alternatives by commas.
   nested rules are descendants of their parent unless they start with &,
   in which case the first level merges into the parent's last level. values
   are lengths (px, pt, %, vw, vh, em, bare numbers are px), colors (#rgb,
   #rgba, #rrggbb, #rrggbbaa, rgb(), rgba()), quoted strings or identifiers,
   optionally followed by a transition duration (s or ms) and an easing.
   both c and c++ style comments are supported.
*/

class StyleParser
{
public:
    explicit StyleParser(std::string text);

    Result<Stylesheet> parse();

    static Result<StyleSelectors> parseSelectors(const std::string& text);

private:
    bool parseBlock(std::vector<StyleRule>& rules, const std::vector<StyleSelectors>& selectors);
    bool parseSelectorList(std::vector<StyleSelectors>& out, const std::vector<StyleSelectors>& parents);
    bool parseLevel(StyleSelector& level, bool& ampersand);
    bool parseDeclaration(StyleAttribute& attribute);
    bool parseValue(const std::string& raw, std::size_t offset, StyleAttribute& attribute);
    bool parseLength(const std::string& token, std::size_t offset, Length& length);

    bool ruleAhead() const;
    void skipWhitespace();
    bool atEnd() const;
    char peek() const;
    std::string identifier(bool allowDots = false);

    bool fail(const std::string& message, std::size_t offset, std::size_t length = 1);
    Error takeError();

private:
    std::string mText;
    std::size_t mPos = 0;
    std::optional<Error> mError;
};

inline bool StyleParser::atEnd() const
{
    return mPos >= mText.size();
}

inline char StyleParser::peek() const
{
    return mPos < mText.size() ? mText[mPos] : '\0';
}

} // namespace tessel
