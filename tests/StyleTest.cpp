#include <Easing.h>
#include <Selector.h>
#include <StyleCache.h>
#include <StyleParser.h>
#include <StyleValue.h>
#include <Stylesheet.h>
#include <Transition.h>
#include <gtest/gtest.h>
#include <cmath>
#include <string>

using namespace tessel;

namespace {

StyleSelectors selectors(const std::string& text)
{
    auto parsed = StyleParser::parseSelectors(text);
    EXPECT_TRUE(parsed.ok()) << text;
    return parsed.ok() ? std::move(parsed).data() : StyleSelectors {};
}

StyleRule rule(const std::string& selector, const std::string& key, float px)
{
    return { selectors(selector), { StyleAttribute { key, Length::px(px), {} } } };
}

float pixelsOf(const std::optional<StyleMatch>& match)
{
    if (!match.has_value()) {
        return NAN;
    }
    const auto* length = std::get_if<Length>(&match->attribute.value);
    return length != nullptr ? length->value : NAN;
}

Stylesheet parseOk(const std::string& text)
{
    auto sheet = Stylesheet::parse(text);
    EXPECT_TRUE(sheet.ok()) << (sheet.ok() ? std::string() : sheet.error().message);
    return sheet.ok() ? std::move(sheet).data() : Stylesheet {};
}

std::string parseError(const std::string& text, Span* span = nullptr)
{
    auto sheet = Stylesheet::parse(text);
    if (sheet.ok()) {
        return "no error";
    }
    if (span != nullptr && sheet.error().span.has_value()) {
        *span = *sheet.error().span;
    }
    return sheet.error().message;
}

} // anonymous namespace

TEST(SelectorTest, TailSubsequenceMatches)
{
    EXPECT_TRUE(selectors("a .b .c").select(selectors("a .b .x .c")));
    EXPECT_TRUE(selectors(".c").select(selectors("a .b .x .c")));
    EXPECT_TRUE(selectors("a .c").select(selectors("a .b .x .c")));
}

TEST(SelectorTest, MoreLevelsThanThePathNeverMatch)
{
    EXPECT_FALSE(selectors("a .b .c .d").select(selectors("a .b .c")));
}

TEST(SelectorTest, LastLevelHasToBeTheNode)
{
    EXPECT_FALSE(selectors("a .b").select(selectors("a .b .c")));
    EXPECT_FALSE(selectors(".c .b").select(selectors("a .b .c")));
}

TEST(SelectorTest, EmptySelectorMatchesEverything)
{
    EXPECT_TRUE(StyleSelectors().select(selectors("a .b")));
    EXPECT_FALSE(selectors("a").select(StyleSelectors()));
}

TEST(SelectorTest, LevelMatching)
{
    const StyleSelectors node = selectors("button.primary.large:hover:active");
    EXPECT_TRUE(selectors("button.primary").select(node));
    EXPECT_TRUE(selectors(".large:active").select(node));
    EXPECT_TRUE(selectors("*:hover").select(node));
    EXPECT_FALSE(selectors("text.primary").select(node));
    EXPECT_FALSE(selectors("button.secondary").select(node));
    EXPECT_FALSE(selectors("button:focus").select(node));
}

TEST(SelectorTest, Specificity)
{
    const StyleSpecificity tagged = selectors("button.a.b").specificity();
    const StyleSpecificity untagged = selectors(".a.b").specificity();
    EXPECT_EQ(tagged, (StyleSpecificity { 2, 1 }));
    EXPECT_EQ(untagged, (StyleSpecificity { 2, 0 }));
    EXPECT_GT(tagged, untagged);
    EXPECT_GT(StyleSpecificity::inlined(), tagged);
    // classes count before element names
    EXPECT_GT(selectors(".a .b").specificity(), selectors("a b c").specificity());
}

TEST(SelectorTest, HashFollowsThePath)
{
    StyleSelectors path = selectors("a .b");
    const uint64_t before = path.hash();
    path.push(StyleSelector { "c", {}, {} });
    EXPECT_NE(path.hash(), before);
    path.pop();
    EXPECT_EQ(path.hash(), before);
    EXPECT_EQ(path.hash(), selectors("a .b").hash());
    EXPECT_NE(selectors("a.x:y").hash(), selectors("a.y:x").hash());
}

TEST(StylesheetTest, TagBeatsClassesRegardlessOfOrder)
{
    Stylesheet sheet;
    sheet.addRule(rule("button.a.b", "k", 2.f));
    sheet.addRule(rule(".a.b", "k", 1.f));
    const auto match = sheet.attribute(selectors("button.a.b"), "k");
    EXPECT_FLOAT_EQ(pixelsOf(match), 2.f);
    EXPECT_EQ(match->specificity, (StyleSpecificity { 2, 1 }));
}

TEST(StylesheetTest, LaterRuleWinsATie)
{
    Stylesheet sheet;
    sheet.addRule(rule("button", "k", 1.f));
    sheet.addRule(rule("button", "k", 2.f));
    EXPECT_FLOAT_EQ(pixelsOf(sheet.attribute(selectors("button"), "k")), 2.f);
}

TEST(StylesheetTest, RulesWithoutTheKeyDontInterfere)
{
    Stylesheet sheet;
    sheet.addRule(rule("button", "k", 1.f));
    sheet.addRule(rule("button.a", "other", 2.f));
    EXPECT_FLOAT_EQ(pixelsOf(sheet.attribute(selectors("button.a"), "k")), 1.f);
    EXPECT_FALSE(sheet.attribute(selectors("text"), "k").has_value());
}

TEST(StylesheetTest, InlineAttributesWin)
{
    Stylesheet sheet;
    sheet.addRule(rule("button.a.b", "k", 2.f));
    StyleCache cache;
    const StyleAttributes inlined = { { "k", Length::px(5.f), {} }, { "k", Length::px(9.f), {} } };
    const auto match = resolveStyle(sheet, cache, selectors("button.a.b"), "k", &inlined);
    EXPECT_FLOAT_EQ(pixelsOf(match), 9.f);
    EXPECT_EQ(match->specificity, StyleSpecificity::inlined());
    EXPECT_EQ(cache.size(), 0u);
}

TEST(StyleCacheTest, HitsAndCachedMisses)
{
    Stylesheet sheet;
    sheet.addRule(rule("button", "k", 1.f));
    StyleCache cache;
    const StyleSelectors path = selectors("container button");

    EXPECT_FLOAT_EQ(pixelsOf(resolveStyle(sheet, cache, path, "k")), 1.f);
    EXPECT_FLOAT_EQ(pixelsOf(resolveStyle(sheet, cache, path, "k")), 1.f);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.hits(), 1u);

    EXPECT_FALSE(resolveStyle(sheet, cache, path, "missing").has_value());
    EXPECT_FALSE(resolveStyle(sheet, cache, path, "missing").has_value());
    EXPECT_EQ(cache.hits(), 2u);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(StyleCacheTest, InvalidatedWhenTheStylesheetChanges)
{
    Stylesheet sheet;
    sheet.addRule(rule("button", "k", 1.f));
    StyleCache cache;
    const StyleSelectors path = selectors("button");

    EXPECT_FLOAT_EQ(pixelsOf(resolveStyle(sheet, cache, path, "k")), 1.f);
    const uint64_t generation = sheet.generation();
    sheet.addRule(rule("button", "k", 3.f));
    EXPECT_NE(sheet.generation(), generation);
    EXPECT_FLOAT_EQ(pixelsOf(resolveStyle(sheet, cache, path, "k")), 3.f);
    EXPECT_EQ(cache.misses(), 2u);

    // a different sheet has a different generation too
    Stylesheet other;
    other.addRule(rule("button", "k", 7.f));
    EXPECT_FLOAT_EQ(pixelsOf(resolveStyle(other, cache, path, "k")), 7.f);
}

TEST(StyleParserTest, NestingAndAmpersand)
{
    const Stylesheet sheet = parseOk(R"(
        button {
            button.radius: 4px;
            &:hover {
                button.radius: 6px;
            }
            text {
                text.color: #fff;
            }
        }
    )");
    ASSERT_EQ(sheet.rules().size(), 3u);
    EXPECT_EQ(sheet.rules()[0].selectors.toString(), "button");
    EXPECT_EQ(sheet.rules()[1].selectors.toString(), "button:hover");
    EXPECT_EQ(sheet.rules()[2].selectors.toString(), "button text");

    EXPECT_FLOAT_EQ(pixelsOf(sheet.attribute(selectors("button:hover"), "button.radius")), 6.f);
    EXPECT_FLOAT_EQ(pixelsOf(sheet.attribute(selectors("button"), "button.radius")), 4.f);
}

TEST(StyleParserTest, SelectorAlternatives)
{
    const Stylesheet sheet = parseOk("a, b.c { k: 1px; }\n.d { }");
    // the empty rule is dropped
    ASSERT_EQ(sheet.rules().size(), 2u);
    EXPECT_EQ(sheet.rules()[0].selectors.toString(), "a");
    EXPECT_EQ(sheet.rules()[1].selectors.toString(), "b.c");
}

TEST(StyleParserTest, Comments)
{
    const Stylesheet sheet = parseOk("/* header */ a { // trailing\n k: 1px; /* inline */ }");
    ASSERT_EQ(sheet.rules().size(), 1u);
    EXPECT_EQ(sheet.rules()[0].attributes.size(), 1u);
}

TEST(StyleParserTest, Values)
{
    const Stylesheet sheet = parseOk(R"(
        a {
            color: #fff;
            half: rgba(255, 0, 0, 0.5);
            size: 1.5em;
            bare: 12;
            family: "Fira Code";
            align: center;
            fade: #000 150ms ease-out;
        }
    )");
    ASSERT_EQ(sheet.rules().size(), 1u);
    const auto& attributes = sheet.rules()[0].attributes;
    ASSERT_EQ(attributes.size(), 7u);

    EXPECT_EQ(std::get<Color>(attributes[0].value), Color::white());
    const Color half = std::get<Color>(attributes[1].value);
    EXPECT_FLOAT_EQ(half.r, 1.f);
    EXPECT_FLOAT_EQ(half.a, 0.5f);
    EXPECT_EQ(std::get<Length>(attributes[2].value), (Length { 1.5f, LengthUnit::Em }));
    EXPECT_EQ(std::get<Length>(attributes[3].value), Length::px(12.f));
    EXPECT_EQ(std::get<StyleString>(attributes[4].value).value, "Fira Code");
    EXPECT_EQ(std::get<StyleEnum>(attributes[5].value).value, "center");

    ASSERT_TRUE(attributes[6].transition.has_value());
    EXPECT_FLOAT_EQ(attributes[6].transition->duration, 0.15f);
    EXPECT_EQ(attributes[6].transition->ease, Ease::OutSine);
    EXPECT_FALSE(attributes[0].transition.has_value());
}

TEST(StyleParserTest, ErrorsCarryLineColumnAndSpan)
{
    Span span;
    EXPECT_EQ(parseError("button {\n  button.color #fff;\n}", &span), "line 2, column 16: expected ':'");
    EXPECT_EQ(span.offset, 24u);
    EXPECT_EQ(span.length, 1u);

    EXPECT_EQ(parseError("a { k: 4qq; }", &span), "line 1, column 9: unknown unit 'qq'");
    EXPECT_EQ(span.offset, 8u);
    EXPECT_EQ(span.length, 2u);
}

TEST(StyleParserTest, Errors)
{
    EXPECT_EQ(parseError("button { button.radius: 4px;"), "line 1, column 8: expected '}' to close block");
    EXPECT_EQ(parseError("k: 1px;"), "line 1, column 1: declaration outside of a rule");
    EXPECT_EQ(parseError("&:hover { k: 1px; }"), "line 1, column 1: '&' outside of a nested rule");
    EXPECT_EQ(parseError("a { k: #12345; }"), "line 1, column 8: invalid color '#12345'");
    EXPECT_EQ(parseError("a { k: 1px 2s bounce; }"), "line 1, column 15: unknown easing 'bounce'");
    EXPECT_EQ(parseError("a { k: 1px 2days; }"), "line 1, column 12: invalid transition duration '2days'");
    EXPECT_EQ(parseError("}"), "line 1, column 1: unexpected '}'");
    EXPECT_EQ(parseError("a { k: +inf; }"), "line 1, column 8: invalid number '+inf'");
    EXPECT_EQ(parseError("a { k: -nan; }"), "line 1, column 8: invalid number '-nan'");
    EXPECT_EQ(parseError("a { k: 1px 1e40s; }"), "line 1, column 12: invalid transition duration '1e40s'");
    EXPECT_EQ(parseError("a { k: 1px -1s; }"), "line 1, column 12: invalid transition duration '-1s'");
    EXPECT_EQ(parseError("a { k: #-ff; }"), "line 1, column 8: invalid color '#-ff'");
}

TEST(StyleValueTest, LengthPixels)
{
    const Size window = { 800.f, 600.f };
    EXPECT_FLOAT_EQ((Length { 3.f, LengthUnit::Pt }).pixels(window), 4.f);
    EXPECT_FLOAT_EQ((Length { 50.f, LengthUnit::Percent }).pixels(window, 200.f), 100.f);
    EXPECT_FLOAT_EQ((Length { 10.f, LengthUnit::Vw }).pixels(window), 80.f);
    EXPECT_FLOAT_EQ((Length { 10.f, LengthUnit::Vh }).pixels(window), 60.f);
    EXPECT_FLOAT_EQ((Length { 2.f, LengthUnit::Em }).pixels(window), 32.f);
}

TEST(StyleValueTest, Convert)
{
    const Size window = { 800.f, 600.f };
    EXPECT_EQ(StyleConvert<float>::convert(Length { 10.f, LengthUnit::Vw }, window), 80.f);
    EXPECT_FALSE(StyleConvert<float>::convert(Color::black(), window).has_value());
    EXPECT_EQ(StyleConvert<Justify>::convert(StyleEnum { "space-between" }, window), Justify::SpaceBetween);
    EXPECT_FALSE(StyleConvert<Justify>::convert(StyleEnum { "sideways" }, window).has_value());
    EXPECT_EQ(StyleConvert<Align>::convert(StyleEnum { "stretch" }, window), Align::Stretch);
    EXPECT_EQ(StyleConvert<Padding>::convert(Length::px(4.f), window), Padding::all(4.f));
    EXPECT_EQ(StyleConvert<std::string>::convert(StyleEnum { "mono" }, window), "mono");
}

TEST(EasingTest, EndpointsAndNames)
{
    for (int e = static_cast<int>(Ease::Linear); e <= static_cast<int>(Ease::InOutBack); ++e) {
        const EasingFunction fn = getEasingFunction(static_cast<Ease>(e));
        EXPECT_NEAR(fn(0.f), 0.f, 1e-5f) << "ease " << e;
        EXPECT_NEAR(fn(1.f), 1.f, 1e-5f) << "ease " << e;
    }
    EXPECT_FLOAT_EQ(getEasingFunction(Ease::Linear)(0.25f), 0.25f);
    EXPECT_EQ(parseEase("ease-in-out-cubic"), Ease::InOutCubic);
    EXPECT_EQ(parseEase("linear"), Ease::Linear);
    EXPECT_FALSE(parseEase("bounce").has_value());
}

TEST(TransitionTest, FirstValueSnapsLaterValuesAnimate)
{
    TransitionState<float> state;
    const StyleTransition second = { 1.f, Ease::Linear };

    EXPECT_FLOAT_EQ(state.get(10.f, second), 10.f);
    EXPECT_FALSE(state.isRunning());

    EXPECT_FLOAT_EQ(state.get(20.f, second), 10.f);
    EXPECT_TRUE(state.isRunning());
    EXPECT_TRUE(state.update(0.5f));
    EXPECT_FLOAT_EQ(state.get(20.f, second), 15.f);
    EXPECT_FALSE(state.update(0.5f));
    EXPECT_FLOAT_EQ(state.current(), 20.f);
}

TEST(TransitionTest, WithoutTransitionValuesSnap)
{
    TransitionState<float> state;
    state.get(10.f, {});
    EXPECT_FLOAT_EQ(state.get(30.f, {}), 30.f);
    EXPECT_FALSE(state.isRunning());
}

TEST(TransitionTest, RetargetStartsFromTheCurrentValue)
{
    TransitionState<float> state;
    const StyleTransition linear = { 1.f, Ease::Linear };
    state.get(0.f, linear);
    state.get(100.f, linear);
    state.update(0.5f);
    EXPECT_FLOAT_EQ(state.get(0.f, linear), 50.f);
    state.update(0.5f);
    EXPECT_FLOAT_EQ(state.current(), 25.f);
}

TEST(TransitionTest, Colors)
{
    TransitionState<Color> state;
    const StyleTransition linear = { 2.f, Ease::Linear };
    state.get(Color::black(), linear);
    state.get(Color::white(), linear);
    state.update(1.f);
    const Color gray = state.current();
    EXPECT_FLOAT_EQ(gray.r, 0.5f);
    EXPECT_FLOAT_EQ(gray.g, 0.5f);
    EXPECT_FLOAT_EQ(gray.b, 0.5f);
    EXPECT_FLOAT_EQ(gray.a, 1.f);
}

TEST(TransitionTest, UnusedEntriesAreSwept)
{
    TransitionStates states;
    states.get<float>("width", 1.f, {});
    states.get<Color>("color", Color::black(), {});
    EXPECT_EQ(states.size(), 2u);

    states.sweep();
    EXPECT_EQ(states.size(), 2u);

    states.get<float>("width", 1.f, {});
    states.sweep();
    EXPECT_EQ(states.size(), 1u);
    states.sweep();
    EXPECT_EQ(states.size(), 0u);
}
