#include <Button.h>
#include <Canvas.h>
#include <Container.h>
#include <Stack.h>
#include <Text.h>
#include <Ui.h>
#include <fmt/core.h>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <tuple>

using namespace tessel;

namespace {

struct Clicks
{
    int count = 0;
};

auto clickView(Clicks& clicks)
{
    return container(vstack(std::tuple {
        button(Text("press"), [](Clicks& c) { ++c.count; }),
        Text(fmt::format("{}", clicks.count))
    }));
}

using ClickView = decltype(clickView(std::declval<Clicks&>()));
using ClickUi = Ui<Clicks, ClickView>;

// a point inside the glyphs of the first text primitive showing text
std::optional<Point> findText(const Canvas& canvas, const std::string& text)
{
    for (const auto& primitive : canvas.primitives()) {
        if (primitive.type == Primitive::Type::Text && primitive.text == text) {
            return primitive.transform.apply({ primitive.rect.x + 2.f, primitive.rect.y - 2.f });
        }
    }
    return {};
}

const Primitive* firstFill(const Canvas& canvas)
{
    for (const auto& primitive : canvas.primitives()) {
        if (primitive.type == Primitive::Type::FillRect) {
            return &primitive;
        }
    }
    return nullptr;
}

class UiTest : public ::testing::Test
{
protected:
    UiTest()
        : ui(Clicks {}, clickView, { 200.f, 100.f })
    {
    }

    Point buttonPoint()
    {
        ui.render(canvas);
        const auto point = findText(canvas, "press");
        EXPECT_TRUE(point.has_value());
        return point.value_or(Point { -1.f, -1.f });
    }

    void click()
    {
        ui.pointerPressed(PointerButton::Primary);
        ui.pointerReleased(PointerButton::Primary);
    }

    ClickUi ui;
    Canvas canvas;
};

} // anonymous namespace

TEST_F(UiTest, RenderProducesPrimitives)
{
    ui.render(canvas);
    EXPECT_TRUE(findText(canvas, "press").has_value());
    EXPECT_TRUE(findText(canvas, "0").has_value());
    ASSERT_NE(firstFill(canvas), nullptr);
    EXPECT_FALSE(ui.needsLayout());
    EXPECT_FALSE(ui.needsDraw());
}

TEST_F(UiTest, HoveringAButtonShowsThePointer)
{
    int changes = 0;
    ui.window().onCursorChanged().connect([&changes](Cursor) { ++changes; });

    ui.pointerMoved(buttonPoint());
    EXPECT_EQ(ui.window().cursor(), Cursor::Pointer);
    EXPECT_EQ(changes, 1);

    // moving within the button keeps it
    ui.pointerMoved(buttonPoint());
    EXPECT_EQ(changes, 1);

    ui.pointerMoved({ 190.f, 90.f });
    EXPECT_FALSE(ui.window().hovered().has_value());
    EXPECT_EQ(ui.window().cursor(), Cursor::Default);
    EXPECT_EQ(changes, 2);
}

TEST_F(UiTest, ClickUpdatesTheData)
{
    ui.pointerMoved(buttonPoint());
    click();
    click();
    EXPECT_EQ(ui.data().count, 2);

    ui.render(canvas);
    EXPECT_TRUE(findText(canvas, "2").has_value());
    EXPECT_FALSE(findText(canvas, "0").has_value());
}

TEST_F(UiTest, ReleaseWithoutPressDoesNothing)
{
    const Point target = buttonPoint();
    ui.pointerMoved({ 190.f, 90.f });
    ui.pointerPressed(PointerButton::Primary);
    ui.pointerMoved(target);
    ui.pointerReleased(PointerButton::Primary);
    EXPECT_EQ(ui.data().count, 0);
}

TEST_F(UiTest, SecondaryButtonDoesNotClick)
{
    ui.pointerMoved(buttonPoint());
    ui.pointerPressed(PointerButton::Secondary);
    ui.pointerReleased(PointerButton::Secondary);
    EXPECT_EQ(ui.data().count, 0);
}

TEST_F(UiTest, KeysActivateTheFocusedButton)
{
    ui.pointerMoved(buttonPoint());
    click();
    ASSERT_TRUE(ui.window().focused().has_value());

    ui.key(KeyEvent { Key::Enter, true });
    EXPECT_EQ(ui.data().count, 1);
    ui.key(KeyEvent { Key::Enter, false });
    EXPECT_EQ(ui.data().count, 2);
    ui.key(KeyEvent { Key::Space, false });
    EXPECT_EQ(ui.data().count, 3);

    // a press on nothing takes the focus away
    ui.pointerMoved({ 190.f, 90.f });
    click();
    EXPECT_FALSE(ui.window().focused().has_value());
    ui.key(KeyEvent { Key::Enter, false });
    EXPECT_EQ(ui.data().count, 3);
}

TEST_F(UiTest, FailedStylesheetKeepsThePreviousOne)
{
    ASSERT_TRUE(ui.loadStylesheet("button { button.radius: 3px; }").ok());
    const uint64_t generation = ui.stylesheet().generation();

    const auto failed = ui.loadStylesheet("button { button.radius: 3px;");
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().message, "line 1, column 8: expected '}' to close block");
    EXPECT_EQ(ui.stylesheet().generation(), generation);
    EXPECT_EQ(ui.stylesheet().rules().size(), 1u);

    ui.render(canvas);
    const Primitive* fill = firstFill(canvas);
    ASSERT_NE(fill, nullptr);
    EXPECT_FLOAT_EQ(fill->radius, 3.f);
}

TEST_F(UiTest, MissingStylesheetFileIsAnError)
{
    EXPECT_FALSE(ui.loadStylesheetFile("/nonexistent/tessel/style.tss").ok());
    EXPECT_TRUE(ui.stylesheet().empty());
}

TEST_F(UiTest, StylesheetChangeRelayouts)
{
    ui.render(canvas);
    EXPECT_FALSE(ui.needsLayout());
    ASSERT_TRUE(ui.loadStylesheet("container { container.padding: 10px; }").ok());
    EXPECT_TRUE(ui.needsLayout());

    ui.render(canvas);
    const Primitive* fill = firstFill(canvas);
    ASSERT_NE(fill, nullptr);
    EXPECT_EQ(transformRect(fill->transform, fill->rect).x, 10.f);
}

TEST_F(UiTest, HoverTransitionAnimates)
{
    ASSERT_TRUE(ui.loadStylesheet(R"(
        button {
            button.background: #000;
            &:hover {
                button.background: #fff 100ms;
            }
        }
    )").ok());

    int requests = 0;
    ui.onAnimationRequested().connect([&requests]() { ++requests; });

    ui.pointerMoved(buttonPoint());
    EXPECT_EQ(requests, 0);
    ui.render(canvas);
    EXPECT_TRUE(ui.needsAnimate());
    EXPECT_GT(requests, 0);
    EXPECT_FLOAT_EQ(firstFill(canvas)->color.r, 0.f);

    ui.animate(0.05f);
    ui.render(canvas);
    EXPECT_NEAR(firstFill(canvas)->color.r, 0.5f, 1e-3f);
    EXPECT_TRUE(ui.needsAnimate());

    ui.animate(0.1f);
    EXPECT_FALSE(ui.needsAnimate());
    ui.render(canvas);
    EXPECT_FLOAT_EQ(firstFill(canvas)->color.r, 1.f);
    EXPECT_FALSE(ui.needsAnimate());
}

TEST_F(UiTest, ResizeRelayouts)
{
    ui.render(canvas);
    ui.resize({ 300.f, 50.f });
    EXPECT_EQ(ui.window().size(), (Size { 300.f, 50.f }));
    EXPECT_TRUE(ui.needsLayout());
}
