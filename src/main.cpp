#include <AnyView.h>
#include <Block.h>
#include <Button.h>
#include <Canvas.h>
#include <Config.h>
#include <Container.h>
#include <Flex.h>
#include <Logger.h>
#include <Pad.h>
#include <Stack.h>
#include <Text.h>
#include <Ui.h>
#include <Wrap.h>
#include <fmt/core.h>
#include <cstdint>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

using namespace tessel;

struct Counter
{
    int64_t count = 0;
};

static const char* DefaultStylesheet = R"(
container.root {
    container.padding: 16px;
    container.background: #f4f4f4;

    stack {
        stack.gap: 8px;
        stack.align: center;
    }
    text.title {
        text.font-size: 20px;
        text.color: #222;
    }
}

button {
    button.background: #3a7bd5 150ms ease-out;
    button.radius: 6px;
    text {
        text.color: #fff;
    }
    &:hover {
        button.background: #5592e6 150ms ease-out;
    }
    &:active {
        button.background: #2c5fa8 80ms;
    }
}

wrap {
    wrap.row-gap: 4px;
    wrap.column-gap: 4px;
    block.radius: 2px;
}

block.odd {
    block.color: #d5573a;
}
)";

static BoxedView<Counter> tag(int64_t idx)
{
    if (idx % 5 == 4) {
        return boxed<Counter>(Text(fmt::format("{}", idx + 1)));
    }
    return boxed<Counter>(Block({ 12.f, 12.f }).classes({ idx % 2 ? "odd" : "even" }));
}

static auto counterView(Counter& counter)
{
    std::vector<BoxedView<Counter>> tags;
    for (int64_t idx = 0; idx < counter.count; ++idx) {
        tags.push_back(tag(idx));
    }

    return container(vstack(std::tuple {
        Text("tessel").classes({ "title" }),
        hstack(std::tuple {
            button(Text("increment"), [](Counter& c) { ++c.count; }),
            button(Text("reset"), [](Counter& c) { c.count = 0; }).classes({ "secondary" }),
            expand(1.f, Block({ 0.f, 1.f }, Color::transparent()))
        }),
        Text(fmt::format("clicked {} times", counter.count)),
        pad(Padding::symmetric(4.f, 0.f), hwrap(std::move(tags)))
    })).classes({ "root" });
}

using CounterView = decltype(counterView(std::declval<Counter&>()));

static std::optional<Point> findText(const Canvas& canvas, const std::string& text)
{
    for (const auto& primitive : canvas.primitives()) {
        if (primitive.type == Primitive::Type::Text && primitive.text == text) {
            // origin is on the baseline, step up into the glyphs
            return primitive.transform.apply({ primitive.rect.x + 2.f, primitive.rect.y - 2.f });
        }
    }
    return {};
}

static void dump(const Canvas& canvas)
{
    for (const auto& primitive : canvas.primitives()) {
        const Rect rect = transformRect(primitive.transform, primitive.rect);
        switch (primitive.type) {
        case Primitive::Type::FillRect:
            spdlog::info("fill {} {} radius {}", rect, primitive.color, primitive.radius);
            break;
        case Primitive::Type::StrokeRect:
            spdlog::info("stroke {} {} width {}", rect, primitive.color, primitive.strokeWidth);
            break;
        case Primitive::Type::Text:
            spdlog::info("text \"{}\" at {} size {} {}", primitive.text, Point { rect.x, rect.y }, primitive.font.size, primitive.color);
            break;
        }
    }
}

int main(int argc, char** argv, char** envp)
{
    auto config = Config::parse(argc, argv, envp, "TESSEL_");
    if (!config.ok()) {
        fmt::print(stderr, "tessel -- {}\n", config.error());
        return 1;
    }

    const auto level = config->value<std::string>("log-level", "info");
    if (!setLogLevel(level)) {
        fmt::print(stderr, "tessel -- invalid log level {}\n", level);
    }

    const Size size = { config->value<float>("width", 640.f), config->value<float>("height", 480.f) };
    const int64_t frames = config->value<int64_t>("frames", 10);

    Ui<Counter, CounterView> ui(Counter {}, counterView, size);
    ui.window().onCursorChanged().connect([](Cursor cursor) {
        spdlog::info("cursor changed to {}", static_cast<int>(cursor));
    });
    ui.onAnimationRequested().connect([]() {
        spdlog::trace("animation requested");
    });

    const auto loaded = config->has("stylesheet")
        ? ui.loadStylesheetFile(config->value<std::string>("stylesheet"))
        : ui.loadStylesheet(DefaultStylesheet);
    if (!loaded.ok()) {
        return 1;
    }

    Canvas canvas;
    ui.render(canvas);

    // hover the increment button and click it a few times
    const auto target = findText(canvas, "increment");
    if (!target) {
        spdlog::error("no increment button in the display list");
        return 1;
    }
    ui.pointerMoved(*target);
    for (int i = 0; i < 7; ++i) {
        ui.pointerPressed(PointerButton::Primary);
        ui.pointerReleased(PointerButton::Primary);
    }

    for (int64_t frame = 0; frame < frames; ++frame) {
        ui.render(canvas);
        if (!ui.needsAnimate()) {
            spdlog::debug("idle after {} frames", frame + 1);
            break;
        }
        ui.animate(1.f / 60.f);
    }

    spdlog::info("count is {}, {} primitives in the last frame", ui.data().count, canvas.primitives().size());
    dump(canvas);
    return 0;
}
