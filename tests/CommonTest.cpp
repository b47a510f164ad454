#include <Canvas.h>
#include <Color.h>
#include <Config.h>
#include <EventEmitter.h>
#include <Formatting.h>
#include <Geometry.h>
#include <Logger.h>
#include <MonospaceMeasurer.h>
#include <Result.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace tessel;

namespace {

// argv/envp style arrays over owned strings
class Args
{
public:
    Args(std::vector<std::string> strings)
        : mStrings(std::move(strings))
    {
        for (auto& str : mStrings) {
            mPointers.push_back(str.data());
        }
        mPointers.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(mPointers.size() - 1); }
    char** argv() { return mPointers.data(); }

private:
    std::vector<std::string> mStrings;
    std::vector<char*> mPointers;
};

} // anonymous namespace

TEST(ConfigTest, ArgumentsAndTypes)
{
    Args args({ "tessel", "--width=320", "--scale", "1.5", "--title", "hello world", "--verbose", "--no-vsync", "-ab", "file.tss" });
    auto config = Config::parse(args.argc(), args.argv(), nullptr, "TESSEL_");
    ASSERT_TRUE(config.ok());

    EXPECT_EQ(config->value<int64_t>("width"), 320);
    EXPECT_FLOAT_EQ(config->value<float>("width"), 320.f);
    EXPECT_DOUBLE_EQ(config->value<double>("scale"), 1.5);
    EXPECT_EQ(config->value<std::string>("title"), "hello world");
    EXPECT_TRUE(config->value<bool>("verbose"));
    EXPECT_TRUE(config->has("vsync"));
    EXPECT_FALSE(config->value<bool>("vsync", true));
    EXPECT_TRUE(config->value<bool>("a"));
    EXPECT_TRUE(config->value<bool>("b"));
    ASSERT_EQ(config->positionalSize(), 1u);
    EXPECT_EQ(config->positional(0), "file.tss");
    EXPECT_EQ(config->positional(3), "");
}

TEST(ConfigTest, DefaultsForMissingAndMistypedValues)
{
    Args args({ "tessel", "--title=hello" });
    auto config = Config::parse(args.argc(), args.argv(), nullptr, "TESSEL_");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->value<int64_t>("frames", 10), 10);
    EXPECT_EQ(config->value<int64_t>("title", 7), 7);
}

TEST(ConfigTest, EnvironmentIsOverriddenByArguments)
{
    Args args({ "tessel", "--height", "200" });
    Args env({ "TESSEL_LOG_LEVEL=debug", "TESSEL_HEIGHT=100", "TESSEL_FRAMES=0x10", "HOME=/root" });
    auto config = Config::parse(args.argc(), args.argv(), env.argv(), "TESSEL_");
    ASSERT_TRUE(config.ok());
    EXPECT_EQ(config->value<std::string>("log-level"), "debug");
    EXPECT_EQ(config->value<int64_t>("height"), 200);
    EXPECT_EQ(config->value<int64_t>("frames"), 16);
    EXPECT_FALSE(config->has("home"));
}

TEST(ConfigTest, EverythingAfterDoubleDashIsPositional)
{
    Args args({ "tessel", "--", "--width=3", "-x" });
    auto config = Config::parse(args.argc(), args.argv(), nullptr, "TESSEL_");
    ASSERT_TRUE(config.ok());
    EXPECT_FALSE(config->has("width"));
    EXPECT_EQ(config->positionalSize(), 2u);
}

TEST(ConfigTest, Errors)
{
    Args missing({ "tessel", "--=3" });
    auto config = Config::parse(missing.argc(), missing.argv(), nullptr, "TESSEL_");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().message, "missing key in argument 1");

    Args bad({ "tessel", "-a?" });
    config = Config::parse(bad.argc(), bad.argv(), nullptr, "TESSEL_");
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.error().message, "unexpected character '?' in argument 1");
}

TEST(ResultTest, ValuesAndErrors)
{
    Result<std::string> value(std::string("tessel"));
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(value->size(), 6u);
    EXPECT_EQ(std::move(value).data(), "tessel");

    Result<std::string> failed = makeError("bad input", Span { 4, 2 });
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(fmt::format("{}", failed.error()), "bad input (at 4+2)");

    Result<void> plain = makeError("no span");
    EXPECT_FALSE(plain.ok());
    EXPECT_FALSE(plain.error().span.has_value());
    EXPECT_EQ(fmt::format("{}", plain.error()), "no span");
    EXPECT_TRUE(Result<void>().ok());
}

TEST(LoggerTest, LogLevels)
{
    EXPECT_TRUE(setLogLevel("warning"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_FALSE(setLogLevel("chatty"));
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
    EXPECT_TRUE(setLogLevel("info"));
}

TEST(ColorTest, Parse)
{
    EXPECT_EQ(parseColor("#fff"), Color::white());
    EXPECT_EQ(parseColor("#000000"), Color::black());
    EXPECT_EQ(parseColor("#ff000080")->a, 128.f / 255.f);
    EXPECT_EQ(parseColor("rgb(255, 0, 255)"), Color::rgba(1.f, 0.f, 1.f));
    EXPECT_EQ(parseColor("rgba(0,0,0,0)"), Color::transparent());
    EXPECT_FALSE(parseColor("#ggg").has_value());
    EXPECT_FALSE(parseColor("#12345").has_value());
    EXPECT_FALSE(parseColor("#-ff").has_value());
    EXPECT_FALSE(parseColor("# ff").has_value());
    EXPECT_FALSE(parseColor("#+fffff").has_value());
    EXPECT_FALSE(parseColor("rgb(inf, 0, 0)").has_value());
    EXPECT_FALSE(parseColor("rgb(1, 2)").has_value());
    EXPECT_FALSE(parseColor("rgb(1, 2, 3) x").has_value());
    EXPECT_FALSE(parseColor("red").has_value());
}

TEST(ColorTest, MixAndPremultiply)
{
    const Color half = mix(Color::black(), Color::rgba(1.f, 0.5f, 0.f, 0.f), 0.5f);
    EXPECT_FLOAT_EQ(half.r, 0.5f);
    EXPECT_FLOAT_EQ(half.g, 0.25f);
    EXPECT_FLOAT_EQ(half.a, 0.5f);

    const Color pre = premultiplied(Color::rgba(1.f, 0.5f, 0.f, 0.5f));
    EXPECT_FLOAT_EQ(pre.r, 0.5f);
    EXPECT_FLOAT_EQ(pre.g, 0.25f);
    EXPECT_FLOAT_EQ(pre.a, 0.5f);
}

TEST(GeometryTest, AffineAndRects)
{
    const Affine moved = Affine::translate({ 10.f, 5.f }) * Affine::scale(2.f, 2.f);
    EXPECT_EQ(moved.apply({ 1.f, 1.f }), (Point { 12.f, 7.f }));
    EXPECT_EQ(transformRect(moved, { 0.f, 0.f, 4.f, 3.f }), (Rect { 10.f, 5.f, 8.f, 6.f }));

    const Rect rect = { 0.f, 0.f, 10.f, 10.f };
    EXPECT_TRUE(rect.contains({ 0.f, 0.f }));
    EXPECT_TRUE(rect.contains({ 9.5f, 9.5f }));
    EXPECT_FALSE(rect.contains({ 10.f, 5.f }));
    EXPECT_FALSE(rect.contains({ -1.f, 5.f }));
}

TEST(CanvasTest, ClipsIntersectUnderTheTransform)
{
    Canvas canvas;
    canvas.save();
    canvas.transform(Affine::translate({ 10.f, 10.f }));
    canvas.clip({ 0.f, 0.f, 20.f, 20.f });
    canvas.clip({ 15.f, 15.f, 20.f, 20.f });
    canvas.fillRect({ 0.f, 0.f, 50.f, 50.f }, Color::black());
    canvas.restore();
    canvas.fillRect({ 0.f, 0.f, 50.f, 50.f }, Color::black());

    ASSERT_EQ(canvas.primitives().size(), 2u);
    const auto& clip = canvas.primitives()[0].clip;
    ASSERT_TRUE(clip.has_value());
    EXPECT_FLOAT_EQ(clip->x, 25.f);
    EXPECT_FLOAT_EQ(clip->y, 25.f);
    EXPECT_FLOAT_EQ(clip->width, 5.f);
    EXPECT_FLOAT_EQ(clip->height, 5.f);
    EXPECT_FALSE(canvas.primitives()[1].clip.has_value());
    EXPECT_FALSE(canvas.currentClip().has_value());

    // disjoint clips leave an empty rect, not a negative one
    canvas.save();
    canvas.clip({ 0.f, 0.f, 10.f, 10.f });
    canvas.clip({ 20.f, 20.f, 10.f, 10.f });
    ASSERT_TRUE(canvas.currentClip().has_value());
    EXPECT_FLOAT_EQ(canvas.currentClip()->width, 0.f);
    EXPECT_FLOAT_EQ(canvas.currentClip()->height, 0.f);
    canvas.restore();
}

TEST(EventEmitterTest, ConnectEmitDisconnect)
{
    EventEmitter<void(int)> emitter;
    std::vector<int> seen;
    const auto first = emitter.connect([&seen](int value) { seen.push_back(value); });
    emitter.connect([&seen](int value) { seen.push_back(value * 10); });
    EXPECT_NE(first, 0u);
    EXPECT_EQ(emitter.size(), 2u);

    emitter.emit(2);
    EXPECT_EQ(seen, (std::vector<int> { 2, 20 }));

    EXPECT_TRUE(emitter.disconnect(first));
    EXPECT_FALSE(emitter.disconnect(first));
    emitter.emit(3);
    EXPECT_EQ(seen, (std::vector<int> { 2, 20, 30 }));

    emitter.disconnectAll();
    emitter.emit(4);
    EXPECT_EQ(seen.size(), 3u);
}

TEST(EventEmitterTest, SlotsMayDisconnectWhileEmitting)
{
    EventEmitter<void()> emitter;
    int calls = 0;
    EventEmitter<void()>::ConnectKey key = 0;
    key = emitter.connect([&]() {
        ++calls;
        emitter.disconnect(key);
    });
    emitter.emit();
    emitter.emit();
    EXPECT_EQ(calls, 1);
}

TEST(MonospaceMeasurerTest, WrapsAtWordBoundaries)
{
    MonospaceMeasurer measurer;
    FontAttributes font;
    font.size = 10.f;

    const TextMetrics metrics = measurer.measure("hello world", font, 40.f);
    ASSERT_EQ(metrics.lines.size(), 2u);
    EXPECT_EQ(metrics.lines[0].start, 0u);
    EXPECT_EQ(metrics.lines[0].length, 5u);
    EXPECT_EQ(metrics.lines[1].start, 6u);
    EXPECT_EQ(metrics.lines[1].length, 5u);
    EXPECT_FLOAT_EQ(metrics.size.width, 25.f);
    EXPECT_FLOAT_EQ(metrics.size.height, 24.f);
    EXPECT_FLOAT_EQ(metrics.lines[0].baseline, 10.f);
    EXPECT_FLOAT_EQ(metrics.lines[1].baseline, 22.f);
}

TEST(MonospaceMeasurerTest, NewlinesAndUnboundedWidth)
{
    MonospaceMeasurer measurer;
    FontAttributes font;
    font.size = 10.f;

    const TextMetrics metrics = measurer.measure("ab\ncd e", font, Infinity);
    ASSERT_EQ(metrics.lines.size(), 2u);
    EXPECT_FLOAT_EQ(metrics.lines[1].width, 20.f);
    EXPECT_FLOAT_EQ(metrics.size.width, 20.f);

    // a multi-byte character advances once
    EXPECT_FLOAT_EQ(measurer.measure("\xc3\xa9t\xc3\xa9", font, Infinity).size.width, 15.f);
    EXPECT_EQ(measurer.measure("", font, Infinity).lines.size(), 1u);
}
