#include "input/fake_keymap.hpp"
#include "input/input_translator.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace kiln;
using kiln::input::KeyAction;
using kiln::test::key_event;

namespace {

struct Fixture {
    test::FakeKeymap keymap;
    test::RecordingSink sink;
    runtime::AppChannel channel;
    input::InputTranslator translator;

    explicit Fixture(bool vt_switching = true)
        : translator(keymap, input::TranslatorSettings{.shutdown_keysym = XKB_KEY_Escape,
                                                       .vt_switching = vt_switching}) {
        translator.set_sink(&sink);
    }

    auto press(uint32_t code) -> input::KeyDisposition {
        return translator.on_raw_event(key_event(code, true), channel);
    }
    auto release(uint32_t code) -> input::KeyDisposition {
        return translator.on_raw_event(key_event(code, false), channel);
    }
};

} // namespace

TEST_CASE("InputTranslator forwards ordinary keys", "[input]") {
    Fixture fx;
    REQUIRE(fx.press(test::KEY_A).action == KeyAction::forwarded);
    REQUIRE(fx.release(test::KEY_A).action == KeyAction::forwarded);

    REQUIRE(fx.sink.keys.size() == 2);
    REQUIRE(fx.sink.keys[0].keycode == test::KEY_A);
    REQUIRE(fx.sink.keys[0].pressed);
    REQUIRE_FALSE(fx.sink.keys[1].pressed);

    auto keys = fx.channel.drain_keys();
    REQUIRE(keys.size() == 2);
    REQUIRE(keys[0].keysym == XKB_KEY_a);
    REQUIRE(keys[0].text == "a");
    REQUIRE_FALSE(fx.channel.exit_requested().has_value());
}

TEST_CASE("InputTranslator turns the shutdown key into an exit request", "[input]") {
    Fixture fx;
    auto disposition = fx.press(test::KEY_ESC);

    REQUIRE(disposition.action == KeyAction::shutdown);
    REQUIRE(fx.channel.exit_requested() == runtime::AppExit::success);
    REQUIRE(fx.sink.keys.empty());
    REQUIRE(fx.channel.drain_keys().empty());

    SECTION("Its release is consumed too") {
        REQUIRE(fx.release(test::KEY_ESC).action == KeyAction::ignored);
        REQUIRE(fx.sink.keys.empty());
        REQUIRE(fx.translator.stats().consumed == 2);
    }
}

TEST_CASE("InputTranslator shutdown key ignores shortcut inhibitors", "[input]") {
    Fixture fx;
    fx.sink.inhibited = true;
    REQUIRE(fx.press(test::KEY_ESC).action == KeyAction::shutdown);
    REQUIRE(fx.channel.exit_requested() == runtime::AppExit::success);
}

TEST_CASE("InputTranslator consumes VT switch keys", "[input]") {
    SECTION("Enabled") {
        Fixture fx;
        auto disposition = fx.press(test::KEY_F3);
        REQUIRE(disposition.action == KeyAction::vt_switch);
        REQUIRE(disposition.vt == 3);
        REQUIRE(fx.sink.keys.empty());
        REQUIRE(fx.release(test::KEY_F3).action == KeyAction::ignored);
    }

    SECTION("Disabled in config") {
        Fixture fx(false);
        REQUIRE(fx.press(test::KEY_F1).action == KeyAction::forwarded);
        REQUIRE(fx.sink.keys.size() == 1);
    }

    SECTION("Inhibited by the focused client") {
        Fixture fx;
        fx.sink.inhibited = true;
        REQUIRE(fx.press(test::KEY_F1).action == KeyAction::forwarded);
        REQUIRE(fx.sink.keys.size() == 1);
    }
}

TEST_CASE("InputTranslator publishes modifier changes once", "[input]") {
    Fixture fx;
    fx.press(test::KEY_LEFTSHIFT);
    REQUIRE(fx.sink.modifier_updates.size() == 1);
    REQUIRE(fx.translator.modifiers().portable == runtime::modifier::shift);

    fx.press(test::KEY_A);
    REQUIRE(fx.sink.modifier_updates.size() == 1);
    auto keys = fx.channel.drain_keys();
    REQUIRE(keys.back().modifiers == runtime::modifier::shift);

    fx.release(test::KEY_LEFTSHIFT);
    REQUIRE(fx.sink.modifier_updates.size() == 2);
    REQUIRE(fx.translator.modifiers().portable == 0);
}

TEST_CASE("InputTranslator counts and ignores pointer events", "[input]") {
    Fixture fx;
    input::RawInputEvent motion;
    motion.type = input::RawInputType::pointer_motion;
    motion.dx = 3.0;

    REQUIRE(fx.translator.on_raw_event(motion, fx.channel).action == KeyAction::ignored);
    REQUIRE(fx.translator.stats().pointer == 1);
    REQUIRE(fx.sink.keys.empty());
}

TEST_CASE("InputTranslator works without a sink", "[input]") {
    Fixture fx;
    fx.translator.set_sink(nullptr);
    REQUIRE(fx.press(test::KEY_A).action == KeyAction::forwarded);
    REQUIRE(fx.channel.drain_keys().size() == 1);
}
