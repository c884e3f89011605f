#include "input/xkb_keymap.hpp"
#include "runtime/app_channel.hpp"

#include <catch2/catch_test_macros.hpp>
#include <xkbcommon/xkbcommon-keysyms.h>

using namespace kiln;

namespace {

// evdev codes
constexpr uint32_t ESC = 1;
constexpr uint32_t ENTER = 28;
constexpr uint32_t LEFT_CTRL = 29;
constexpr uint32_t A = 30;
constexpr uint32_t LEFT_SHIFT = 42;
constexpr uint32_t CAPS_LOCK = 58;

auto us_keymap() -> std::unique_ptr<input::XkbKeymap> {
    auto keymap = input::XkbKeymap::create(input::XkbRules{.layout = "us"});
    REQUIRE(keymap);
    return std::move(*keymap);
}

} // namespace

TEST_CASE("XkbKeymap describes unmodified keys", "[input][xkb]") {
    auto keymap = us_keymap();
    REQUIRE(keymap->native() != nullptr);

    auto a = keymap->describe(A);
    REQUIRE(a.keysym == XKB_KEY_a);
    REQUIRE(a.name == "a");
    REQUIRE(a.text == "a");

    auto esc = keymap->describe(ESC);
    REQUIRE(esc.keysym == XKB_KEY_Escape);
    REQUIRE(esc.name == "Escape");
    REQUIRE(esc.text == "\x1b");

    REQUIRE(keymap->describe(ENTER).text == "\r");
}

TEST_CASE("XkbKeymap applies held shift to text and keysym", "[input][xkb]") {
    auto keymap = us_keymap();
    auto state = keymap->update_key(LEFT_SHIFT, true);
    REQUIRE(state.portable == runtime::modifier::shift);
    REQUIRE(state.depressed != 0);

    auto a = keymap->describe(A);
    REQUIRE(a.keysym == XKB_KEY_A);
    REQUIRE(a.text == "A");

    state = keymap->update_key(LEFT_SHIFT, false);
    REQUIRE(state.portable == 0);
    REQUIRE(keymap->describe(A).text == "a");
}

TEST_CASE("XkbKeymap reports ctrl as a portable modifier", "[input][xkb]") {
    auto keymap = us_keymap();
    keymap->update_key(LEFT_CTRL, true);
    REQUIRE(keymap->modifiers().portable == runtime::modifier::ctrl);
    REQUIRE(keymap->describe(A).keysym == XKB_KEY_a);

    keymap->update_key(LEFT_CTRL, false);
    REQUIRE(keymap->modifiers() == input::ModifierState{});
}

TEST_CASE("XkbKeymap keeps caps lock latched across release", "[input][xkb]") {
    auto keymap = us_keymap();
    keymap->update_key(CAPS_LOCK, true);
    auto state = keymap->update_key(CAPS_LOCK, false);

    REQUIRE(state.locked != 0);
    REQUIRE(state.depressed == 0);
    REQUIRE((state.portable & runtime::modifier::caps_lock) != 0);
    REQUIRE(keymap->describe(A).text == "A");
}

TEST_CASE("XkbKeymap returns no text for keys without a symbol", "[input][xkb]") {
    auto keymap = us_keymap();
    auto unknown = keymap->describe(0);
    REQUIRE(unknown.keysym == XKB_KEY_NoSymbol);
    REQUIRE(unknown.text.empty());
}

TEST_CASE("XkbKeymap rejects a layout it cannot compile", "[input][xkb]") {
    auto keymap = input::XkbKeymap::create(input::XkbRules{.layout = "no-such-layout-kiln"});
    REQUIRE_FALSE(keymap);
    REQUIRE(keymap.error().code == ErrorCode::input_init_failed);
}
