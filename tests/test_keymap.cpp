#include <catch2/catch.hpp>

#include "core/input_event.hpp"
#include "core/keymap.hpp"

using namespace SimonSays;

TEST_CASE("Characters map to key strokes on a US layout", "[keymap]") {
    auto lower = keyStrokeForChar('a');
    REQUIRE(lower);
    CHECK(lower->vkCode == 'A');
    CHECK_FALSE(lower->shift);

    auto upper = keyStrokeForChar('A');
    REQUIRE(upper);
    CHECK(upper->vkCode == 'A');
    CHECK(upper->shift);

    auto question = keyStrokeForChar('?');
    REQUIRE(question);
    CHECK(question->vkCode == 0xBF);
    CHECK(question->shift);

    auto bang = keyStrokeForChar('!');
    REQUIRE(bang);
    CHECK(bang->vkCode == '1');
    CHECK(bang->shift);

    CHECK(keyStrokeForChar(' ')->vkCode == Vk::Space);
    CHECK(keyStrokeForChar('\n')->vkCode == Vk::Return);
    CHECK(keyStrokeForChar('\t')->vkCode == Vk::Tab);
    CHECK_FALSE(keyStrokeForChar('\x01'));
}

TEST_CASE("Key names resolve with aliases", "[keymap]") {
    CHECK(keyCodeForName("return") == Vk::Return);
    CHECK(keyCodeForName("enter") == Vk::Return);
    CHECK(keyCodeForName("ESC") == Vk::Escape);
    CHECK(keyCodeForName("f5") == 0x74);
    CHECK(keyCodeForName("s") == 'S');
    CHECK(keyCodeForName("S") == 'S');
    CHECK(keyCodeForName(";") == 0xBA);
    CHECK(keyCodeForName("cmd") == Vk::LWin);
    CHECK_FALSE(keyCodeForName("hyper"));
    // Shifted symbols are not keys of their own
    CHECK_FALSE(keyCodeForName("?"));
}

TEST_CASE("Recorded keys are named the way press commands spell them", "[keymap]") {
    CHECK(keyName(Vk::Space) == "space");
    CHECK(keyName('S') == "s");
    CHECK(keyName('7') == "7");
    CHECK(keyName(0xBE) == ".");
    CHECK(keyName(Vk::Back) == "backspace");
    CHECK(keyName(Vk::PageDown) == "pagedown");
    CHECK_FALSE(keyName(Vk::Shift));

    CHECK(shiftedCharacter('q') == 'Q');
    CHECK(shiftedCharacter('9') == '(');
    CHECK(shiftedCharacter('\'') == '"');
}

TEST_CASE("Modifiers keep canonical order", "[keymap]") {
    CHECK(parseModifier("Command") == Modifier::Cmd);
    CHECK(parseModifier("alt") == Modifier::Option);
    CHECK_FALSE(parseModifier("meta"));

    auto modifiers = normalizeModifiers({Modifier::Shift, Modifier::Cmd, Modifier::Shift});
    CHECK(modifiers == std::vector<Modifier>{Modifier::Cmd, Modifier::Shift});

    auto fromFlags = modifiersFromFlags(ModifierFlag::OPTION | ModifierFlag::CTRL);
    CHECK(fromFlags == std::vector<Modifier>{Modifier::Ctrl, Modifier::Option});

    CHECK(isModifierKey(Vk::LControl));
    CHECK(isModifierKey(Vk::RWin));
    CHECK_FALSE(isModifierKey('A'));
}
