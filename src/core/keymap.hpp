#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SimonSays {

// Windows virtual-key codes used by the recorder and the player
namespace Vk {
    constexpr int Back = 0x08;
    constexpr int Tab = 0x09;
    constexpr int Return = 0x0D;
    constexpr int Shift = 0x10;
    constexpr int Control = 0x11;
    constexpr int Menu = 0x12;  // Alt
    constexpr int Escape = 0x1B;
    constexpr int Space = 0x20;
    constexpr int PageUp = 0x21;
    constexpr int PageDown = 0x22;
    constexpr int End = 0x23;
    constexpr int Home = 0x24;
    constexpr int Left = 0x25;
    constexpr int Up = 0x26;
    constexpr int Right = 0x27;
    constexpr int Down = 0x28;
    constexpr int Delete = 0x2E;
    constexpr int LWin = 0x5B;
    constexpr int RWin = 0x5C;
    constexpr int F1 = 0x70;
    constexpr int F12 = 0x7B;
    constexpr int LShift = 0xA0;
    constexpr int RShift = 0xA1;
    constexpr int LControl = 0xA2;
    constexpr int RControl = 0xA3;
    constexpr int LMenu = 0xA4;
    constexpr int RMenu = 0xA5;
}

// Modifiers in the order they are written and pressed
enum class Modifier {
    Cmd,
    Ctrl,
    Shift,
    Option
};

std::string modifierName(Modifier modifier);
std::optional<Modifier> parseModifier(const std::string& name);
int modifierKeyCode(Modifier modifier);

// Modifiers present in an event's ModifierFlag bits, in canonical order
std::vector<Modifier> modifiersFromFlags(uint32_t flags);

// Sort into canonical order and drop duplicates
std::vector<Modifier> normalizeModifiers(std::vector<Modifier> modifiers);

// True for shift/ctrl/alt/windows keys on either side
bool isModifierKey(int vkCode);

// Named special key for a virtual-key code (return, tab, f5, ...)
std::optional<std::string> specialKeyName(int vkCode);

// Unshifted character produced by a virtual-key code
std::optional<char> baseCharacter(int vkCode);

// Character produced by a base character with shift held
char shiftedCharacter(char base);

// Name used in "press" commands: base character or special key name
std::optional<std::string> keyName(int vkCode);

// Virtual-key code for a key name (case-insensitive, aliases accepted)
std::optional<int> keyCodeForName(const std::string& name);

struct KeyStroke {
    int vkCode = 0;
    bool shift = false;
};

// How to produce a character on a US layout
std::optional<KeyStroke> keyStrokeForChar(char c);

} // namespace SimonSays
