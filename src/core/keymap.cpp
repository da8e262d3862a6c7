#include "keymap.hpp"
#include "input_event.hpp"
#include "utils/strings.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace SimonSays {

namespace {

// Named keys the recorder emits as "press <name>"
const std::unordered_map<int, std::string>& specialKeys() {
    static const std::unordered_map<int, std::string> keys = {
        {Vk::Return, "return"},
        {Vk::Tab, "tab"},
        {Vk::Escape, "escape"},
        {Vk::Back, "backspace"},
        {Vk::Delete, "delete"},
        {Vk::Up, "up"},
        {Vk::Down, "down"},
        {Vk::Left, "left"},
        {Vk::Right, "right"},
        {Vk::Home, "home"},
        {Vk::End, "end"},
        {Vk::PageUp, "pageup"},
        {Vk::PageDown, "pagedown"},
        {0x70, "f1"}, {0x71, "f2"}, {0x72, "f3"}, {0x73, "f4"},
        {0x74, "f5"}, {0x75, "f6"}, {0x76, "f7"}, {0x77, "f8"},
        {0x78, "f9"}, {0x79, "f10"}, {0x7A, "f11"}, {0x7B, "f12"},
    };
    return keys;
}

// OEM keys on a US layout
const std::unordered_map<int, char>& punctuationKeys() {
    static const std::unordered_map<int, char> keys = {
        {0xBA, ';'},
        {0xBB, '='},
        {0xBC, ','},
        {0xBD, '-'},
        {0xBE, '.'},
        {0xBF, '/'},
        {0xC0, '`'},
        {0xDB, '['},
        {0xDC, '\\'},
        {0xDD, ']'},
        {0xDE, '\''},
    };
    return keys;
}

const std::unordered_map<char, char>& shiftMap() {
    static const std::unordered_map<char, char> map = {
        {'1', '!'}, {'2', '@'}, {'3', '#'}, {'4', '$'}, {'5', '%'},
        {'6', '^'}, {'7', '&'}, {'8', '*'}, {'9', '('}, {'0', ')'},
        {'-', '_'}, {'=', '+'}, {'[', '{'}, {']', '}'}, {'\\', '|'},
        {';', ':'}, {'\'', '"'}, {',', '<'}, {'.', '>'}, {'/', '?'},
        {'`', '~'},
    };
    return map;
}

// Names accepted by "press" besides single characters
const std::unordered_map<std::string, int>& namedKeyCodes() {
    static const std::unordered_map<std::string, int> names = [] {
        std::unordered_map<std::string, int> result;
        for (const auto& entry : specialKeys()) {
            result[entry.second] = entry.first;
        }
        result["space"] = Vk::Space;
        result["enter"] = Vk::Return;
        result["esc"] = Vk::Escape;
        result["cmd"] = Vk::LWin;
        result["command"] = Vk::LWin;
        result["ctrl"] = Vk::Control;
        result["control"] = Vk::Control;
        result["shift"] = Vk::Shift;
        result["option"] = Vk::Menu;
        result["alt"] = Vk::Menu;
        return result;
    }();
    return names;
}

} // namespace

std::string modifierName(Modifier modifier) {
    switch (modifier) {
        case Modifier::Cmd: return "cmd";
        case Modifier::Ctrl: return "ctrl";
        case Modifier::Shift: return "shift";
        case Modifier::Option: return "option";
    }
    return "";
}

std::optional<Modifier> parseModifier(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "cmd" || lower == "command") return Modifier::Cmd;
    if (lower == "ctrl" || lower == "control") return Modifier::Ctrl;
    if (lower == "shift") return Modifier::Shift;
    if (lower == "option" || lower == "alt") return Modifier::Option;
    return std::nullopt;
}

int modifierKeyCode(Modifier modifier) {
    switch (modifier) {
        case Modifier::Cmd: return Vk::LWin;
        case Modifier::Ctrl: return Vk::Control;
        case Modifier::Shift: return Vk::Shift;
        case Modifier::Option: return Vk::Menu;
    }
    return 0;
}

std::vector<Modifier> modifiersFromFlags(uint32_t flags) {
    std::vector<Modifier> modifiers;
    if (flags & ModifierFlag::CMD) modifiers.push_back(Modifier::Cmd);
    if (flags & ModifierFlag::CTRL) modifiers.push_back(Modifier::Ctrl);
    if (flags & ModifierFlag::SHIFT) modifiers.push_back(Modifier::Shift);
    if (flags & ModifierFlag::OPTION) modifiers.push_back(Modifier::Option);
    return modifiers;
}

std::vector<Modifier> normalizeModifiers(std::vector<Modifier> modifiers) {
    std::sort(modifiers.begin(), modifiers.end());
    modifiers.erase(std::unique(modifiers.begin(), modifiers.end()), modifiers.end());
    return modifiers;
}

bool isModifierKey(int vkCode) {
    switch (vkCode) {
        case Vk::Shift: case Vk::LShift: case Vk::RShift:
        case Vk::Control: case Vk::LControl: case Vk::RControl:
        case Vk::Menu: case Vk::LMenu: case Vk::RMenu:
        case Vk::LWin: case Vk::RWin:
            return true;
        default:
            return false;
    }
}

std::optional<std::string> specialKeyName(int vkCode) {
    auto it = specialKeys().find(vkCode);
    if (it == specialKeys().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<char> baseCharacter(int vkCode) {
    if (vkCode >= 'A' && vkCode <= 'Z') {
        return static_cast<char>(vkCode - 'A' + 'a');
    }
    if (vkCode >= '0' && vkCode <= '9') {
        return static_cast<char>(vkCode);
    }
    if (vkCode == Vk::Space) {
        return ' ';
    }
    auto it = punctuationKeys().find(vkCode);
    if (it != punctuationKeys().end()) {
        return it->second;
    }
    return std::nullopt;
}

char shiftedCharacter(char base) {
    if (base >= 'a' && base <= 'z') {
        return static_cast<char>(base - 'a' + 'A');
    }
    auto it = shiftMap().find(base);
    return it != shiftMap().end() ? it->second : base;
}

std::optional<std::string> keyName(int vkCode) {
    if (vkCode == Vk::Space) {
        return std::string("space");
    }
    if (auto c = baseCharacter(vkCode)) {
        return std::string(1, *c);
    }
    return specialKeyName(vkCode);
}

std::optional<int> keyCodeForName(const std::string& name) {
    if (name.size() == 1) {
        auto stroke = keyStrokeForChar(static_cast<char>(std::tolower(static_cast<unsigned char>(name[0]))));
        if (stroke && !stroke->shift) {
            return stroke->vkCode;
        }
        return std::nullopt;
    }
    auto it = namedKeyCodes().find(toLower(name));
    if (it == namedKeyCodes().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<KeyStroke> keyStrokeForChar(char c) {
    if (c >= 'a' && c <= 'z') {
        return KeyStroke{c - 'a' + 'A', false};
    }
    if (c >= 'A' && c <= 'Z') {
        return KeyStroke{static_cast<int>(c), true};
    }
    if (c >= '0' && c <= '9') {
        return KeyStroke{static_cast<int>(c), false};
    }
    switch (c) {
        case ' ': return KeyStroke{Vk::Space, false};
        case '\n': return KeyStroke{Vk::Return, false};
        case '\t': return KeyStroke{Vk::Tab, false};
        default: break;
    }
    for (const auto& entry : punctuationKeys()) {
        if (entry.second == c) {
            return KeyStroke{entry.first, false};
        }
    }
    for (const auto& entry : shiftMap()) {
        if (entry.second != c) {
            continue;
        }
        if (auto base = keyStrokeForChar(entry.first)) {
            return KeyStroke{base->vkCode, true};
        }
    }
    return std::nullopt;
}

} // namespace SimonSays
