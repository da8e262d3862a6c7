#pragma once

#include "core/keymap.hpp"
#include "config.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace SimonSays {

enum class MouseButton {
    Left,
    Right
};

std::string buttonName(MouseButton button);
std::optional<MouseButton> parseButton(const std::string& name);

// Hook button index (0 left, 1 right) to a script button
std::optional<MouseButton> buttonFromIndex(int index);

// Move the pointer to a location name or a "(x,y)" literal
struct MoveTo {
    std::string target;
    bool operator==(const MoveTo& o) const { return target == o.target; }
};

struct Click {
    MouseButton button = MouseButton::Left;
    std::optional<std::string> location;
    bool operator==(const Click& o) const { return button == o.button && location == o.location; }
};

struct ClickAndHold {
    MouseButton button = MouseButton::Left;
    std::optional<std::string> location;
    double duration = DEFAULT_HOLD_DURATION;
    bool operator==(const ClickAndHold& o) const {
        return button == o.button && location == o.location && duration == o.duration;
    }
};

struct Drag {
    MouseButton button = MouseButton::Left;
    std::string from;
    std::string to;
    bool operator==(const Drag& o) const { return button == o.button && from == o.from && to == o.to; }
};

// Key press with modifiers held; modifiers are kept in canonical order
struct Press {
    std::vector<Modifier> modifiers;
    std::string key;
    bool operator==(const Press& o) const { return modifiers == o.modifiers && key == o.key; }
};

struct Type {
    std::string text;
    bool operator==(const Type& o) const { return text == o.text; }
};

// Type followed by return
struct TypeLine {
    std::string text;
    bool operator==(const TypeLine& o) const { return text == o.text; }
};

// Verbatim lines pasted one at a time
struct TypeCodeBlock {
    std::vector<std::string> lines;
    bool operator==(const TypeCodeBlock& o) const { return lines == o.lines; }
};

struct Wait {
    double seconds = 0.0;
    bool operator==(const Wait& o) const { return seconds == o.seconds; }
};

struct Comment {
    std::string text;
    bool operator==(const Comment& o) const { return text == o.text; }
};

using Command = std::variant<MoveTo, Click, ClickAndHold, Drag, Press,
                             Type, TypeLine, TypeCodeBlock, Wait, Comment>;

// Commands in execution order
using Script = std::vector<Command>;

// Location names a command refers to, in the order they are used.
// MoveTo targets that parse as point literals are not names.
std::vector<std::string> referencedLocations(const Command& command);

bool isComment(const Command& command);

} // namespace SimonSays
