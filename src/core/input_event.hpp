#pragma once

#include <cstdint>
#include <functional>

namespace SimonSays {

// Input event types
enum class InputEventType {
    KeyDown,
    KeyUp,
    MouseMove,
    MouseButtonDown,
    MouseButtonUp,
    MouseWheel
};

// Modifier bits carried by key and mouse events
namespace ModifierFlag {
    constexpr uint32_t CMD = 0x1;
    constexpr uint32_t CTRL = 0x2;
    constexpr uint32_t SHIFT = 0x4;
    constexpr uint32_t OPTION = 0x8;
}

// Input event data
struct InputEvent {
    InputEventType type = InputEventType::MouseMove;
    int vkCode = 0;         // Virtual key code for keyboard
    int scanCode = 0;       // Scan code for keyboard
    int x = 0;              // Mouse X position (absolute)
    int y = 0;              // Mouse Y position (absolute)
    int button = 0;         // Mouse button (0=left, 1=right, 2=middle)
    int wheelDelta = 0;     // Mouse wheel delta
    uint32_t modifiers = 0; // ModifierFlag bits held when the event fired
    uint64_t timestamp = 0; // Milliseconds
};

// Callback type for input events. Returning true consumes the event.
using InputCallback = std::function<bool(const InputEvent&)>;

struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

} // namespace SimonSays
