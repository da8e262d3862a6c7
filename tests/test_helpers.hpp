#pragma once

#include "core/input_event.hpp"
#include "player/input_sink.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace SimonSays::Test {

inline InputEvent mouseDown(int x, int y, uint64_t timeMs, int button = 0) {
    InputEvent event;
    event.type = InputEventType::MouseButtonDown;
    event.x = x;
    event.y = y;
    event.button = button;
    event.timestamp = timeMs;
    return event;
}

inline InputEvent mouseUp(int x, int y, uint64_t timeMs, int button = 0) {
    InputEvent event = mouseDown(x, y, timeMs, button);
    event.type = InputEventType::MouseButtonUp;
    return event;
}

inline InputEvent keyDown(int vkCode, uint64_t timeMs, uint32_t modifiers = 0) {
    InputEvent event;
    event.type = InputEventType::KeyDown;
    event.vkCode = vkCode;
    event.modifiers = modifiers;
    event.timestamp = timeMs;
    return event;
}

inline InputEvent keyUp(int vkCode, uint64_t timeMs, uint32_t modifiers = 0) {
    InputEvent event = keyDown(vkCode, timeMs, modifiers);
    event.type = InputEventType::KeyUp;
    return event;
}

// Records what the player sends and tracks the pointer like the OS would
class FakeSink : public InputSink {
public:
    bool replay(const InputEvent& event) override {
        events.push_back(event);
        if (event.type == InputEventType::MouseMove) {
            cursor = Point{event.x, event.y};
        }
        return true;
    }

    Point cursorPosition() override { return cursor; }

    bool setClipboardText(const std::string& text) override {
        clipboard = text;
        clipboardWrites.push_back(text);
        return true;
    }

    std::optional<std::string> clipboardText() override { return clipboard; }

    std::vector<InputEvent> eventsOfType(InputEventType type) const {
        std::vector<InputEvent> result;
        for (const auto& event : events) {
            if (event.type == type) result.push_back(event);
        }
        return result;
    }

    // Key events as (vkCode, down) pairs
    std::vector<std::pair<int, bool>> keys() const {
        std::vector<std::pair<int, bool>> result;
        for (const auto& event : events) {
            if (event.type == InputEventType::KeyDown) result.emplace_back(event.vkCode, true);
            if (event.type == InputEventType::KeyUp) result.emplace_back(event.vkCode, false);
        }
        return result;
    }

    std::vector<InputEvent> events;
    Point cursor;
    std::optional<std::string> clipboard;
    std::vector<std::string> clipboardWrites;
};

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path()
            / ("simonsays_test_" + std::to_string(stamp) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string str(const std::string& child = "") const {
        return child.empty() ? m_path.string() : (m_path / child).string();
    }

private:
    std::filesystem::path m_path;
};

} // namespace SimonSays::Test
