#pragma once

#include "player/input_sink.hpp"

namespace SimonSays {

// Synthesized input through SendInput, plus cursor and clipboard access
class InputReplay : public InputSink {
public:
    InputReplay();
    ~InputReplay() override = default;

    // Replay an input event on this machine
    bool replay(const InputEvent& event) override;

    Point cursorPosition() override;

    bool setClipboardText(const std::string& text) override;
    std::optional<std::string> clipboardText() override;

private:
    int m_screenWidth = 1920;
    int m_screenHeight = 1080;
    int m_screenLeft = 0;   // Virtual screen left offset (multi-monitor)
    int m_screenTop = 0;    // Virtual screen top offset (multi-monitor)
};

} // namespace SimonSays
