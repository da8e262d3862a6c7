#pragma once

#include "core/input_event.hpp"

#include <optional>
#include <string>

namespace SimonSays {

// Where synthesized input goes. Delivery is best effort: a false return
// means the OS refused the event, not that playback should stop.
class InputSink {
public:
    virtual ~InputSink() = default;

    // Post one synthetic keyboard or mouse event
    virtual bool replay(const InputEvent& event) = 0;

    // Current pointer position as the OS reports it
    virtual Point cursorPosition() = 0;

    virtual bool setClipboardText(const std::string& text) = 0;
    virtual std::optional<std::string> clipboardText() = 0;
};

} // namespace SimonSays
