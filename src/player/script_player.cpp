#include "script_player.hpp"
#include "core/keymap.hpp"
#include "core/script_codec.hpp"
#include "utils/strings.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <type_traits>

namespace SimonSays {

namespace {

int buttonIndex(MouseButton button) {
    return button == MouseButton::Left ? 0 : 1;
}

// First line of a command, for progress output
std::string summarize(const Command& command) {
    std::string text = formatCommand(command);
    size_t newline = text.find('\n');
    return newline == std::string::npos ? text : text.substr(0, newline);
}

} // namespace

ScriptPlayer::ScriptPlayer(InputSink& sink, const LocationTable& locations, PlayerOptions options)
    : m_sink(sink), m_locations(locations), m_options(std::move(options)) {
}

void ScriptPlayer::setSleepFunction(SleepFunction sleepFunction) {
    m_sleepFunction = std::move(sleepFunction);
}

void ScriptPlayer::setStatusCallback(StatusCallback callback) {
    m_statusCallback = std::move(callback);
}

void ScriptPlayer::sendStatus(const std::string& status) {
    if (m_statusCallback) {
        m_statusCallback(status);
    }
}

void ScriptPlayer::stop() {
    {
        std::lock_guard<std::mutex> lock(m_sleepMutex);
        m_stopped.store(true);
    }
    m_sleepCv.notify_all();
}

void ScriptPlayer::sleep(double seconds) {
    if (seconds <= 0.0 || m_stopped.load()) {
        return;
    }
    if (m_sleepFunction) {
        m_sleepFunction(seconds);
        return;
    }
    std::unique_lock<std::mutex> lock(m_sleepMutex);
    m_sleepCv.wait_for(lock, std::chrono::duration<double>(seconds), [this] { return m_stopped.load(); });
}

int ScriptPlayer::moveSteps(double distance) {
    int steps = static_cast<int>(distance / MOVE_STEP_PIXELS);
    return std::max(MOVE_MIN_STEPS, std::min(steps, MOVE_MAX_STEPS));
}

PlaybackSummary ScriptPlayer::run(const Script& script) {
    PlaybackSummary summary;

    for (size_t i = 0; i < script.size(); ++i) {
        if (m_stopped.load()) {
            summary.cancelled = true;
            sendStatus("Playback stopped by user");
            return summary;
        }

        const Command& command = script[i];
        m_currentIndex.store(i);
        if (isComment(command)) {
            continue;
        }

        sendStatus("Executing: " + summarize(command));
        if (execute(command)) {
            summary.executed++;
        } else {
            summary.skipped++;
        }
        sleep(m_options.commandDelay);
    }

    summary.cancelled = m_stopped.load();
    if (!summary.cancelled) {
        sendStatus("Script execution completed");
    }
    return summary;
}

bool ScriptPlayer::execute(const Command& command) {
    return std::visit([this](const auto& c) -> bool {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, MoveTo>) {
            auto point = resolveTarget(m_locations, c.target);
            if (!point) {
                sendStatus("Unknown location: " + c.target);
                return false;
            }
            return moveTo(*point, MOVE_DURATION);
        } else if constexpr (std::is_same_v<T, Click>) {
            return click(c.button, c.location, CLICK_HOLD);
        } else if constexpr (std::is_same_v<T, ClickAndHold>) {
            return click(c.button, c.location, c.duration);
        } else if constexpr (std::is_same_v<T, Drag>) {
            return drag(c.button, c.from, c.to);
        } else if constexpr (std::is_same_v<T, Press>) {
            return press(c.modifiers, c.key);
        } else if constexpr (std::is_same_v<T, Type>) {
            return typeText(c.text);
        } else if constexpr (std::is_same_v<T, TypeLine>) {
            bool typed = typeText(c.text);
            if (m_stopped.load()) {
                return false;
            }
            tapKey(Vk::Return);
            return typed;
        } else if constexpr (std::is_same_v<T, TypeCodeBlock>) {
            return typeCodeBlock(c.lines);
        } else if constexpr (std::is_same_v<T, Wait>) {
            sleep(c.seconds);
            return true;
        } else {
            return true;
        }
    }, command);
}

std::optional<Point> ScriptPlayer::lookup(const std::string& name) {
    auto point = m_locations.find(name);
    if (!point) {
        sendStatus("Unknown location: " + name);
    }
    return point;
}

bool ScriptPlayer::moveTo(Point target, double duration) {
    Point current = m_sink.cursorPosition();

    double distanceX = static_cast<double>(target.x - current.x);
    double distanceY = static_cast<double>(target.y - current.y);
    double distance = std::sqrt(distanceX * distanceX + distanceY * distanceY);

    int steps = moveSteps(distance);
    double dx = distanceX / steps;
    double dy = distanceY / steps;
    double stepDelay = duration / steps;

    for (int i = 0; i <= steps; ++i) {
        if (m_stopped.load()) {
            return false;
        }
        InputEvent event;
        event.type = InputEventType::MouseMove;
        event.x = static_cast<int>(std::lround(current.x + dx * i));
        event.y = static_cast<int>(std::lround(current.y + dy * i));
        if (!m_sink.replay(event)) {
            std::cerr << "[DEBUG] Pointer move to (" << event.x << ", " << event.y << ") was not delivered" << std::endl;
        }
        sleep(stepDelay);
    }
    return true;
}

void ScriptPlayer::postMouseButton(MouseButton button, bool down) {
    Point position = m_sink.cursorPosition();
    InputEvent event;
    event.type = down ? InputEventType::MouseButtonDown : InputEventType::MouseButtonUp;
    event.button = buttonIndex(button);
    event.x = position.x;
    event.y = position.y;
    if (!m_sink.replay(event)) {
        std::cerr << "[DEBUG] Mouse " << buttonName(button) << (down ? " down" : " up") << " was not delivered" << std::endl;
    }
}

void ScriptPlayer::postKey(int vkCode, bool down) {
    InputEvent event;
    event.type = down ? InputEventType::KeyDown : InputEventType::KeyUp;
    event.vkCode = vkCode;
    if (!m_sink.replay(event)) {
        std::cerr << "[DEBUG] Key 0x" << std::hex << vkCode << std::dec << (down ? " down" : " up")
                  << " was not delivered" << std::endl;
    }
}

bool ScriptPlayer::click(MouseButton button, const std::optional<std::string>& location, double holdSeconds) {
    if (location) {
        auto point = lookup(*location);
        if (!point) {
            return false;
        }
        if (!moveTo(*point, MOVE_DURATION)) {
            return false;
        }
        sleep(SETTLE_AFTER_MOVE);
    }

    // A stop during the move or settle must not press at a stray position
    if (m_stopped.load()) {
        return false;
    }
    postMouseButton(button, true);
    sleep(holdSeconds);
    postMouseButton(button, false);
    sleep(SETTLE_AFTER_CLICK);
    return true;
}

bool ScriptPlayer::drag(MouseButton button, const std::string& from, const std::string& to) {
    auto start = lookup(from);
    auto end = lookup(to);
    if (!start || !end) {
        return false;
    }

    if (!moveTo(*start, MOVE_DURATION)) {
        return false;
    }
    sleep(SETTLE_AFTER_MOVE);
    if (m_stopped.load()) {
        return false;
    }

    postMouseButton(button, true);
    sleep(CLICK_HOLD);

    moveTo(*end, DRAG_MOVE_DURATION);

    // Release even when stopped mid-drag so the button is not left down
    postMouseButton(button, false);
    sleep(SETTLE_AFTER_CLICK);
    return true;
}

void ScriptPlayer::tapKey(int vkCode) {
    postKey(vkCode, true);
    sleep(KEY_GAP);
    postKey(vkCode, false);
    sleep(KEY_GAP);
}

void ScriptPlayer::pressCombination(const std::vector<Modifier>& modifiers, int vkCode) {
    for (Modifier modifier : modifiers) {
        postKey(modifierKeyCode(modifier), true);
        sleep(MODIFIER_GAP);
    }

    postKey(vkCode, true);
    sleep(KEY_GAP);
    postKey(vkCode, false);
    sleep(KEY_GAP);

    for (auto it = modifiers.rbegin(); it != modifiers.rend(); ++it) {
        postKey(modifierKeyCode(*it), false);
        sleep(MODIFIER_GAP);
    }
}

void ScriptPlayer::releaseAllModifiers() {
    static const int modifierKeys[] = {
        Vk::Shift, Vk::LShift, Vk::RShift,
        Vk::Control, Vk::LControl, Vk::RControl,
        Vk::Menu, Vk::LMenu, Vk::RMenu,
        Vk::LWin, Vk::RWin,
    };
    for (int vkCode : modifierKeys) {
        postKey(vkCode, false);
    }
    sleep(MODIFIER_GAP);
}

bool ScriptPlayer::press(const std::vector<Modifier>& modifiers, const std::string& key) {
    auto vkCode = keyCodeForName(key);
    if (!vkCode) {
        sendStatus("Unknown key: " + key);
        return false;
    }

    if (modifiers.empty()) {
        tapKey(*vkCode);
    } else {
        pressCombination(modifiers, *vkCode);
    }
    return true;
}

bool ScriptPlayer::typeText(const std::string& text) {
    bool allTyped = true;

    for (char c : text) {
        if (m_stopped.load()) {
            return false;
        }

        auto stroke = keyStrokeForChar(c);
        if (!stroke) {
            sendStatus(std::string("Cannot type character: ") + c);
            allTyped = false;
            continue;
        }

        if (m_options.releaseModifiersBeforeRiskyChars
            && m_options.riskyCharacters.find(c) != std::string::npos) {
            releaseAllModifiers();
        }

        if (stroke->shift) {
            pressCombination({Modifier::Shift}, stroke->vkCode);
        } else {
            tapKey(stroke->vkCode);
        }
        sleep(CHAR_GAP);
    }

    return allTyped;
}

bool ScriptPlayer::typeCodeBlock(const std::vector<std::string>& lines) {
    std::optional<std::string> savedClipboard;
    if (m_options.restoreClipboard) {
        savedClipboard = m_sink.clipboardText();
    }

    sendStatus("Pasting code block (" + std::to_string(lines.size()) + " lines)");

    for (const auto& line : lines) {
        if (m_stopped.load()) {
            break;
        }

        if (!m_sink.setClipboardText(trimRight(line))) {
            std::cerr << "[WARN] Could not place line on the clipboard: " << line << std::endl;
        }
        sleep(PASTE_GAP);

        tapKey(Vk::Home);
        sleep(PASTE_GAP);

        pressCombination({Modifier::Ctrl}, 'V');
        sleep(PASTE_GAP);

        tapKey(Vk::Return);
        sleep(PASTE_GAP);
    }

    if (savedClipboard) {
        m_sink.setClipboardText(*savedClipboard);
    }
    return !m_stopped.load();
}

} // namespace SimonSays
