#include "script_recorder.hpp"
#include "core/keymap.hpp"
#include "core/script_codec.hpp"
#include "config.hpp"
#include "utils/strings.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace SimonSays {

namespace {

double toSeconds(uint64_t timestampMs) {
    return static_cast<double>(timestampMs) / 1000.0;
}

bool isWhitespaceOnly(const std::string& text) {
    return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ScriptRecorder::ScriptRecorder(LocationTable& locations) : m_locations(locations) {
}

void ScriptRecorder::setStatusCallback(StatusCallback callback) {
    m_statusCallback = std::move(callback);
}

void ScriptRecorder::sendStatus(const std::string& status) {
    if (m_statusCallback) {
        m_statusCallback(status);
    }
}

bool ScriptRecorder::isTrigger(const InputEvent& event) {
    return (event.type == InputEventType::MouseButtonDown || event.type == InputEventType::MouseButtonUp)
        && event.button == TRIGGER_BUTTON;
}

double ScriptRecorder::quantizeIdleGap(double gapSeconds) {
    if (gapSeconds >= 2.0) {
        return 0.6;
    }
    if (gapSeconds >= 1.0) {
        return 0.4;
    }
    return 0.25;
}

std::optional<RecordingResult> ScriptRecorder::takeFinished() {
    std::optional<RecordingResult> finished = std::move(m_finished);
    m_finished.reset();
    return finished;
}

bool ScriptRecorder::handleEvent(const InputEvent& event) {
    double now = toSeconds(event.timestamp);

    if (isTrigger(event)) {
        if (event.type == InputEventType::MouseButtonDown) {
            if (m_active) {
                stop(now);
            } else {
                start(now);
            }
        }
        return true;
    }

    if (!m_active) {
        return false;
    }

    // Pointer motion and the wheel are not part of the script
    if (event.type == InputEventType::MouseMove || event.type == InputEventType::MouseWheel) {
        return false;
    }

    applyIdleGap(now);

    switch (event.type) {
        case InputEventType::MouseButtonDown:
            handleMouseDown(event, now);
            break;
        case InputEventType::MouseButtonUp:
            handleMouseUp(event, now);
            break;
        case InputEventType::KeyDown:
            handleKeyDown(event, now);
            break;
        default:
            break;
    }

    return false;
}

void ScriptRecorder::start(double now) {
    m_active = true;
    m_startTime = now;
    m_lastEventTime = now;
    m_commands.clear();
    m_textBuffer.clear();
    m_pendingDown.reset();
    m_lastClickLocation.reset();
    m_newLocations = 0;
    m_finished.reset();
    m_locations.resetNaming();

    sendStatus("RECORDING STARTED - middle click again to stop");
}

void ScriptRecorder::stop(double now) {
    flushTextBuffer();
    m_active = false;
    m_pendingDown.reset();

    RecordingResult result;
    result.script = std::move(m_commands);
    result.durationSeconds = now - m_startTime;
    result.newLocations = m_newLocations;
    m_finished = std::move(result);
    m_commands.clear();

    sendStatus("RECORDING STOPPED");
}

void ScriptRecorder::applyIdleGap(double now) {
    double gap = now - m_lastEventTime;
    m_lastEventTime = now;

    if (gap <= IDLE_GAP_SECONDS) {
        return;
    }

    if (!isWhitespaceOnly(m_textBuffer)) {
        flushTextBuffer();
    }

    if (!m_commands.empty()) {
        emit(Wait{quantizeIdleGap(gap)}, now);
    }
}

std::string ScriptRecorder::locationAt(int x, int y, double now) {
    bool created = false;
    std::string name = m_locations.resolve(x, y, created);
    if (created) {
        m_newLocations++;
        std::ostringstream status;
        status << "[" << std::fixed << std::setprecision(1) << (now - m_startTime) << "s] Saved new location '"
               << name << "' at (" << x << ", " << y << ")";
        sendStatus(status.str());
    }
    return name;
}

void ScriptRecorder::handleMouseDown(const InputEvent& event, double now) {
    auto button = buttonFromIndex(event.button);
    if (!button) {
        return;
    }

    flushTextBuffer();

    std::string location = locationAt(event.x, event.y, now);

    if (m_lastClickLocation && *m_lastClickLocation != location) {
        emit(MoveTo{location}, now);
    }

    m_pendingDown = PendingMouseDown{now, *button, location};
}

void ScriptRecorder::handleMouseUp(const InputEvent& event, double now) {
    auto button = buttonFromIndex(event.button);
    if (!button || !m_pendingDown) {
        return;
    }

    std::string upLocation = locationAt(event.x, event.y, now);
    double holdDuration = now - m_pendingDown->time;

    if (holdDuration > HOLD_THRESHOLD_SECONDS) {
        if (upLocation == m_pendingDown->location) {
            double rounded = std::round(holdDuration * 10.0) / 10.0;
            emit(ClickAndHold{*button, m_pendingDown->location, rounded}, now);
        } else {
            emit(Drag{*button, m_pendingDown->location, upLocation}, now);
        }
    } else {
        emit(Click{*button, m_pendingDown->location}, now);
    }

    emit(Wait{UI_SETTLE_WAIT_SECONDS}, now);

    m_lastClickLocation = upLocation;
    m_pendingDown.reset();
}

bool ScriptRecorder::handleKeyCombination(const InputEvent& event, double now) {
    bool cmd = (event.modifiers & ModifierFlag::CMD) != 0;
    bool ctrl = (event.modifiers & ModifierFlag::CTRL) != 0;
    if (!(cmd || ctrl) || isModifierKey(event.vkCode)) {
        return false;
    }

    auto key = keyName(event.vkCode);
    if (!key) {
        return false;
    }

    flushTextBuffer();
    emit(Press{modifiersFromFlags(event.modifiers), *key}, now);
    return true;
}

void ScriptRecorder::handleKeyDown(const InputEvent& event, double now) {
    if (handleKeyCombination(event, now)) {
        return;
    }

    if (auto special = specialKeyName(event.vkCode)) {
        const std::string& name = *special;
        bool shift = (event.modifiers & ModifierFlag::SHIFT) != 0;

        if (name == "return" && shift) {
            // Soft line break stays inside the text, making it a code block
            m_textBuffer += '\n';
            return;
        }

        if (name == "backspace" && !m_textBuffer.empty()) {
            m_textBuffer.pop_back();
            return;
        }

        flushTextBuffer();
        emit(Press{{}, name}, now);

        if (name == "return") {
            emit(Wait{UI_SETTLE_WAIT_SECONDS}, now);
        }
        return;
    }

    auto base = baseCharacter(event.vkCode);
    if (!base) {
        return;
    }

    bool shift = (event.modifiers & ModifierFlag::SHIFT) != 0;
    m_textBuffer += shift ? shiftedCharacter(*base) : *base;
}

void ScriptRecorder::flushTextBuffer() {
    if (m_textBuffer.empty()) {
        return;
    }

    std::string text = std::move(m_textBuffer);
    m_textBuffer.clear();

    if (isWhitespaceOnly(text)) {
        return;
    }

    double now = m_lastEventTime;
    if (text.find('\n') == std::string::npos) {
        emit(Type{text}, now);
    } else {
        emit(TypeCodeBlock{splitLines(text)}, now);
    }
}

void ScriptRecorder::emit(Command command, double now) {
    std::ostringstream status;
    if (const auto* wait = std::get_if<Wait>(&command)) {
        status << "[Added wait " << formatSeconds(wait->seconds) << "s]";
    } else if (const auto* block = std::get_if<TypeCodeBlock>(&command)) {
        status << "[Captured code block: " << block->lines.size() << " lines]";
    } else {
        status << "[" << std::fixed << std::setprecision(1) << (now - m_startTime) << "s] "
               << formatCommand(command);
    }
    sendStatus(status.str());

    m_commands.push_back(std::move(command));
}

} // namespace SimonSays
