#pragma once

#include "core/command.hpp"
#include "core/input_event.hpp"
#include "core/location_table.hpp"

#include <functional>
#include <optional>
#include <string>

namespace SimonSays {

// A finished recording session
struct RecordingResult {
    Script script;
    double durationSeconds = 0.0;
    int newLocations = 0;
};

/**
 * Turns a live input-event stream into script commands.
 *
 * Idle until the trigger (middle button press) arrives, active until it
 * arrives again. While active, typed characters are batched into a text
 * buffer, mouse presses are held back until release so they can be told
 * apart as click, click-and-hold or drag, and pauses longer than
 * IDLE_GAP_SECONDS become short quantized waits.
 *
 * handleEvent() never blocks and never touches the disk. The finished
 * session is picked up with takeFinished() by whoever persists it.
 */
class ScriptRecorder {
public:
    explicit ScriptRecorder(LocationTable& locations);

    // Feed one event. Returns true if the event belongs to the recorder
    // (the trigger) and must not reach other applications.
    bool handleEvent(const InputEvent& event);

    // Middle button press or release
    static bool isTrigger(const InputEvent& event);

    bool isActive() const { return m_active; }

    // The session closed by the last stop trigger, handed out once
    std::optional<RecordingResult> takeFinished();

    // Set callback for progress messages
    using StatusCallback = std::function<void(const std::string& status)>;
    void setStatusCallback(StatusCallback callback);

    // Wait emitted for an idle gap of the given length
    static double quantizeIdleGap(double gapSeconds);

private:
    struct PendingMouseDown {
        double time = 0.0;
        MouseButton button = MouseButton::Left;
        std::string location;
    };

    LocationTable& m_locations;
    StatusCallback m_statusCallback;

    bool m_active = false;
    double m_startTime = 0.0;
    double m_lastEventTime = 0.0;
    Script m_commands;
    std::string m_textBuffer;
    std::optional<PendingMouseDown> m_pendingDown;
    std::optional<std::string> m_lastClickLocation;
    int m_newLocations = 0;
    std::optional<RecordingResult> m_finished;

    void start(double now);
    void stop(double now);
    void applyIdleGap(double now);
    void handleMouseDown(const InputEvent& event, double now);
    void handleMouseUp(const InputEvent& event, double now);
    void handleKeyDown(const InputEvent& event, double now);
    bool handleKeyCombination(const InputEvent& event, double now);
    void flushTextBuffer();
    std::string locationAt(int x, int y, double now);
    void emit(Command command, double now);
    void sendStatus(const std::string& status);
};

} // namespace SimonSays
