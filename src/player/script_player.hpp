#pragma once

#include "player/input_sink.hpp"
#include "core/command.hpp"
#include "core/location_table.hpp"
#include "config.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace SimonSays {

struct PlayerOptions {
    // Pause after every command, on top of the command's own delays
    double commandDelay = DEFAULT_COMMAND_DELAY;

    // Release every modifier before typing a character that, combined with
    // a stuck modifier, opens system UI (Windows key + '.' or ';' opens the
    // emoji panel)
    bool releaseModifiersBeforeRiskyChars = true;
    std::string riskyCharacters = ".;";

    // Put the previous clipboard text back after a code block
    bool restoreClipboard = true;
};

struct PlaybackSummary {
    int executed = 0;
    int skipped = 0;
    bool cancelled = false;
};

/**
 * Executes a script by synthesizing input, one command at a time.
 *
 * Every wait is a blocking sleep on the calling thread. stop() may be
 * called from any thread; it wakes a sleeping player and ends playback
 * before the next step. Actions already posted are not undone.
 */
class ScriptPlayer {
public:
    ScriptPlayer(InputSink& sink, const LocationTable& locations, PlayerOptions options = PlayerOptions());

    PlaybackSummary run(const Script& script);

    // Execute one command. Returns false if it was skipped.
    bool execute(const Command& command);

    void stop();
    bool isStopped() const { return m_stopped.load(); }

    // Index of the command being executed
    size_t currentIndex() const { return m_currentIndex.load(); }

    // Replace the sleep used for every delay (tests pass a recorder)
    using SleepFunction = std::function<void(double seconds)>;
    void setSleepFunction(SleepFunction sleepFunction);

    // Set callback for progress and skip messages
    using StatusCallback = std::function<void(const std::string& status)>;
    void setStatusCallback(StatusCallback callback);

    // Step count for a smooth move over the given distance
    static int moveSteps(double distance);

private:
    InputSink& m_sink;
    const LocationTable& m_locations;
    PlayerOptions m_options;
    SleepFunction m_sleepFunction;
    StatusCallback m_statusCallback;

    std::atomic<bool> m_stopped{false};
    std::atomic<size_t> m_currentIndex{0};
    std::mutex m_sleepMutex;
    std::condition_variable m_sleepCv;

    void sleep(double seconds);
    void sendStatus(const std::string& status);

    bool moveTo(Point target, double duration);
    bool click(MouseButton button, const std::optional<std::string>& location, double holdSeconds);
    bool drag(MouseButton button, const std::string& from, const std::string& to);
    bool press(const std::vector<Modifier>& modifiers, const std::string& key);
    bool typeText(const std::string& text);
    bool typeCodeBlock(const std::vector<std::string>& lines);

    void postMouseButton(MouseButton button, bool down);
    void postKey(int vkCode, bool down);
    void tapKey(int vkCode);
    void pressCombination(const std::vector<Modifier>& modifiers, int vkCode);
    void releaseAllModifiers();

    std::optional<Point> lookup(const std::string& name);
};

} // namespace SimonSays
