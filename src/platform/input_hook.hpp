#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include "core/input_event.hpp"

#include <atomic>
#include <future>
#include <string>
#include <thread>

namespace SimonSays {

/**
 * Global low-level keyboard and mouse hook.
 *
 * Hooks run on a dedicated message-loop thread and call the callback for
 * every physical event. The callback returns true to swallow the event.
 * Events synthesized by this process (playback) are never reported.
 */
class InputHook {
public:
    InputHook();
    ~InputHook();

    // Install the hooks and start the message loop. Returns false if the
    // hooks could not be installed; lastError() then says why.
    bool start(InputCallback callback);

    // Stop capturing
    void stop();

    // Pause/resume without stopping
    void pause();
    void resume();
    bool isPaused() const { return m_paused.load(); }

    // Check if running
    bool isRunning() const { return m_running.load(); }

    const std::string& lastError() const { return m_lastError; }

private:
    InputCallback m_callback;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_paused{false};
    std::thread m_messageThread;
    std::atomic<DWORD> m_messageThreadId{0};  // Store thread ID for reliable WM_QUIT posting
    std::string m_lastError;

    void messageLoop(std::promise<bool> installed);
    bool dispatch(const InputEvent& event);

    // Static hook procedures (Windows requires static callbacks)
    static InputHook* s_instance;
    static LRESULT CALLBACK keyboardProc(int nCode, WPARAM wParam, LPARAM lParam);
    static LRESULT CALLBACK mouseProc(int nCode, WPARAM wParam, LPARAM lParam);
};

} // namespace SimonSays
