#pragma once

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include "remap/remapper.hpp"

#include <atomic>
#include <future>
#include <thread>

namespace SimonSays {

/**
 * Small topmost marker drawn over the point a location used to be at.
 * The window is click-through, so the confirming click reaches the hook
 * rather than the marker.
 *
 * The window lives on its own UI thread; show() and hide() may be called
 * from any thread and only post messages to it.
 */
class OverlayWindow : public RemapPrompt {
public:
    OverlayWindow();
    ~OverlayWindow() override;

    void show(const std::string& name, std::optional<Point> original) override;
    void hide() override;

private:
    std::atomic<HWND> m_hwnd{nullptr};
    std::atomic<bool> m_visible{false};
    std::thread m_uiThread;

    // Window class name
    static constexpr const wchar_t* WINDOW_CLASS_NAME = L"SimonSaysMarker";

    // Posted to the marker window from other threads
    static constexpr UINT WM_MARKER_SHOW = WM_APP + 1;
    static constexpr UINT WM_MARKER_HIDE = WM_APP + 2;

    // Register window class (called once)
    bool registerWindowClass();

    // Start the UI thread and create the window on first use
    bool ensureWindow();
    void uiThreadProc(std::promise<HWND> created);

    static LRESULT CALLBACK windowProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam);
};

} // namespace SimonSays
