#include "input_hook.hpp"

#include <chrono>
#include <iostream>

namespace SimonSays {

// Static instance for Windows callbacks
InputHook* InputHook::s_instance = nullptr;
static HHOOK s_keyboardHook = nullptr;
static HHOOK s_mouseHook = nullptr;

namespace {

uint64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

bool isDown(int vkCode) {
    return (GetAsyncKeyState(vkCode) & 0x8000) != 0;
}

// Modifier state at the time of the event
uint32_t currentModifiers() {
    uint32_t flags = 0;
    if (isDown(VK_LWIN) || isDown(VK_RWIN)) flags |= ModifierFlag::CMD;
    if (isDown(VK_CONTROL)) flags |= ModifierFlag::CTRL;
    if (isDown(VK_SHIFT)) flags |= ModifierFlag::SHIFT;
    if (isDown(VK_MENU)) flags |= ModifierFlag::OPTION;
    return flags;
}

} // namespace

InputHook::InputHook() {
    s_instance = this;
}

InputHook::~InputHook() {
    stop();
    s_instance = nullptr;
}

bool InputHook::start(InputCallback callback) {
    if (m_running.load()) return false;

    m_callback = std::move(callback);
    m_running.store(true);
    m_paused.store(false);
    m_lastError.clear();

    // Start message loop in separate thread and wait until the hooks are in
    std::promise<bool> installed;
    std::future<bool> result = installed.get_future();
    m_messageThread = std::thread(&InputHook::messageLoop, this, std::move(installed));

    if (!result.get()) {
        m_messageThread.join();
        m_running.store(false);
        m_lastError = "Could not install the global input hooks. Run from an interactive desktop session "
                      "and allow this program to monitor input (run as administrator if other "
                      "windows are elevated).";
        return false;
    }
    return true;
}

void InputHook::stop() {
    if (!m_running.load()) {
        return;
    }

    m_running.store(false);

    // Post quit message to break message loop using stored thread ID
    DWORD threadId = m_messageThreadId.load();
    if (threadId != 0) {
        BOOL postResult = PostThreadMessage(threadId, WM_QUIT, 0, 0);
        if (!postResult) {
            std::cerr << "[DEBUG] InputHook::stop() - PostThreadMessage failed: " << GetLastError() << std::endl;
        }
    }

    if (m_messageThread.joinable()) {
        m_messageThread.join();
    }

    m_messageThreadId.store(0);
    std::cerr << "[DEBUG] InputHook stopped" << std::endl;
}

void InputHook::pause() {
    m_paused.store(true);
}

void InputHook::resume() {
    m_paused.store(false);
}

void InputHook::messageLoop(std::promise<bool> installed) {
    // Store this thread's ID immediately so stop() can post WM_QUIT to us
    m_messageThreadId.store(GetCurrentThreadId());

    // Install hooks (must be done from the thread that will run the message loop)
    s_keyboardHook = SetWindowsHookExW(
        WH_KEYBOARD_LL,
        keyboardProc,
        GetModuleHandle(nullptr),
        0
    );

    s_mouseHook = SetWindowsHookExW(
        WH_MOUSE_LL,
        mouseProc,
        GetModuleHandle(nullptr),
        0
    );

    if (!s_keyboardHook || !s_mouseHook) {
        std::cerr << "[ERROR] SetWindowsHookExW failed: " << GetLastError() << std::endl;
        if (s_keyboardHook) {
            UnhookWindowsHookEx(s_keyboardHook);
            s_keyboardHook = nullptr;
        }
        if (s_mouseHook) {
            UnhookWindowsHookEx(s_mouseHook);
            s_mouseHook = nullptr;
        }
        installed.set_value(false);
        return;
    }

    std::cerr << "[DEBUG] InputHook installed (threadId: " << m_messageThreadId.load() << ")" << std::endl;
    installed.set_value(true);

    // Message loop
    MSG msg;
    while (m_running.load() && GetMessage(&msg, nullptr, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessage(&msg);
    }

    // Cleanup hooks
    if (s_keyboardHook) {
        UnhookWindowsHookEx(s_keyboardHook);
        s_keyboardHook = nullptr;
    }
    if (s_mouseHook) {
        UnhookWindowsHookEx(s_mouseHook);
        s_mouseHook = nullptr;
    }
}

bool InputHook::dispatch(const InputEvent& event) {
    if (!m_callback) {
        return false;
    }
    return m_callback(event);
}

LRESULT CALLBACK InputHook::keyboardProc(int nCode, WPARAM wParam, LPARAM lParam) {
    if (nCode >= 0 && s_instance && !s_instance->m_paused.load()) {
        KBDLLHOOKSTRUCT* kbd = reinterpret_cast<KBDLLHOOKSTRUCT*>(lParam);
        if (kbd->flags & LLKHF_INJECTED) {
            return CallNextHookEx(s_keyboardHook, nCode, wParam, lParam);
        }

        InputEvent event;
        event.vkCode = static_cast<int>(kbd->vkCode);
        event.scanCode = static_cast<int>(kbd->scanCode);
        event.modifiers = currentModifiers();
        event.timestamp = nowMillis();

        switch (wParam) {
            case WM_KEYDOWN:
            case WM_SYSKEYDOWN:
                event.type = InputEventType::KeyDown;
                break;
            case WM_KEYUP:
            case WM_SYSKEYUP:
                event.type = InputEventType::KeyUp;
                break;
            default:
                return CallNextHookEx(s_keyboardHook, nCode, wParam, lParam);
        }

        if (s_instance->dispatch(event)) {
            return 1;
        }
    }

    return CallNextHookEx(s_keyboardHook, nCode, wParam, lParam);
}

LRESULT CALLBACK InputHook::mouseProc(int nCode, WPARAM wParam, LPARAM lParam) {
    if (nCode >= 0 && s_instance && !s_instance->m_paused.load()) {
        MSLLHOOKSTRUCT* mouse = reinterpret_cast<MSLLHOOKSTRUCT*>(lParam);
        if (mouse->flags & LLMHF_INJECTED) {
            return CallNextHookEx(s_mouseHook, nCode, wParam, lParam);
        }

        InputEvent event;
        event.x = mouse->pt.x;
        event.y = mouse->pt.y;
        event.modifiers = currentModifiers();
        event.timestamp = nowMillis();

        bool shouldSend = true;

        switch (wParam) {
            case WM_MOUSEMOVE:
                event.type = InputEventType::MouseMove;
                break;
            case WM_LBUTTONDOWN:
                event.type = InputEventType::MouseButtonDown;
                event.button = 0;
                break;
            case WM_LBUTTONUP:
                event.type = InputEventType::MouseButtonUp;
                event.button = 0;
                break;
            case WM_RBUTTONDOWN:
                event.type = InputEventType::MouseButtonDown;
                event.button = 1;
                break;
            case WM_RBUTTONUP:
                event.type = InputEventType::MouseButtonUp;
                event.button = 1;
                break;
            case WM_MBUTTONDOWN:
                event.type = InputEventType::MouseButtonDown;
                event.button = 2;
                break;
            case WM_MBUTTONUP:
                event.type = InputEventType::MouseButtonUp;
                event.button = 2;
                break;
            case WM_MOUSEWHEEL:
                event.type = InputEventType::MouseWheel;
                event.wheelDelta = GET_WHEEL_DELTA_WPARAM(mouse->mouseData);
                break;
            default:
                shouldSend = false;
                break;
        }

        if (shouldSend && s_instance->dispatch(event)) {
            return 1;
        }
    }

    return CallNextHookEx(s_mouseHook, nCode, wParam, lParam);
}

} // namespace SimonSays
