#include "input_replay.hpp"

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>

#include <cstring>
#include <iostream>

namespace SimonSays {

namespace {

// Keys that need KEYEVENTF_EXTENDEDKEY when sent by scan code
bool isExtendedKey(int vkCode) {
    switch (vkCode) {
        case VK_LEFT: case VK_RIGHT: case VK_UP: case VK_DOWN:
        case VK_HOME: case VK_END: case VK_PRIOR: case VK_NEXT:
        case VK_INSERT: case VK_DELETE:
        case VK_LWIN: case VK_RWIN: case VK_APPS:
        case VK_RCONTROL: case VK_RMENU:
            return true;
        default:
            return false;
    }
}

std::wstring toWide(const std::string& text) {
    if (text.empty()) return std::wstring();
    int length = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(length), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &wide[0], length);
    return wide;
}

std::string toUtf8(const wchar_t* text) {
    int length = WideCharToMultiByte(CP_UTF8, 0, text, -1, nullptr, 0, nullptr, nullptr);
    if (length <= 1) return std::string();
    std::string utf8(static_cast<size_t>(length - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, text, -1, &utf8[0], length, nullptr, nullptr);
    return utf8;
}

// Closes the clipboard when it goes out of scope
class ClipboardLock {
public:
    ClipboardLock() : m_open(OpenClipboard(nullptr) != 0) {}
    ~ClipboardLock() { if (m_open) CloseClipboard(); }
    bool isOpen() const { return m_open; }
private:
    bool m_open;
};

} // namespace

InputReplay::InputReplay() {
    // Get virtual screen dimensions (handles multi-monitor)
    m_screenWidth = GetSystemMetrics(SM_CXVIRTUALSCREEN);
    m_screenHeight = GetSystemMetrics(SM_CYVIRTUALSCREEN);
    m_screenLeft = GetSystemMetrics(SM_XVIRTUALSCREEN);
    m_screenTop = GetSystemMetrics(SM_YVIRTUALSCREEN);

    // Fallback to primary monitor if virtual screen fails
    if (m_screenWidth == 0) m_screenWidth = GetSystemMetrics(SM_CXSCREEN);
    if (m_screenHeight == 0) m_screenHeight = GetSystemMetrics(SM_CYSCREEN);
}

bool InputReplay::replay(const InputEvent& event) {
    INPUT input{};

    switch (event.type) {
        case InputEventType::KeyDown:
        case InputEventType::KeyUp:
        {
            input.type = INPUT_KEYBOARD;
            input.ki.wVk = static_cast<WORD>(event.vkCode);
            input.ki.wScan = static_cast<WORD>(MapVirtualKeyW(static_cast<UINT>(event.vkCode), MAPVK_VK_TO_VSC));

            if (event.type == InputEventType::KeyUp) {
                input.ki.dwFlags |= KEYEVENTF_KEYUP;
            }
            if (isExtendedKey(event.vkCode)) {
                input.ki.dwFlags |= KEYEVENTF_EXTENDEDKEY;
            }
            break;
        }

        case InputEventType::MouseMove:
        {
            input.type = INPUT_MOUSE;
            // Convert to absolute coordinates (0-65535 range)
            // Account for virtual screen offset (multi-monitor)
            int adjustedX = event.x - m_screenLeft;
            int adjustedY = event.y - m_screenTop;

            input.mi.dx = static_cast<LONG>(((adjustedX * 65536) / m_screenWidth) + 1);
            input.mi.dy = static_cast<LONG>(((adjustedY * 65536) / m_screenHeight) + 1);
            input.mi.dwFlags = MOUSEEVENTF_MOVE | MOUSEEVENTF_ABSOLUTE | MOUSEEVENTF_VIRTUALDESK;
            break;
        }

        case InputEventType::MouseButtonDown:
        case InputEventType::MouseButtonUp:
        {
            input.type = INPUT_MOUSE;
            bool down = event.type == InputEventType::MouseButtonDown;

            switch (event.button) {
                case 0: // Left
                    input.mi.dwFlags = down ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
                    break;
                case 1: // Right
                    input.mi.dwFlags = down ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
                    break;
                case 2: // Middle
                    input.mi.dwFlags = down ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP;
                    break;
                default:
                    return false;
            }
            break;
        }

        case InputEventType::MouseWheel:
        {
            input.type = INPUT_MOUSE;
            input.mi.dwFlags = MOUSEEVENTF_WHEEL;
            input.mi.mouseData = static_cast<DWORD>(event.wheelDelta);
            break;
        }
    }

    UINT result = SendInput(1, &input, sizeof(INPUT));
    return result == 1;
}

Point InputReplay::cursorPosition() {
    POINT point{};
    if (!GetCursorPos(&point)) {
        std::cerr << "[DEBUG] GetCursorPos failed: " << GetLastError() << std::endl;
        return Point{};
    }
    return Point{point.x, point.y};
}

bool InputReplay::setClipboardText(const std::string& text) {
    std::wstring wide = toWide(text);
    size_t bytes = (wide.size() + 1) * sizeof(wchar_t);

    HGLOBAL memory = GlobalAlloc(GMEM_MOVEABLE, bytes);
    if (!memory) {
        return false;
    }
    void* target = GlobalLock(memory);
    if (!target) {
        GlobalFree(memory);
        return false;
    }
    std::memcpy(target, wide.c_str(), bytes);
    GlobalUnlock(memory);

    ClipboardLock clipboard;
    if (!clipboard.isOpen() || !EmptyClipboard()) {
        GlobalFree(memory);
        return false;
    }
    if (!SetClipboardData(CF_UNICODETEXT, memory)) {
        GlobalFree(memory);
        return false;
    }
    // The clipboard owns the memory now
    return true;
}

std::optional<std::string> InputReplay::clipboardText() {
    ClipboardLock clipboard;
    if (!clipboard.isOpen()) {
        return std::nullopt;
    }

    HANDLE data = GetClipboardData(CF_UNICODETEXT);
    if (!data) {
        return std::nullopt;
    }
    const wchar_t* text = static_cast<const wchar_t*>(GlobalLock(data));
    if (!text) {
        return std::nullopt;
    }
    std::string result = toUtf8(text);
    GlobalUnlock(data);
    return result;
}

} // namespace SimonSays
