#include "overlay_window.hpp"
#include "config.hpp"

#include <iostream>

namespace SimonSays {

OverlayWindow::OverlayWindow() {
    registerWindowClass();
}

OverlayWindow::~OverlayWindow() {
    HWND hwnd = m_hwnd.load();
    if (hwnd != nullptr) {
        PostMessageW(hwnd, WM_CLOSE, 0, 0);
    }
    if (m_uiThread.joinable()) {
        m_uiThread.join();
    }
}

bool OverlayWindow::registerWindowClass() {
    WNDCLASSEXW wc = {};
    wc.cbSize = sizeof(WNDCLASSEXW);
    wc.style = CS_HREDRAW | CS_VREDRAW;
    wc.lpfnWndProc = windowProc;
    wc.hInstance = GetModuleHandle(nullptr);
    wc.hCursor = LoadCursor(nullptr, IDC_ARROW);
    wc.hbrBackground = nullptr;
    wc.lpszClassName = WINDOW_CLASS_NAME;

    // RegisterClassExW returns 0 if the class already exists or on error
    ATOM result = RegisterClassExW(&wc);
    if (result == 0 && GetLastError() != ERROR_CLASS_ALREADY_EXISTS) {
        std::cerr << "[WARN] Could not register marker window class: " << GetLastError() << std::endl;
        return false;
    }

    return true;
}

bool OverlayWindow::ensureWindow() {
    if (m_hwnd.load() != nullptr) {
        return true;
    }
    if (m_uiThread.joinable()) {
        // Thread ran but window creation failed
        return false;
    }

    std::promise<HWND> created;
    std::future<HWND> result = created.get_future();
    m_uiThread = std::thread(&OverlayWindow::uiThreadProc, this, std::move(created));

    HWND hwnd = result.get();
    if (hwnd == nullptr) {
        std::cerr << "[WARN] Could not create marker window; continuing without it" << std::endl;
        return false;
    }
    m_hwnd.store(hwnd);
    return true;
}

void OverlayWindow::uiThreadProc(std::promise<HWND> created) {
    // WS_EX_LAYERED: Allows transparency
    // WS_EX_TRANSPARENT: Clicks pass through to the window below
    // WS_EX_TOPMOST: Always on top
    // WS_EX_TOOLWINDOW: Doesn't show in taskbar
    // WS_EX_NOACTIVATE: Doesn't become the active window when shown
    DWORD exStyle = WS_EX_LAYERED | WS_EX_TRANSPARENT | WS_EX_TOPMOST | WS_EX_TOOLWINDOW | WS_EX_NOACTIVATE;

    HWND hwnd = CreateWindowExW(
        exStyle,
        WINDOW_CLASS_NAME,
        L"SimonSays Marker",
        WS_POPUP,
        0, 0, MARKER_SIZE, MARKER_SIZE,
        nullptr,    // No parent
        nullptr,    // No menu
        GetModuleHandle(nullptr),
        this
    );

    if (hwnd == nullptr) {
        created.set_value(nullptr);
        return;
    }

    SetLayeredWindowAttributes(hwnd, 0, MARKER_ALPHA, LWA_ALPHA);
    created.set_value(hwnd);

    MSG msg;
    while (GetMessage(&msg, nullptr, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessage(&msg);
    }
}

void OverlayWindow::show(const std::string& name, std::optional<Point> original) {
    if (!original) {
        // Nothing to point at for a location that was never saved
        hide();
        return;
    }
    if (!ensureWindow()) {
        return;
    }

    PostMessageW(m_hwnd.load(), WM_MARKER_SHOW,
                 static_cast<WPARAM>(static_cast<LONG_PTR>(original->x)),
                 static_cast<LPARAM>(original->y));
    m_visible.store(true);
    std::cerr << "[DEBUG] Marker for " << name << " at (" << original->x << ", " << original->y << ")" << std::endl;
}

void OverlayWindow::hide() {
    HWND hwnd = m_hwnd.load();
    if (hwnd != nullptr && m_visible.load()) {
        PostMessageW(hwnd, WM_MARKER_HIDE, 0, 0);
    }
    m_visible.store(false);
}

LRESULT CALLBACK OverlayWindow::windowProc(HWND hwnd, UINT msg, WPARAM wParam, LPARAM lParam) {
    switch (msg) {
        case WM_CREATE:
            // Store the this pointer
            {
                CREATESTRUCTW* cs = reinterpret_cast<CREATESTRUCTW*>(lParam);
                SetWindowLongPtrW(hwnd, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(cs->lpCreateParams));
            }
            return 0;

        case WM_MARKER_SHOW:
            {
                int x = static_cast<int>(static_cast<LONG_PTR>(wParam));
                int y = static_cast<int>(lParam);
                SetWindowPos(hwnd, HWND_TOPMOST,
                             x - MARKER_SIZE / 2, y - MARKER_SIZE / 2, MARKER_SIZE, MARKER_SIZE,
                             SWP_NOACTIVATE | SWP_SHOWWINDOW);
                InvalidateRect(hwnd, nullptr, TRUE);
            }
            return 0;

        case WM_MARKER_HIDE:
            ShowWindow(hwnd, SW_HIDE);
            return 0;

        case WM_PAINT:
            {
                PAINTSTRUCT ps;
                HDC hdc = BeginPaint(hwnd, &ps);
                RECT rect;
                GetClientRect(hwnd, &rect);

                // Red square with a white cross hair through the exact point
                HBRUSH fill = CreateSolidBrush(RGB(220, 30, 30));
                FillRect(hdc, &rect, fill);
                DeleteObject(fill);

                HPEN pen = CreatePen(PS_SOLID, 1, RGB(255, 255, 255));
                HGDIOBJ oldPen = SelectObject(hdc, pen);
                int cx = (rect.right - rect.left) / 2;
                int cy = (rect.bottom - rect.top) / 2;
                MoveToEx(hdc, cx, rect.top, nullptr);
                LineTo(hdc, cx, rect.bottom);
                MoveToEx(hdc, rect.left, cy, nullptr);
                LineTo(hdc, rect.right, cy);
                SelectObject(hdc, oldPen);
                DeleteObject(pen);

                EndPaint(hwnd, &ps);
            }
            return 0;

        case WM_ERASEBKGND:
            // Painted in WM_PAINT
            return 1;

        case WM_CLOSE:
            DestroyWindow(hwnd);
            return 0;

        case WM_DESTROY:
            PostQuitMessage(0);
            return 0;

        default:
            return DefWindowProcW(hwnd, msg, wParam, lParam);
    }
}

} // namespace SimonSays
