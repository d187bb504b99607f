#include "mouse_control.h"
#include "../common/structured_logger.h"
#include "../common/error_handler.h"
#include <atomic>
#include <chrono>
#include <thread>

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

namespace reticle {
namespace ocal {
namespace mouse {

namespace {
    std::atomic<int> g_clickDelayMs{MouseSettings().clickDelayMs};
    std::atomic<int> g_settleDelayMs{MouseSettings().settleDelayMs};

    std::string buttonName(MouseButton button) {
        return (button == MouseButton::LEFT) ? "LEFT" :
               (button == MouseButton::RIGHT) ? "RIGHT" : "MIDDLE";
    }

#ifdef _WIN32
    DWORD getMouseButtonFlag(MouseButton button, bool isDown) {
        switch (button) {
            case MouseButton::LEFT:
                return isDown ? MOUSEEVENTF_LEFTDOWN : MOUSEEVENTF_LEFTUP;
            case MouseButton::RIGHT:
                return isDown ? MOUSEEVENTF_RIGHTDOWN : MOUSEEVENTF_RIGHTUP;
            case MouseButton::MIDDLE:
                return isDown ? MOUSEEVENTF_MIDDLEDOWN : MOUSEEVENTF_MIDDLEUP;
            default:
                return MOUSEEVENTF_LEFTDOWN;
        }
    }

    bool sendButton(DWORD flag) {
        INPUT input = {};
        input.type = INPUT_MOUSE;
        input.mi.dwFlags = flag;
        return SendInput(1, &input, sizeof(INPUT)) == 1;
    }
#endif

    bool movePlatformSpecific(int x, int y) {
    #ifdef _WIN32
        return SetCursorPos(x, y) != 0;
    #else
        (void)x; (void)y;
        return false;
    #endif
    }

    bool clickPlatformSpecific(MouseButton button) {
    #ifdef _WIN32
        if (!sendButton(getMouseButtonFlag(button, true))) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(g_clickDelayMs.load()));
        return sendButton(getMouseButtonFlag(button, false));
    #else
        (void)button;
        return false;
    #endif
    }
}

void setSettings(const MouseSettings& settings) {
    g_clickDelayMs = settings.clickDelayMs;
    g_settleDelayMs = settings.settleDelayMs;
}

MouseSettings getSettings() {
    MouseSettings settings;
    settings.clickDelayMs = g_clickDelayMs.load();
    settings.settleDelayMs = g_settleDelayMs.load();
    return settings;
}

bool isSupported() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

bool move(int x, int y) {
    RETICLE_LOG_DEBUG().component("mouse").message("Moving mouse to position").context("x", x).context("y", y);
    if (!movePlatformSpecific(x, y)) {
        RETICLE_HANDLE_ERROR(ErrorType::ACTION_ERROR, ErrorSeverity::MEDIUM,
                             "Failed to move mouse", std::to_string(x) + "," + std::to_string(y), "mouse::move");
        return false;
    }
    return true;
}

bool click(MouseButton button) {
    RETICLE_LOG_DEBUG().component("mouse").message("Mouse click").context("button", buttonName(button));
    if (!clickPlatformSpecific(button)) {
        RETICLE_HANDLE_ERROR(ErrorType::ACTION_ERROR, ErrorSeverity::MEDIUM,
                             "Failed to inject mouse click", buttonName(button), "mouse::click");
        return false;
    }
    return true;
}

bool clickAt(const Point& point, MouseButton button) {
    if (!move(point.x, point.y)) {
        return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(g_settleDelayMs.load()));
    return click(button);
}

bool getPosition(Point& position) {
#ifdef _WIN32
    POINT pt;
    if (GetCursorPos(&pt)) {
        position.x = pt.x;
        position.y = pt.y;
        return true;
    }
    RETICLE_HANDLE_ERROR(ErrorType::ACTION_ERROR, ErrorSeverity::LOW,
                         "Failed to get mouse position", "", "mouse::getPosition");
    return false;
#else
    (void)position;
    return false;
#endif
}

} // namespace mouse
} // namespace ocal
} // namespace reticle
