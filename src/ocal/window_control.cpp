#include "window_control.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#endif

namespace reticle {
namespace ocal {
namespace window {

namespace {
#ifdef _WIN32
    struct SearchData {
        DWORD processId;
        std::string title;
        HWND exact = nullptr;
        HWND first = nullptr;
    };

    std::string windowTitle(HWND hwnd) {
        wchar_t buffer[256];
        int length = GetWindowTextW(hwnd, buffer, sizeof(buffer) / sizeof(wchar_t));
        if (length <= 0) {
            return "";
        }
        int size = WideCharToMultiByte(CP_UTF8, 0, buffer, length, nullptr, 0, nullptr, nullptr);
        std::string utf8(static_cast<size_t>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, buffer, length, &utf8[0], size, nullptr, nullptr);
        return utf8;
    }

    BOOL CALLBACK enumWindowsProc(HWND hwnd, LPARAM lParam) {
        auto* data = reinterpret_cast<SearchData*>(lParam);
        DWORD processId = 0;
        GetWindowThreadProcessId(hwnd, &processId);
        if (processId != data->processId || !IsWindowVisible(hwnd)) {
            return TRUE;
        }
        if (!data->first) {
            data->first = hwnd;
        }
        if (!data->title.empty() && windowTitle(hwnd) == data->title) {
            data->exact = hwnd;
            return FALSE;
        }
        return TRUE;
    }

    bool activate(HWND hwnd) {
        if (IsIconic(hwnd)) {
            ShowWindow(hwnd, SW_RESTORE);
        }
        if (SetForegroundWindow(hwnd)) {
            return true;
        }

        // Foreground switches are refused unless the caller owns the
        // foreground thread's input
        HWND foreground = GetForegroundWindow();
        DWORD foregroundThreadId = GetWindowThreadProcessId(foreground, nullptr);
        DWORD currentThreadId = GetCurrentThreadId();
        if (foreground && foregroundThreadId != currentThreadId) {
            AttachThreadInput(currentThreadId, foregroundThreadId, TRUE);
            BOOL raised = SetForegroundWindow(hwnd);
            AttachThreadInput(currentThreadId, foregroundThreadId, FALSE);
            if (raised) {
                return true;
            }
        }
        BringWindowToTop(hwnd);
        return GetForegroundWindow() == hwnd;
    }
#endif
}

bool isSupported() {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

bool bringToFront(int processId, const std::string& title) {
    RETICLE_LOG_DEBUG().component("window").message("Bringing window to front")
        .context("pid", processId)
        .context("title", title);
#ifdef _WIN32
    SearchData data;
    data.processId = static_cast<DWORD>(processId);
    data.title = title;
    EnumWindows(enumWindowsProc, reinterpret_cast<LPARAM>(&data));

    HWND hwnd = data.exact ? data.exact : data.first;
    if (!hwnd) {
        RETICLE_HANDLE_ERROR(ErrorType::ACTION_ERROR, ErrorSeverity::MEDIUM,
                             "No visible window for process", std::to_string(processId), "window::bringToFront");
        return false;
    }
    if (!activate(hwnd)) {
        RETICLE_HANDLE_ERROR(ErrorType::ACTION_ERROR, ErrorSeverity::MEDIUM,
                             "System refused to switch the foreground window", title, "window::bringToFront");
        return false;
    }
    return true;
#else
    (void)processId;
    (void)title;
    return false;
#endif
}

} // namespace window
} // namespace ocal
} // namespace reticle
