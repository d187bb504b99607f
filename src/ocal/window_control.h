#ifndef RETICLE_WINDOW_CONTROL_H
#define RETICLE_WINDOW_CONTROL_H

#include <string>

namespace reticle {
namespace ocal {
namespace window {

/**
 * @brief Whether this build can raise other applications' windows
 */
bool isSupported();

/**
 * @brief Raise the top-level window of a process and give it input focus
 * @param title Preferred window title; the process's first visible window
 *        is used when no title matches
 * @return false when no window was found or the system refused the switch
 */
bool bringToFront(int processId, const std::string& title);

} // namespace window
} // namespace ocal
} // namespace reticle

#endif // RETICLE_WINDOW_CONTROL_H
