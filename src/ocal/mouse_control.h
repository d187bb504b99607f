#ifndef RETICLE_MOUSE_CONTROL_H
#define RETICLE_MOUSE_CONTROL_H

namespace reticle {
namespace ocal {
namespace mouse {

enum class MouseButton {
    LEFT,
    RIGHT,
    MIDDLE
};

struct Point {
    int x;
    int y;

    Point(int x = 0, int y = 0) : x(x), y(y) {}
};

struct MouseSettings {
    int clickDelayMs = 20;      // Between button down and up
    int settleDelayMs = 10;     // After moving, before clicking
};

void setSettings(const MouseSettings& settings);
MouseSettings getSettings();

/**
 * @brief Whether this build can inject pointer input
 */
bool isSupported();

// Each call returns false when the input could not be injected
bool move(int x, int y);
bool click(MouseButton button = MouseButton::LEFT);
bool clickAt(const Point& point, MouseButton button = MouseButton::LEFT);

bool getPosition(Point& position);

} // namespace mouse
} // namespace ocal
} // namespace reticle

#endif // RETICLE_MOUSE_CONTROL_H
