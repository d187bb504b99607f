#ifndef RETICLE_GEOMETRY_H
#define RETICLE_GEOMETRY_H

#include <cmath>
#include <nlohmann/json.hpp>

namespace reticle {

/**
 * @brief Point in logical screen units (or window-relative units for
 *        recorded data)
 */
struct Point {
    double x;
    double y;

    Point(double x = 0.0, double y = 0.0) : x(x), y(y) {}

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }

    double distanceTo(const Point& other) const {
        return std::hypot(x - other.x, y - other.y);
    }

    /**
     * @brief Equality within tolerance on both axes
     */
    bool near(const Point& other, double tolerance = 0.5) const {
        return std::fabs(x - other.x) <= tolerance && std::fabs(y - other.y) <= tolerance;
    }
};

/**
 * @brief Axis aligned rectangle: origin plus size
 */
struct Rect {
    double x;
    double y;
    double width;
    double height;

    Rect(double x = 0.0, double y = 0.0, double width = 0.0, double height = 0.0)
        : x(x), y(y), width(width), height(height) {}

    double right() const { return x + width; }
    double bottom() const { return y + height; }
    Point origin() const { return Point(x, y); }
    Point center() const { return Point(x + width / 2.0, y + height / 2.0); }
    bool isEmpty() const { return width <= 0.0 || height <= 0.0; }

    bool contains(const Point& p) const {
        return p.x >= x && p.x <= right() && p.y >= y && p.y <= bottom();
    }

    bool contains(const Rect& other) const {
        return other.x >= x && other.y >= y &&
               other.right() <= right() && other.bottom() <= bottom();
    }

    Rect translated(double dx, double dy) const {
        return Rect(x + dx, y + dy, width, height);
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

inline void to_json(nlohmann::json& j, const Point& p) {
    j = nlohmann::json{{"x", p.x}, {"y", p.y}};
}

inline void from_json(const nlohmann::json& j, Point& p) {
    p.x = j.at("x").get<double>();
    p.y = j.at("y").get<double>();
}

// Frames are written as {x, y, w, h}; "width"/"height" are accepted on read
inline void to_json(nlohmann::json& j, const Rect& r) {
    j = nlohmann::json{{"x", r.x}, {"y", r.y}, {"w", r.width}, {"h", r.height}};
}

inline void from_json(const nlohmann::json& j, Rect& r) {
    r.x = j.at("x").get<double>();
    r.y = j.at("y").get<double>();
    r.width = j.contains("w") ? j.at("w").get<double>() : j.at("width").get<double>();
    r.height = j.contains("h") ? j.at("h").get<double>() : j.at("height").get<double>();
}

} // namespace reticle

#endif // RETICLE_GEOMETRY_H
