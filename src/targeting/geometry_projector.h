#ifndef RETICLE_GEOMETRY_PROJECTOR_H
#define RETICLE_GEOMETRY_PROJECTOR_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../common/geometry.h"
#include "../introspection/ui_introspector.h"
#include "../signature/element_signature.h"

namespace reticle {

enum class DriftKind {
    STABLE,
    MOVED,
    RESIZED,
    MOVED_AND_RESIZED
};

std::string driftKindToString(DriftKind kind);

/**
 * @brief Maps window-relative recorded geometry to live screen coordinates
 *
 * live = liveOrigin + relative * scale. offsetX/offsetY are the origin
 * difference between the live and the recorded window.
 */
struct ProjectionTransform {
    double scaleX = 1.0;
    double scaleY = 1.0;
    double offsetX = 0.0;
    double offsetY = 0.0;
    Point liveOrigin;

    Point apply(const Point& relative) const;
    Rect apply(const Rect& relative) const;

    /**
     * @brief Scale a vector (no translation)
     */
    Point scale(const Point& delta) const;

    nlohmann::json toJson() const;
};

struct Projection {
    ProjectionTransform transform;
    Point point;                      // Projected activation point, screen coordinates
    Rect frame;                       // Projected element frame, screen coordinates
    DriftKind drift = DriftKind::STABLE;
    double displayScaleRatio = 1.0;   // Live display scale / recorded display scale
    bool usedClickFraction = false;
    std::vector<std::string> notes;

    nlohmann::json toJson() const;
};

/**
 * @brief L2: projects the recorded activation point into the live window
 */
class GeometryProjector {
public:
    static constexpr double kStableOffsetPx = 2.0;
    static constexpr double kStableScaleDelta = 0.02;

    /**
     * @param notes Receives a note for every axis that could not be scaled
     */
    static ProjectionTransform computeTransform(const Rect& recordedWindow, const Rect& liveWindow,
                                                std::vector<std::string>* notes = nullptr);

    static DriftKind classify(const ProjectionTransform& transform);

    /**
     * @brief Project the signature's activation point and element frame
     *
     * When the projected point falls outside the live window and the
     * recording carries a click fraction, the fraction of the live window
     * size is used instead.
     */
    Projection project(const ElementSignature& signature, const WindowInfo& liveWindow) const;
};

} // namespace reticle

#endif // RETICLE_GEOMETRY_PROJECTOR_H
