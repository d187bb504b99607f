#include "geometry_projector.h"
#include "../common/structured_logger.h"
#include <cmath>

namespace reticle {

std::string driftKindToString(DriftKind kind) {
    switch (kind) {
        case DriftKind::STABLE: return "stable";
        case DriftKind::MOVED: return "moved";
        case DriftKind::RESIZED: return "resized";
        case DriftKind::MOVED_AND_RESIZED: return "moved_and_resized";
        default: return "unknown";
    }
}

Point ProjectionTransform::apply(const Point& relative) const {
    return Point(liveOrigin.x + relative.x * scaleX, liveOrigin.y + relative.y * scaleY);
}

Rect ProjectionTransform::apply(const Rect& relative) const {
    Point origin = apply(relative.origin());
    return Rect(origin.x, origin.y, relative.width * scaleX, relative.height * scaleY);
}

Point ProjectionTransform::scale(const Point& delta) const {
    return Point(delta.x * scaleX, delta.y * scaleY);
}

nlohmann::json ProjectionTransform::toJson() const {
    return nlohmann::json{
        {"scale_x", scaleX}, {"scale_y", scaleY},
        {"offset_x", offsetX}, {"offset_y", offsetY},
        {"live_origin", liveOrigin}
    };
}

nlohmann::json Projection::toJson() const {
    nlohmann::json j = {
        {"transform", transform.toJson()},
        {"point", point},
        {"frame", frame},
        {"drift", driftKindToString(drift)},
        {"display_scale_ratio", displayScaleRatio},
        {"used_click_fraction", usedClickFraction}
    };
    if (!notes.empty()) {
        j["notes"] = notes;
    }
    return j;
}

ProjectionTransform GeometryProjector::computeTransform(const Rect& recordedWindow, const Rect& liveWindow,
                                                        std::vector<std::string>* notes) {
    ProjectionTransform transform;
    transform.liveOrigin = liveWindow.origin();
    transform.offsetX = liveWindow.x - recordedWindow.x;
    transform.offsetY = liveWindow.y - recordedWindow.y;

    if (recordedWindow.width > 0.0) {
        transform.scaleX = liveWindow.width / recordedWindow.width;
    } else if (notes) {
        notes->push_back("recorded window width is zero; x scale fixed at 1.0");
    }
    if (recordedWindow.height > 0.0) {
        transform.scaleY = liveWindow.height / recordedWindow.height;
    } else if (notes) {
        notes->push_back("recorded window height is zero; y scale fixed at 1.0");
    }
    return transform;
}

DriftKind GeometryProjector::classify(const ProjectionTransform& transform) {
    bool moved = std::fabs(transform.offsetX) > kStableOffsetPx || std::fabs(transform.offsetY) > kStableOffsetPx;
    bool resized = std::fabs(transform.scaleX - 1.0) > kStableScaleDelta ||
                   std::fabs(transform.scaleY - 1.0) > kStableScaleDelta;
    if (moved && resized) return DriftKind::MOVED_AND_RESIZED;
    if (moved) return DriftKind::MOVED;
    if (resized) return DriftKind::RESIZED;
    return DriftKind::STABLE;
}

Projection GeometryProjector::project(const ElementSignature& signature, const WindowInfo& liveWindow) const {
    Projection projection;
    projection.transform = computeTransform(signature.windowFrame(), liveWindow.frame, &projection.notes);
    projection.drift = classify(projection.transform);
    projection.point = projection.transform.apply(signature.activationPoint());
    projection.frame = projection.transform.apply(signature.elementFrame());

    if (signature.screenScale() > 0.0) {
        projection.displayScaleRatio = liveWindow.scale / signature.screenScale();
    }

    const auto& fraction = signature.data().clickFraction;
    if (!liveWindow.frame.contains(projection.point) && fraction &&
        fraction->x >= 0.0 && fraction->x <= 1.0 && fraction->y >= 0.0 && fraction->y <= 1.0) {
        projection.point = Point(liveWindow.frame.x + fraction->x * liveWindow.frame.width,
                                 liveWindow.frame.y + fraction->y * liveWindow.frame.height);
        projection.usedClickFraction = true;
        projection.notes.push_back("projected point left the window; used recorded click fraction");
    }

    RETICLE_LOG_DEBUG().component("projection").message("Activation point projected")
        .context("projection", projection.toJson());
    return projection;
}

} // namespace reticle
