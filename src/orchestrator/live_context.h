#ifndef RETICLE_LIVE_CONTEXT_H
#define RETICLE_LIVE_CONTEXT_H

#include <optional>
#include "../introspection/ui_introspector.h"
#include "../targeting/geometry_projector.h"

namespace reticle {

/**
 * @brief Live state bound during one run
 *
 * Created empty at L0, bound at L1, filled at L2. Owned by the run and
 * passed by reference; nothing survives into the next run.
 */
struct LiveContext {
    std::optional<WindowInfo> window;
    std::optional<Projection> projection;
    double identityConfidence = 0.0;

    bool isBound() const { return window.has_value(); }

    void bind(const WindowInfo& info, double confidence) {
        window = info;
        identityConfidence = confidence;
        projection.reset();
    }

    void reset() {
        window.reset();
        projection.reset();
        identityConfidence = 0.0;
    }
};

} // namespace reticle

#endif // RETICLE_LIVE_CONTEXT_H
