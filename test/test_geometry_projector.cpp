#include <iostream>
#include "test_support.h"
#include "targeting/geometry_projector.h"

using namespace reticle;
using namespace reticle::testing;

namespace {

WindowInfo liveWindow(Rect frame, double scale = 2.0) {
    WindowInfo window;
    window.ref = WindowRef("w1");
    window.appName = "Mail";
    window.title = "Inbox";
    window.frame = frame;
    window.scale = scale;
    return window;
}

}

void testStableWindow() {
    std::cout << "[TEST] Stable window\n";

    Projection projection = GeometryProjector().project(sendSignature(), liveWindow(Rect(0, 0, 1200, 800)));
    CHECK(projection.drift == DriftKind::STABLE);
    CHECK(projection.point == Point(850, 120));
    CHECK(projection.frame == Rect(800, 100, 100, 40));
    CHECK(projection.displayScaleRatio == 1.0);
    CHECK(!projection.usedClickFraction);
    CHECK(projection.notes.empty());

    // Sub-pixel jitter is still stable
    Projection jitter = GeometryProjector().project(sendSignature(), liveWindow(Rect(1, -1, 1201, 800)));
    CHECK(jitter.drift == DriftKind::STABLE);

    std::cout << "[OK] Stable window test passed\n\n";
}

void testMovedWindow() {
    std::cout << "[TEST] Moved window\n";

    Projection projection = GeometryProjector().project(sendSignature(), liveWindow(Rect(100, 50, 1200, 800)));
    CHECK(projection.drift == DriftKind::MOVED);
    CHECK(projection.point == Point(950, 170));
    CHECK(projection.frame == Rect(900, 150, 100, 40));
    CHECK(projection.transform.offsetX == 100.0);
    CHECK(projection.transform.offsetY == 50.0);

    std::cout << "[OK] Moved window test passed\n\n";
}

void testResizedWindow() {
    std::cout << "[TEST] Resized window\n";

    Projection grown = GeometryProjector().project(sendSignature(), liveWindow(Rect(0, 0, 1800, 1200)));
    CHECK(grown.drift == DriftKind::RESIZED);
    CHECK_NEAR(grown.transform.scaleX, 1.5, 1e-9);
    CHECK_NEAR(grown.point.x, 1275.0, 1e-9);
    CHECK_NEAR(grown.point.y, 180.0, 1e-9);
    CHECK_NEAR(grown.frame.width, 150.0, 1e-9);

    Projection both = GeometryProjector().project(sendSignature(), liveWindow(Rect(200, 100, 600, 400)));
    CHECK(both.drift == DriftKind::MOVED_AND_RESIZED);
    CHECK_NEAR(both.point.x, 625.0, 1e-9);
    CHECK_NEAR(both.point.y, 160.0, 1e-9);

    // Only one axis changed
    Projection wider = GeometryProjector().project(sendSignature(), liveWindow(Rect(0, 0, 2400, 800)));
    CHECK(wider.drift == DriftKind::RESIZED);
    CHECK_NEAR(wider.point.x, 1700.0, 1e-9);
    CHECK_NEAR(wider.point.y, 120.0, 1e-9);

    std::cout << "[OK] Resized window test passed\n\n";
}

void testDisplayScaleRatio() {
    std::cout << "[TEST] Display scale ratio\n";

    Projection projection = GeometryProjector().project(sendSignature(), liveWindow(Rect(0, 0, 1200, 800), 1.0));
    CHECK_NEAR(projection.displayScaleRatio, 0.5, 1e-9);
    // Logical geometry does not change with the backing scale
    CHECK(projection.point == Point(850, 120));

    std::cout << "[OK] Display scale test passed\n\n";
}

void testZeroSizedRecordedAxis() {
    std::cout << "[TEST] Zero-sized recorded axis\n";

    std::vector<std::string> notes;
    ProjectionTransform transform = GeometryProjector::computeTransform(Rect(0, 0, 0, 400), Rect(10, 10, 300, 800),
                                                                        &notes);
    CHECK(transform.scaleX == 1.0);
    CHECK_NEAR(transform.scaleY, 2.0, 1e-9);
    CHECK(notes.size() == 1);
    CHECK(transform.apply(Point(5, 5)) == Point(15, 20));

    std::cout << "[OK] Zero-sized axis test passed\n\n";
}

void testClickFractionFallback() {
    std::cout << "[TEST] Click fraction fallback\n";

    // Element recorded flush against the right edge, within tolerance
    SignatureData data = sendSignature().data();
    data.windowFrame = Rect(0, 0, 100, 100);
    data.elementFrame = Rect(50, 40, 51, 20);
    data.activationPoint = Point(101.5, 50);
    data.clickFraction = Point(0.9, 0.5);
    ElementSignature signature(data);

    Projection projection = GeometryProjector().project(signature, liveWindow(Rect(0, 0, 100, 100)));
    CHECK(projection.usedClickFraction);
    CHECK_NEAR(projection.point.x, 90.0, 1e-9);
    CHECK_NEAR(projection.point.y, 50.0, 1e-9);
    CHECK(!projection.notes.empty());

    // Without a fraction the projected point is kept as is
    data.clickFraction.reset();
    Projection kept = GeometryProjector().project(ElementSignature(data), liveWindow(Rect(0, 0, 100, 100)));
    CHECK(!kept.usedClickFraction);
    CHECK_NEAR(kept.point.x, 101.5, 1e-9);

    std::cout << "[OK] Click fraction test passed\n\n";
}

int main() {
    std::cout << "=== Reticle Geometry Projector Test Suite ===\n\n";

    try {
        testStableWindow();
        testMovedWindow();
        testResizedWindow();
        testDisplayScaleRatio();
        testZeroSizedRecordedAxis();
        testClickFractionFallback();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
