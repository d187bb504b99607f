#include <iostream>
#include "test_support.h"
#include "introspection/snapshot_introspector.h"
#include "targeting/candidate_search.h"
#include "targeting/geometry_projector.h"
#include "targeting/hit_test_confirmer.h"
#include "common/thread_pool.h"

using namespace reticle;
using namespace reticle::testing;

namespace {

nlohmann::json button(const std::string& id, const std::string& label, double x, double y,
                      double w = 100, double h = 40) {
    return nlohmann::json{
        {"id", id}, {"role", "AXButton"}, {"labels", nlohmann::json::array({label})},
        {"frame", frameJson(x, y, w, h)}, {"actions", nlohmann::json::array({"AXPress"})}
    };
}

/**
 * @brief Mail window with replaced toolbar and message group contents
 */
nlohmann::json rearranged(const nlohmann::json& toolbarChildren,
                          const nlohmann::json& messageChildren = nlohmann::json::array()) {
    nlohmann::json window = mailWindow();
    window["root"]["children"][0]["children"] = toolbarChildren;
    window["root"]["children"][1]["children"] = messageChildren;
    return snapshotOf({window});
}

struct SearchFixture {
    SnapshotIntrospector introspector;
    ElementSignature signature;
    WindowInfo window;
    Projection projection;
    CandidateScorer scorer;

    explicit SearchFixture(const nlohmann::json& snapshot)
        : introspector(snapshot),
          signature(sendSignature()),
          window(introspector.listWindows(std::nullopt).front()),
          projection(GeometryProjector().project(signature, window)),
          scorer(signature, introspector, SimilarityWeights(), projection.transform.scaleX,
                 projection.transform.scaleY, projection.point) {}

    SearchContext context(NodeRef hit, double radiusPx = 16.0, SearchLimits limits = SearchLimits()) {
        return SearchContext{signature, introspector, window, projection, hit, radiusPx, limits};
    }
};

}

void testDirectHitAccepted() {
    std::cout << "[TEST] Direct hit accepted\n";

    SearchFixture f(mailSnapshot());
    CandidateSearch search;
    PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);
    CHECK(prediction.hitNode.id == "send");
    CHECK(prediction.accepted);
    CHECK_NEAR(prediction.candidate->score, 1.0, 1e-9);
    CHECK(prediction.candidate->strategy == "direct_hit");
    CHECK(prediction.candidate->ancestors.size() == 2);

    std::cout << "[OK] Direct hit test passed\n\n";
}

void testChildrenScanFindsMovedButton() {
    std::cout << "[TEST] Children scan finds moved button\n";

    SearchFixture f(rearranged(nlohmann::json::array({
        button("reply", "Reply", 640, 100),
        button("archive", "Archive", 960, 100),
        button("send", "Send", 1080, 100)
    })));
    CandidateSearch search;

    PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);
    CHECK(prediction.hitNode.id == "toolbar");
    CHECK(!prediction.accepted);
    CHECK(prediction.candidate->score == 0.0);
    // No button above the toolbar to climb to
    CHECK(prediction.bubbledLevels == 0);
    CHECK(prediction.candidate->node.id == "toolbar");

    RefinementResult refinement = search.refine(f.context(prediction.hitNode), f.scorer, 0.7);
    CHECK(refinement.found());
    CHECK(refinement.strategy == "children_scan");
    CHECK(refinement.chosen->node.id == "send");
    CHECK(refinement.strategies.size() == 1);

    std::cout << "[OK] Children scan test passed\n\n";
}

void testNeighborScanRespectsRadius() {
    std::cout << "[TEST] Neighbor scan respects radius\n";

    // Reply is drawn on top of the projected point; Send sits 12px away
    nlohmann::json snapshot = rearranged(nlohmann::json::array({
        button("send", "Send", 812, 100),
        button("reply", "Reply", 800, 100)
    }));

    {
        SearchFixture f(snapshot);
        CandidateSearch search;
        PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);
        CHECK(prediction.hitNode.id == "reply");
        CHECK(!prediction.accepted);

        RefinementResult refinement = search.refine(f.context(prediction.hitNode, 16.0), f.scorer, 0.7);
        CHECK(refinement.found());
        CHECK(refinement.strategy == "neighbor_scan");
        CHECK(refinement.chosen->node.id == "send");
        CHECK_NEAR(refinement.chosen->distance, 12.0, 1e-9);
    }

    {
        SearchFixture f(snapshot);
        CandidateSearch search;
        PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);
        RefinementResult refinement = search.refine(f.context(prediction.hitNode, 8.0), f.scorer, 0.7);
        CHECK(refinement.found());
        CHECK(refinement.strategy == "tree_search");
        CHECK(refinement.strategies[1]["detail"]["in_radius"] == 0);
    }

    std::cout << "[OK] Neighbor scan test passed\n\n";
}

void testTreeSearchFindsReparentedButton() {
    std::cout << "[TEST] Tree search finds reparented button\n";

    SearchFixture f(rearranged(
        nlohmann::json::array({button("reply", "Reply", 640, 100), button("archive", "Archive", 960, 100)}),
        nlohmann::json::array({button("send", "Send", 600, 500)})));
    CandidateSearch search;

    PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);
    CHECK(prediction.hitNode.id == "toolbar");

    RefinementResult refinement = search.refine(f.context(prediction.hitNode), f.scorer, 0.7);
    CHECK(refinement.found());
    CHECK(refinement.strategy == "tree_search");
    CHECK(refinement.chosen->node.id == "send");
    CHECK_NEAR(refinement.chosen->breakdown.ancestry, 0.5, 1e-9);
    CHECK_NEAR(refinement.chosen->score, 0.875, 1e-9);
    CHECK(refinement.strategies.size() == 3);
    CHECK_NEAR(refinement.strategies[0]["best_score"].get<double>(), 0.5, 1e-9);

    std::cout << "[OK] Tree search test passed\n\n";
}

void testTreeSearchBounds() {
    std::cout << "[TEST] Tree search bounds\n";

    SearchFixture f(rearranged(
        nlohmann::json::array({button("reply", "Reply", 640, 100)}),
        nlohmann::json::array({button("send", "Send", 600, 500)})));

    SearchLimits tight;
    tight.maxNodes = 3;
    TreeSearchStrategy tree;
    StrategyResult truncated = tree.search(f.context(NodeRef(), 16.0, tight), f.scorer);
    CHECK(truncated.detail["truncated"] == true);
    CHECK(truncated.detail["visited"] == 3);
    CHECK(truncated.pool.empty());

    SearchLimits shallow;
    shallow.maxDepth = 1;
    StrategyResult depthLimited = tree.search(f.context(NodeRef(), 16.0, shallow), f.scorer);
    CHECK(depthLimited.pool.empty());
    CHECK(depthLimited.detail["truncated"] == false);

    StrategyResult full = tree.search(f.context(NodeRef()), f.scorer);
    CHECK(full.pool.size() == 2);

    std::cout << "[OK] Tree search bounds test passed\n\n";
}

void testNoiseNodesFiltered() {
    std::cout << "[TEST] Noise nodes filtered\n";

    SearchLimits limits;
    CHECK(TreeSearchStrategy::isMicroscopic(Rect(0, 0, 4, 40), limits));
    CHECK(!TreeSearchStrategy::isMicroscopic(Rect(0, 0, 100, 40), limits));
    CHECK(TreeSearchStrategy::isLineLike(Rect(0, 0, 400, 1), limits));
    CHECK(TreeSearchStrategy::isLineLike(Rect(0, 0, 6, 300), limits));
    CHECK(!TreeSearchStrategy::isLineLike(Rect(0, 0, 6, 30), limits));
    CHECK(!TreeSearchStrategy::isLineLike(Rect(0, 0, 100, 40), limits));

    // A one-pixel separator styled as a button is never scored
    SearchFixture f(rearranged(nlohmann::json::array({button("separator", "Send", 600, 150, 600, 1)})));
    StrategyResult result = TreeSearchStrategy().search(f.context(NodeRef()), f.scorer);
    CHECK(result.pool.empty());
    CHECK(result.detail["filtered"] == 1);

    std::cout << "[OK] Noise filter test passed\n\n";
}

void testBelowThresholdKeepsBest() {
    std::cout << "[TEST] Below threshold keeps best\n";

    SearchFixture f(rearranged(nlohmann::json::array({
        button("reply", "Reply", 640, 100),
        button("archive", "Archive", 960, 100)
    })));
    CandidateSearch search;
    RefinementResult refinement = search.refine(f.context(NodeRef("toolbar")), f.scorer, 0.7);
    CHECK(!refinement.found());
    CHECK(refinement.best.has_value());
    CHECK_NEAR(refinement.best->score, 0.5, 1e-9);
    CHECK(refinement.strategy.empty());
    CHECK(refinement.toJson()["found"] == false);

    std::cout << "[OK] Below threshold test passed\n\n";
}

void testCandidateOrdering() {
    std::cout << "[TEST] Candidate ordering\n";

    Candidate a;
    a.score = 0.8;
    a.distance = 30.0;
    a.discoveryIndex = 0;
    Candidate b = a;
    b.score = 0.9;
    b.discoveryIndex = 1;
    CHECK(b.betterThan(a));
    CHECK(!a.betterThan(b));

    Candidate closer = a;
    closer.distance = 5.0;
    closer.discoveryIndex = 2;
    CHECK(closer.betterThan(a));

    Candidate later = a;
    later.discoveryIndex = 3;
    CHECK(a.betterThan(later));
    CHECK(!later.betterThan(a));

    std::vector<Candidate> pool = {later, a, closer, b};
    CHECK(CandidateSearch::bestOf(pool)->discoveryIndex == 1);
    pool.pop_back();
    CHECK(CandidateSearch::bestOf(pool)->discoveryIndex == 2);
    CHECK(!CandidateSearch::bestOf({}).has_value());

    std::cout << "[OK] Candidate ordering test passed\n\n";
}

void testVisualStrategyUnavailable() {
    std::cout << "[TEST] Visual strategy unavailable\n";

    SearchFixture f(rearranged(nlohmann::json::array()));
    VisualSearchStrategy visual;
    SearchContext context = f.context(NodeRef(), 20.0);

    VisualQuery query = VisualSearchStrategy::buildQuery(context);
    CHECK(query.region == Rect(780, 80, 140, 80));
    CHECK(query.expectedLabel == "Send");

    StrategyResult result = visual.search(context, f.scorer);
    CHECK(!result.available);
    CHECK(result.pool.empty());

    CandidateSearch search({std::make_shared<VisualSearchStrategy>()});
    RefinementResult refinement = search.refine(context, f.scorer, 0.7);
    CHECK(!refinement.found());
    CHECK(refinement.strategies[0]["available"] == false);

    std::cout << "[OK] Visual strategy test passed\n\n";
}

void testAttributesFetchedOnce() {
    std::cout << "[TEST] Attributes fetched once\n";

    SearchFixture f(rearranged(
        nlohmann::json::array({button("reply", "Reply", 640, 100), button("archive", "Archive", 960, 100)}),
        nlohmann::json::array({button("send", "Send", 600, 500)})));
    f.introspector.resetCallCounts();

    CandidateSearch search;
    search.refine(f.context(NodeRef("toolbar")), f.scorer, 0.7);
    int first = f.introspector.callCount("attributes");
    search.refine(f.context(NodeRef("toolbar")), f.scorer, 0.7);
    CHECK(f.introspector.callCount("attributes") == first);

    std::cout << "[OK] Attribute cache test passed\n\n";
}

void testDirectHitClimbsToButton() {
    std::cout << "[TEST] Direct hit on a label climbs to its button\n";

    SearchFixture f(snapshotOf({withSendLabelChild(mailWindow())}));
    CandidateSearch search;
    PredictionResult prediction = search.predict(f.context(NodeRef()), f.scorer, 0.85);

    CHECK(prediction.hitNode.id == "send_text");
    CHECK(prediction.bubbledLevels == 1);
    CHECK(prediction.accepted);
    CHECK(prediction.candidate->node.id == "send");
    CHECK(prediction.candidate->strategy == "direct_hit");
    CHECK_NEAR(prediction.candidate->score, 1.0, 1e-9);
    CHECK(prediction.toJson()["bubbled_levels"] == 1);

    std::cout << "[OK] Label climb test passed\n\n";
}

void testExcludedNodesNeverChosen() {
    std::cout << "[TEST] Excluded nodes never chosen\n";

    SearchFixture f(mailSnapshot());
    CandidateSearch search;
    SearchContext context = f.context(NodeRef("toolbar"));
    context.excluded.push_back(NodeRef("send"));

    RefinementResult refinement = search.refine(context, f.scorer, 0.7);
    CHECK(!refinement.found());
    CHECK(refinement.best->node.id != "send");
    CHECK(refinement.strategies[0]["excluded"] == 1);

    std::cout << "[OK] Exclusion test passed\n\n";
}

void testConfirmationAcceptsDescendantHit() {
    std::cout << "[TEST] Confirmation accepts a hit inside the target\n";

    SearchFixture f(snapshotOf({withSendLabelChild(mailWindow())}));
    ThreadPool pool(1);
    HitTestConfirmer confirmer(pool, std::chrono::milliseconds(1000));
    std::optional<Candidate> send = f.scorer.score(NodeRef("send"), "tree_search");

    ConfirmationResult confirmation = confirmer.confirm(*send, f.signature, f.projection.transform,
                                                        f.introspector, f.window.ref);
    CHECK(confirmation.confirmed);
    CHECK(confirmation.returned.id == "send_text");
    CHECK(confirmation.depth == 1);
    CHECK(confirmation.detail == "descendant of target");
    CHECK(confirmation.point == Point(850, 120));

    // The toolbar is an ancestor of Send, not Send itself
    ConfirmationResult beside = confirmer.confirmAny(*send, {Point(620, 120)}, f.introspector, f.window.ref);
    CHECK(!beside.confirmed);
    CHECK(beside.returned.id == "toolbar");
    CHECK(beside.depth == -1);
    CHECK(beside.detail == "different node at point");

    pool.shutdown();
    std::cout << "[OK] Descendant hit test passed\n\n";
}

void testNudgePointsStayInsideFrame() {
    std::cout << "[TEST] Nudge points stay inside the frame\n";

    SearchFixture f(mailSnapshot());
    std::optional<Candidate> send = f.scorer.score(NodeRef("send"), "tree_search");
    const Rect& frame = send->attributes.frame();

    std::vector<Point> fromCenter = HitTestConfirmer::nudgePoints(*send, Point(850, 120));
    CHECK(fromCenter.size() == 8);
    CHECK(fromCenter[0] == Point(850, 110));
    CHECK(fromCenter[1] == Point(850, 130));
    for (const auto& p : fromCenter) {
        CHECK(frame.contains(p));
        CHECK(!p.near(Point(850, 120), 1.0));
    }

    std::vector<Point> fromCorner = HitTestConfirmer::nudgePoints(*send, Point(805, 104));
    CHECK(fromCorner.size() == 9);
    CHECK(fromCorner[0] == Point(850, 120));
    CHECK(fromCorner[1] == Point(825, 110));

    std::cout << "[OK] Nudge point test passed\n\n";
}

void testNudgeFindsUncoveredPart() {
    std::cout << "[TEST] Nudge finds the uncovered part of a target\n";

    nlohmann::json window = mailWindow();
    window["root"]["children"].push_back({
        {"id", "tooltip"}, {"role", "AXGroup"}, {"frame", frameJson(790, 95, 80, 50)}
    });
    SearchFixture f(snapshotOf({window}));
    ThreadPool pool(1);
    HitTestConfirmer confirmer(pool, std::chrono::milliseconds(1000));
    std::optional<Candidate> send = f.scorer.score(NodeRef("send"), "tree_search");

    ConfirmationResult first = confirmer.confirm(*send, f.signature, f.projection.transform,
                                                 f.introspector, f.window.ref);
    CHECK(!first.confirmed);
    CHECK(first.returned.id == "tooltip");

    ConfirmationResult nudged = confirmer.confirmAny(*send, HitTestConfirmer::nudgePoints(*send, first.point),
                                                     f.introspector, f.window.ref);
    CHECK(nudged.confirmed);
    CHECK(nudged.point == Point(875, 120));
    CHECK(nudged.tried.size() == 4);
    CHECK(nudged.toJson()["tried"].size() == 4);

    pool.shutdown();
    std::cout << "[OK] Nudge test passed\n\n";
}

int main() {
    std::cout << "=== Reticle Candidate Search Test Suite ===\n\n";

    try {
        testDirectHitAccepted();
        testChildrenScanFindsMovedButton();
        testNeighborScanRespectsRadius();
        testTreeSearchFindsReparentedButton();
        testTreeSearchBounds();
        testNoiseNodesFiltered();
        testBelowThresholdKeepsBest();
        testCandidateOrdering();
        testVisualStrategyUnavailable();
        testAttributesFetchedOnce();
        testDirectHitClimbsToButton();
        testExcludedNodesNeverChosen();
        testConfirmationAcceptsDescendantHit();
        testNudgePointsStayInsideFrame();
        testNudgeFindsUncoveredPart();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
