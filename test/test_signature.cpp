#include <iostream>
#include "test_support.h"
#include "common/error_handler.h"
#include "signature/element_signature.h"
#include "signature/signature_store.h"

using namespace reticle;
using namespace reticle::testing;

namespace {

CandidateFeatures liveSend(const std::string& role = "AXButton",
                           const std::vector<std::string>& labels = {"Send"},
                           Rect frame = Rect(800, 100, 100, 40)) {
    CandidateFeatures features;
    features.attributes = NodeAttributes(role, labels, frame);
    features.ancestors = {AncestorEntry{"AXToolbar", ""}, AncestorEntry{"AXWindow", "Inbox"}};
    return features;
}

ErrorType thrownType(const nlohmann::json& recording) {
    try {
        SignatureStore::fromJson(recording);
    } catch (const ReticleException& e) {
        return e.type();
    }
    return ErrorType::UNKNOWN_ERROR;
}

}

void testRecordingToRelativeGeometry() {
    std::cout << "[TEST] Recording converted to window-relative geometry\n";

    nlohmann::json recording = sendRecording();
    recording["window_frame"] = frameJson(100, 50, 1200, 800);
    recording["frame"] = frameJson(900, 150, 100, 40);
    recording["activation_point"] = {{"x", 950}, {"y", 170}};
    recording["toolbar_hint"] = "top";

    ElementSignature signature = ElementSignature::fromJson(recording);
    CHECK(signature.windowFrame() == Rect(100, 50, 1200, 800));
    CHECK(signature.elementFrame() == Rect(800, 100, 100, 40));
    CHECK(signature.activationPoint() == Point(850, 120));
    CHECK(signature.activationOffset() == Point(50, 20));
    CHECK(signature.data().extra.value("toolbar_hint", "") == "top");
    CHECK(signature.data().schemaVersion == 2);

    nlohmann::json written = signature.toJson();
    CHECK(written["frame"].get<Rect>() == Rect(900, 150, 100, 40));
    CHECK(written["toolbar_hint"] == "top");

    std::cout << "[OK] Relative geometry test passed\n\n";
}

void testActivationPointFallbacks() {
    std::cout << "[TEST] Activation point fallbacks\n";

    nlohmann::json recording = sendRecording();
    recording["activation_point"] = {{"x", 5}, {"y", 5}};
    recording["click_point"] = {{"x", 820}, {"y", 110}};
    CHECK(ElementSignature::fromJson(recording).activationPoint() == Point(820, 110));

    recording.erase("activation_point");
    recording.erase("click_point");
    CHECK(ElementSignature::fromJson(recording).activationPoint() == Point(850, 120));

    std::cout << "[OK] Activation point fallback test passed\n\n";
}

void testBestLabelResolution() {
    std::cout << "[TEST] Best label resolution\n";

    CHECK(sendSignature().bestLabel() == "Send");

    nlohmann::json recording = sendRecording();
    recording["title"] = "0.0";
    recording["parent_chain"] = nlohmann::json::array({
        {{"role", "AXCell"}, {"title", ""}},
        {{"role", "AXRow"}, {"title", "Quarterly report"}},
        {{"role", "AXWindow"}, {"title", "Inbox"}}
    });
    recording["role"] = "AXCell";
    ElementSignature cell = ElementSignature::fromJson(recording);
    CHECK(cell.labels().empty());
    CHECK(cell.bestLabel() == "Quarterly report");

    std::cout << "[OK] Best label test passed\n\n";
}

void testInvariantViolationsRejected() {
    std::cout << "[TEST] Invariant violations rejected\n";

    nlohmann::json outsideWindow = sendRecording();
    outsideWindow["frame"] = frameJson(1150, 100, 100, 40);
    outsideWindow["activation_point"] = {{"x", 1160}, {"y", 120}};
    CHECK(thrownType(outsideWindow) == ErrorType::SIGNATURE_FORMAT_ERROR);

    SignatureData data = sendSignature().data();
    data.activationPoint = Point(10, 10);
    CHECK_THROWS(ElementSignature{data});

    nlohmann::json noRole = sendRecording();
    noRole.erase("role");
    CHECK(thrownType(noRole) == ErrorType::SIGNATURE_FORMAT_ERROR);

    nlohmann::json emptyWindow = sendRecording();
    emptyWindow["window_frame"] = frameJson(0, 0, 0, 800);
    CHECK(thrownType(emptyWindow) == ErrorType::SIGNATURE_FORMAT_ERROR);

    std::cout << "[OK] Invariant test passed\n\n";
}

void testSimilarity() {
    std::cout << "[TEST] Similarity\n";

    ElementSignature signature = sendSignature();
    SimilarityWeights weights;

    CHECK_NEAR(signature.similarity(liveSend(), weights), 1.0, 1e-9);
    CHECK(signature.similarity(liveSend("AXCheckBox"), weights) == 0.0);
    CHECK(!signature.explain(liveSend("AXCheckBox"), weights).roleMatched);

    double exact = signature.similarity(liveSend(), weights);
    double partial = signature.similarity(liveSend("AXButton", {"Send now"}), weights);
    double other = signature.similarity(liveSend("AXButton", {"Archive"}), weights);
    CHECK(exact > partial);
    CHECK(partial > other);
    CHECK_NEAR(partial, 0.8, 1e-9);
    CHECK_NEAR(other, 0.5, 1e-9);

    // Case and whitespace do not matter
    CHECK_NEAR(signature.similarity(liveSend("button", {"  SEND "}), weights), 1.0, 1e-9);

    // Size change proportional to the window costs nothing
    CandidateFeatures halved = liveSend("AXButton", {"Send"}, Rect(400, 50, 50, 20));
    halved.windowScaleX = 0.5;
    halved.windowScaleY = 0.5;
    CHECK_NEAR(signature.similarity(halved, weights), 1.0, 1e-9);
    CandidateFeatures shrunk = liveSend("AXButton", {"Send"}, Rect(400, 50, 50, 20));
    CHECK(signature.similarity(shrunk, weights) < 1.0);

    // Ancestors that moved cost partial credit
    CandidateFeatures reparented = liveSend();
    reparented.ancestors = {AncestorEntry{"AXGroup", ""}, AncestorEntry{"AXWindow", "Inbox"}};
    SimilarityBreakdown reparentedBreakdown = signature.explain(reparented, weights);
    CHECK_NEAR(reparentedBreakdown.ancestry, 0.5, 1e-9);
    CHECK_NEAR(reparentedBreakdown.score, 0.875, 1e-9);

    // Scores stay normalised whatever the weights
    SimilarityWeights heavy;
    heavy.label = 5.0;
    heavy.ancestry = 2.0;
    CHECK_NEAR(signature.similarity(liveSend(), heavy), 1.0, 1e-9);

    std::cout << "[OK] Similarity test passed\n\n";
}

void testUnlabeledSignatureScoredByStructure() {
    std::cout << "[TEST] Unlabeled signature\n";

    nlohmann::json recording = sendRecording();
    recording.erase("title");
    recording["parent_chain"] = nlohmann::json::array();
    ElementSignature signature = ElementSignature::fromJson(recording);
    CHECK(signature.bestLabel().empty());

    SimilarityBreakdown breakdown = signature.explain(liveSend("AXButton", {"Anything"}), SimilarityWeights());
    CHECK(breakdown.label == 1.0);
    CHECK(breakdown.ancestry == 1.0);

    std::cout << "[OK] Unlabeled signature test passed\n\n";
}

void testSignatureStore() {
    std::cout << "[TEST] Signature store\n";

    nlohmann::json first = sendRecording();
    nlohmann::json second = sendRecording();
    second["title"] = "Archive";
    second["frame"] = frameJson(960, 100, 100, 40);
    second["activation_point"] = {{"x", 1010}, {"y", 120}};
    nlohmann::json third = sendRecording();
    third["title"] = "Reply";
    third["frame"] = frameJson(640, 100, 100, 40);
    third["activation_point"] = {{"x", 690}, {"y", 120}};

    SignatureStore store = SignatureStore::fromJson(nlohmann::json::array({first, second, third}));
    CHECK(store.size() == 3);
    CHECK(store.select().bestLabel() == "Reply");
    CHECK(store.select(0).bestLabel() == "Send");
    CHECK(store.select(1).bestLabel() == "Archive");
    CHECK(store.at(2).bestLabel() == "Reply");
    CHECK_THROWS(store.select(3));
    CHECK_THROWS(store.select(-4));

    bool rejected = false;
    try {
        store.select(-1);
    } catch (const ReticleException& e) {
        rejected = true;
        CHECK(e.type() == ErrorType::VALIDATION_ERROR);
        CHECK(e.getErrorInfo().details == "-1 of 3");
    }
    CHECK(rejected);
    CHECK_THROWS(store.at(7));

    SignatureStore single = SignatureStore::fromJson(first);
    CHECK(single.size() == 1);
    CHECK(single.select().bestLabel() == "Send");

    nlohmann::json broken = sendRecording();
    broken["activation_point"] = {{"x", 5000}, {"y", 5000}};
    broken.erase("frame");
    try {
        SignatureStore::fromJson(nlohmann::json::array({first, broken}));
        CHECK(false);
    } catch (const ReticleException& e) {
        CHECK(e.type() == ErrorType::SIGNATURE_FORMAT_ERROR);
        CHECK(e.getErrorInfo().details.find("entry 1") == 0);
    }

    CHECK_THROWS(SignatureStore::fromJson(nlohmann::json::array()).select());
    CHECK_THROWS(SignatureStore::fromFile("does/not/exist.json"));

    std::cout << "[OK] Signature store test passed\n\n";
}

int main() {
    std::cout << "=== Reticle Signature Test Suite ===\n\n";

    try {
        testRecordingToRelativeGeometry();
        testActivationPointFallbacks();
        testBestLabelResolution();
        testInvariantViolationsRejected();
        testSimilarity();
        testUnlabeledSignatureScoredByStructure();
        testSignatureStore();

        std::cout << "\n=== All tests passed successfully! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
}
