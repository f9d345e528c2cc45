#include "TestCommon.hpp"
#include "inference/KnnClassifier.hpp"
#include "inference/OneHandAssist.hpp"

using inference::KnnClassifier;
using inference::OneHandAssist;
using math::LandmarkNormalizer;

bool test_expand_candidates() {
    const auto hand = LandmarkNormalizer::normalize(makeHand(1));

    // Hand in slot 2: base differs from every slot-1 variant
    const auto base = LandmarkNormalizer::concatSlots({}, hand);
    auto candidates = OneHandAssist::expand(base, hand);
    bool ok = candidates.size() == 4;   // base == [0 | hand]
    ok = ok && candidates[0] == base;
    ok = ok && candidates[1] == LandmarkNormalizer::concatSlots(hand, {});

    for (const auto& c : candidates) ok = ok && c.size() == core::QUERY_FEATURE_LENGTH;

    // No usable hand: only the base query
    auto onlyBase = OneHandAssist::expand(base, core::FeatureVector(10, 1.0f));
    ok = ok && onlyBase.size() == 1 && onlyBase[0] == base;

    print_test_result("expand yields de-duplicated slot/mirror variants", ok);
    return ok;
}

bool test_symmetric_hand_dedup() {
    // x == 0 everywhere: mirroring changes nothing (and -0 folds to 0)
    core::FeatureVector hand(core::HAND_FEATURE_LENGTH, 0.0f);
    for (size_t i = 1; i < hand.size(); i += 3) hand[i] = 0.5f;
    const auto base = LandmarkNormalizer::concatSlots(hand, {});

    auto candidates = OneHandAssist::expand(base, hand);
    bool ok = candidates.size() == 2;
    print_test_result("mirror-symmetric hand collapses duplicate candidates", ok);
    return ok;
}

bool test_single_hand_recovers_slot_one_sample() {
    core::ReferenceSet refs;
    const auto tigerHand = LandmarkNormalizer::normalize(makeHand(2));
    refs["tiger"] = cluster("tiger", LandmarkNormalizer::concatSlots(tigerHand, {}));
    refs["dog"] = cluster("dog", twoHandFeatures(4, 5));
    KnnClassifier classifier(refs);

    // Tracker labelled the hand Right, so the plain query puts it in slot 2
    auto query = LandmarkNormalizer::buildFeatures({makeHand(2, core::Handedness::Right)});
    auto plain = classifier.predict(query.features);
    auto assisted = OneHandAssist::predict(classifier, query.features, tigerHand);

    bool ok = plain.isIdle();
    ok = ok && assisted.label == "tiger" && assisted.confidence >= 0.9f && assisted.distance < 1e-3f;
    print_test_result("one hand matches a slot-1 reference via assist", ok);
    return ok;
}

bool test_mirrored_hand_matches() {
    core::ReferenceSet refs;
    const auto hand = LandmarkNormalizer::normalize(makeHand(3));
    refs["bird"] = cluster("bird", LandmarkNormalizer::concatSlots({}, LandmarkNormalizer::mirror(hand)));
    KnnClassifier classifier(refs);

    auto base = LandmarkNormalizer::concatSlots(hand, {});
    auto p = OneHandAssist::predict(classifier, base, hand);
    bool ok = p.label == "bird" && p.confidence >= 0.9f;
    print_test_result("mirrored opposite-slot variant is considered", ok);
    return ok;
}

bool test_select_best_ordering() {
    core::Prediction idle;
    idle.distance = 0.1f;

    core::Prediction weak{"ox", 0.5f, 1.2f};
    core::Prediction strong{"dog", 0.8f, 0.9f};
    core::Prediction tieCloser{"ram", 0.8f, 0.4f};

    bool ok = OneHandAssist::selectBest({}).isIdle();
    ok = ok && OneHandAssist::selectBest({idle, weak}).label == "ox";         // Non-idle beats idle
    ok = ok && OneHandAssist::selectBest({weak, strong}).label == "dog";      // Higher confidence
    ok = ok && OneHandAssist::selectBest({strong, tieCloser}).label == "ram"; // Tie -> smaller distance
    ok = ok && OneHandAssist::selectBest({tieCloser, strong}).label == "ram";
    ok = ok && OneHandAssist::selectBest({idle, idle}).isIdle();
    print_test_result("selectBest prefers non-idle, confidence, then distance", ok);
    return ok;
}

int main() {
    std::cout << "=== OneHandAssist tests ===" << std::endl;

    std::vector<bool> results;
    results.push_back(test_expand_candidates());
    results.push_back(test_symmetric_hand_dedup());
    results.push_back(test_single_hand_recovers_slot_one_sample());
    results.push_back(test_mirrored_hand_matches());
    results.push_back(test_select_best_ordering());

    return summarize("OneHandAssist", results);
}
