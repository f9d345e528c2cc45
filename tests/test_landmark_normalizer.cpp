#include "TestCommon.hpp"
#include "core/FaceMotion.hpp"
#include "math/LandmarkNormalizer.hpp"

using math::LandmarkNormalizer;

bool test_translation_invariance() {
    auto base = LandmarkNormalizer::normalize(makeHand(1));
    auto shifted = LandmarkNormalizer::normalize(makeHand(1, core::Handedness::Unknown, 0.37f, -0.21f));

    bool ok = base.size() == core::HAND_FEATURE_LENGTH && shifted.size() == base.size();
    for (size_t i = 0; ok && i < base.size(); ++i) {
        ok = near(base[i], shifted[i], 1e-4f);
    }
    print_test_result("normalize is translation invariant", ok);
    return ok;
}

bool test_scale_invariance() {
    auto base = LandmarkNormalizer::normalize(makeHand(2));
    auto scaled = LandmarkNormalizer::normalize(makeHand(2, core::Handedness::Unknown, 0.1f, 0.1f, 2.5f));

    bool ok = scaled.size() == base.size();
    for (size_t i = 0; ok && i < base.size(); ++i) {
        ok = near(base[i], scaled[i], 1e-4f);
    }
    // Wrist lands on the origin, middle MCP at unit distance
    ok = ok && base[0] == 0.0f && base[1] == 0.0f && base[2] == 0.0f;
    ok = ok && near(base[9 * 3 + 1], -1.0f);
    print_test_result("normalize is scale invariant", ok);
    return ok;
}

bool test_degenerate_hand() {
    core::HandLandmarkSet partial;
    partial.landmarks.resize(10);
    auto out = LandmarkNormalizer::normalize(partial);

    bool ok = out.size() == core::HAND_FEATURE_LENGTH;
    for (float v : out) ok = ok && v == 0.0f;

    // Collapsed hand (wrist == middle MCP) divides by 1 instead of ~0
    auto collapsed = makeHand(0);
    collapsed.landmarks[9] = collapsed.landmarks[0];
    auto c = LandmarkNormalizer::normalize(collapsed);
    for (float v : c) ok = ok && std::isfinite(v);

    print_test_result("incomplete or collapsed hand yields finite output", ok);
    return ok;
}

bool test_mirror_involution() {
    auto v = LandmarkNormalizer::normalize(makeHand(3));
    auto once = LandmarkNormalizer::mirror(v);
    auto twice = LandmarkNormalizer::mirror(once);

    bool ok = twice == v;
    ok = ok && once[3] == -v[3] && once[4] == v[4] && once[5] == v[5];

    core::FeatureVector odd = {1.0f, 2.0f, 3.0f, 4.0f};
    ok = ok && LandmarkNormalizer::mirror(LandmarkNormalizer::mirror(odd)) == odd;
    print_test_result("mirror(mirror(v)) == v", ok);
    return ok;
}

bool test_build_features_slots() {
    auto left = makeHand(1, core::Handedness::Left);
    auto right = makeHand(2, core::Handedness::Right);
    const auto nl = LandmarkNormalizer::normalize(left);
    const auto nr = LandmarkNormalizer::normalize(right);

    // Right listed first still lands in slot 2
    auto q = LandmarkNormalizer::buildFeatures({right, left});
    bool ok = q.numHands == 2 && q.features.size() == core::QUERY_FEATURE_LENGTH;
    ok = ok && std::equal(nl.begin(), nl.end(), q.features.begin());
    ok = ok && std::equal(nr.begin(), nr.end(), q.features.begin() + core::HAND_FEATURE_LENGTH);

    // A lone right hand leaves slot 1 zeroed
    auto single = LandmarkNormalizer::buildFeatures({right});
    ok = ok && single.numHands == 1;
    for (size_t i = 0; i < core::HAND_FEATURE_LENGTH; ++i) ok = ok && single.features[i] == 0.0f;

    // Unknown handedness fills the first free slot
    auto unknown = LandmarkNormalizer::buildFeatures({makeHand(1), makeHand(2)});
    ok = ok && std::equal(nl.begin(), nl.end(), unknown.features.begin());
    ok = ok && std::equal(nr.begin(), nr.end(), unknown.features.begin() + core::HAND_FEATURE_LENGTH);

    auto none = LandmarkNormalizer::buildFeatures({});
    ok = ok && none.numHands == 0 && none.features.empty();

    // Incomplete hands take no slot and are not counted
    core::HandLandmarkSet partial;
    partial.handedness = core::Handedness::Right;
    partial.landmarks.resize(5);
    auto mixed = LandmarkNormalizer::buildFeatures({left, partial});
    ok = ok && mixed.numHands == 1 && mixed.primary == nl;
    for (size_t i = 0; i < core::HAND_FEATURE_LENGTH; ++i) {
        ok = ok && mixed.features[core::HAND_FEATURE_LENGTH + i] == 0.0f;
    }
    auto onlyPartial = LandmarkNormalizer::buildFeatures({partial});
    ok = ok && onlyPartial.numHands == 0 && onlyPartial.features.empty() && onlyPartial.primary.empty();

    print_test_result("buildFeatures assigns hands to slots", ok);
    return ok;
}

bool test_face_motion() {
    std::vector<core::Landmark> face(core::FaceMotion::MIN_LANDMARKS);
    using LI = core::FaceMotion::LandmarkIndices;
    face[LI::LEFT_EYE] = {0.40f, 0.40f, 0.0f};
    face[LI::RIGHT_EYE] = {0.60f, 0.40f, 0.0f};
    face[LI::NOSE] = {0.50f, 0.50f, 0.0f};
    face[LI::MOUTH_UPPER] = {0.50f, 0.56f, 0.0f};
    face[LI::MOUTH_LOWER] = {0.50f, 0.60f, 0.0f};

    auto motion = core::computeFaceMotion(face);
    bool ok = motion.has_value();
    if (ok) {
        ok = near(motion->yaw, 0.0f) && near(motion->anchor.x, 0.5f) && near(motion->anchor.y, 0.58f);
        // (0.18 / 0.2 - 0.35) * 1.2
        ok = ok && near(motion->pitch, 0.66f, 1e-3f);
    }

    // Extreme head turn stays bounded
    face[LI::NOSE] = {-5.0f, 5.0f, 0.0f};
    face[LI::MOUTH_UPPER] = {5.0f, 5.0f, 0.0f};
    face[LI::MOUTH_LOWER] = {5.0f, 5.0f, 0.0f};
    auto extreme = core::computeFaceMotion(face);
    ok = ok && extreme.has_value() && extreme->yaw <= 1.0f && extreme->yaw >= -1.0f &&
         extreme->pitch <= 1.0f && extreme->anchor.x >= 0.04f && extreme->anchor.y <= 0.9f;

    std::vector<core::Landmark> tooFew(100);
    ok = ok && !core::computeFaceMotion(tooFew).has_value();

    print_test_result("face motion is bounded and needs a full mesh", ok);
    return ok;
}

int main() {
    std::cout << "=== LandmarkNormalizer tests ===" << std::endl;

    std::vector<bool> results;
    results.push_back(test_translation_invariance());
    results.push_back(test_scale_invariance());
    results.push_back(test_degenerate_hand());
    results.push_back(test_mirror_involution());
    results.push_back(test_build_features_slots());
    results.push_back(test_face_motion());

    return summarize("LandmarkNormalizer", results);
}
