#include "TestCommon.hpp"
#include "core/TemporalVote.hpp"

#include <random>
#include <stdexcept>

using core::applyTemporalVote;
using core::TemporalVoteEngine;
using core::VoteParams;
using core::VoteWindow;

bool test_required_hits_stabilize() {
    VoteParams params;   // window 2, ttl 700, hits 2, min 0.2
    VoteWindow window;

    auto r1 = applyTemporalVote(window, "tiger", 0.8f, 0, true, params);
    bool ok = r1.label == core::IDLE_LABEL && r1.hits == 1 && r1.confidence == 0.0f;

    auto r2 = applyTemporalVote(r1.nextWindow, "Tiger", 0.6f, 70, true, params);
    ok = ok && r2.label == "tiger" && r2.hits == 2 && near(r2.confidence, 0.7f);
    print_test_result("consecutive matches within the TTL become stable", ok);
    return ok;
}

bool test_ttl_gap_resets() {
    VoteParams params;
    VoteWindow window;

    auto r1 = applyTemporalVote(window, "ox", 0.9f, 0, true, params);
    auto r2 = applyTemporalVote(r1.nextWindow, "ox", 0.9f, 701, true, params);
    bool ok = r2.label == core::IDLE_LABEL && r2.hits == 1 && r2.nextWindow.size() == 1;

    // Exactly at the TTL the entry is still alive
    auto r3 = applyTemporalVote(r1.nextWindow, "ox", 0.9f, 700, true, params);
    ok = ok && r3.label == "ox";
    print_test_result("entries older than the TTL never count", ok);
    return ok;
}

bool test_rejected_frames() {
    VoteParams params;
    VoteWindow window;

    auto r1 = applyTemporalVote(window, "dog", 0.9f, 0, false, params);
    bool ok = r1.nextWindow.empty();
    auto r2 = applyTemporalVote(window, "dog", 0.1f, 0, true, params);
    ok = ok && r2.nextWindow.empty();
    auto r3 = applyTemporalVote(window, "idle", 0.9f, 0, true, params);
    ok = ok && r3.nextWindow.empty();
    auto r4 = applyTemporalVote(window, "none", 0.9f, 0, true, params);
    ok = ok && r4.nextWindow.empty();

    // Rejected frames still expire old entries
    auto seeded = applyTemporalVote(window, "dog", 0.9f, 0, true, params);
    auto r5 = applyTemporalVote(seeded.nextWindow, "dog", 0.9f, 900, false, params);
    ok = ok && r5.nextWindow.empty();
    print_test_result("disallowed, idle and low-confidence frames are not inserted", ok);
    return ok;
}

bool test_aliases_share_votes() {
    VoteParams params;
    VoteWindow window;
    auto r1 = applyTemporalVote(window, "Rabbit", 0.7f, 0, true, params);
    auto r2 = applyTemporalVote(r1.nextWindow, "hare", 0.7f, 70, true, params);
    bool ok = r2.label == "hare" && r2.hits == 2;
    print_test_result("aliases vote for the canonical label", ok);
    return ok;
}

bool test_window_bound() {
    std::mt19937 rng(42);
    const char* labels[] = {"tiger", "ox", "dog", "idle", "snake"};

    bool ok = true;
    for (int size = 1; size <= 4 && ok; ++size) {
        VoteParams params;
        params.windowSize = size;
        params.requiredHits = 1;
        VoteWindow window;
        int64_t t = 0;
        for (int i = 0; i < 300 && ok; ++i) {
            t += static_cast<int64_t>(rng() % 400);
            auto r = applyTemporalVote(window, labels[rng() % 5], static_cast<float>(rng() % 100) / 100.0f,
                                       t, rng() % 4 != 0, params);
            ok = r.nextWindow.size() <= static_cast<size_t>(size);
            window = r.nextWindow;
        }
    }
    print_test_result("window never exceeds windowSize", ok);
    return ok;
}

bool test_tie_prefers_confidence() {
    VoteParams params;
    params.windowSize = 4;
    VoteWindow window;
    auto r = applyTemporalVote(window, "ox", 0.5f, 0, true, params);
    r = applyTemporalVote(r.nextWindow, "dog", 0.9f, 10, true, params);
    r = applyTemporalVote(r.nextWindow, "ox", 0.5f, 20, true, params);
    r = applyTemporalVote(r.nextWindow, "dog", 0.9f, 30, true, params);
    bool ok = r.label == "dog" && r.hits == 2 && near(r.confidence, 0.9f);
    print_test_result("equal hit counts resolve to the higher average confidence", ok);
    return ok;
}

bool test_invalid_params() {
    VoteParams params;
    params.windowSize = 0;
    bool windowThrows = false;
    try {
        (void)applyTemporalVote({}, "ox", 0.9f, 0, true, params);
    } catch (const std::invalid_argument&) {
        windowThrows = true;
    }

    params.windowSize = 2;
    params.requiredHits = 0;
    bool hitsThrows = false;
    try {
        TemporalVoteEngine::Config config;
        config.params = params;
        TemporalVoteEngine engine(config);
    } catch (const std::invalid_argument&) {
        hitsThrows = true;
    }
    bool ok = windowThrows && hitsThrows;
    print_test_result("windowSize < 1 or requiredHits < 1 is rejected", ok);
    return ok;
}

bool test_occlusion_grace() {
    TemporalVoteEngine::Config config;
    config.params.ttlMs = 100;
    TemporalVoteEngine engine(config);

    engine.vote("tiger", 0.8f, 0, true);
    auto stable = engine.vote("tiger", 0.8f, 70, true);
    bool ok = stable.label == "tiger" && near(stable.confidence, 0.8f);

    // Window expired and the frame is rejected: hold the last label briefly
    auto held = engine.vote("tiger", 0.8f, 200, false);
    ok = ok && held.label == "tiger" && held.hits == 0;
    ok = ok && held.confidence < 0.8f && held.confidence > 0.0f;
    ok = ok && near(held.confidence, 0.8f * static_cast<float>(std::pow(0.9, 130.0 / (1000.0 / 30.0))), 1e-3f);

    // Beyond the grace period
    auto dropped = engine.vote("idle", 0.0f, 400, true);
    ok = ok && dropped.label == core::IDLE_LABEL;

    // A different valid label is not masked by the hold-over
    TemporalVoteEngine other(config);
    other.vote("tiger", 0.8f, 0, true);
    other.vote("tiger", 0.8f, 70, true);
    auto switched = other.vote("ox", 0.8f, 200, true);
    ok = ok && switched.label == core::IDLE_LABEL && switched.hits == 1;

    engine.reset();
    ok = ok && engine.window().empty();
    print_test_result("stable label is held through short occlusions", ok);
    return ok;
}

int main() {
    std::cout << "=== TemporalVote tests ===" << std::endl;

    std::vector<bool> results;
    results.push_back(test_required_hits_stabilize());
    results.push_back(test_ttl_gap_resets());
    results.push_back(test_rejected_frames());
    results.push_back(test_aliases_share_votes());
    results.push_back(test_window_bound());
    results.push_back(test_tie_prefers_confidence());
    results.push_back(test_invalid_params());
    results.push_back(test_occlusion_grace());

    return summarize("TemporalVote", results);
}
