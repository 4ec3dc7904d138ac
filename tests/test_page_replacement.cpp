#include "../include/paging/page_replacement.hpp"
#include "../include/memory_manager/page_replacement_policy.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>
#include <set>
#include <stdexcept>
#include <vector>

static const std::vector<PageReference> SAMPLE = {1, 2, 3, 2, 4, 1, 5, 2, 1, 2, 3, 4, 5};

static const std::vector<std::vector<PageReference>> SEQUENCES = {
    SAMPLE,
    {7, 0, 1, 2, 0, 3, 0, 4, 2, 3, 0, 3, 2, 1, 2, 0, 1, 7, 0, 1},
    {1, 2, 3, 4, 1, 2, 5, 1, 2, 3, 4, 5},
    {5, 5, 5, 5},
    {-3, 0, -3, 9, 0, 12, -3, 9},
    {1, 2, 3, 4, 5, 6, 1, 2, 3, 4, 5, 6},
};

static FrameSet frames_of(std::initializer_list<int> pages) {
    FrameSet f;
    for (int p : pages) {
        if (p == 0) f.push_back(std::nullopt);
        else f.push_back(p);
    }
    return f;
}

static void check_trace(const PageReplacementResult& r,
                        const std::vector<bool>& faults,
                        const std::vector<FrameSet>& frames) {
    assert(r.trace.size() == faults.size());
    for (size_t i = 0; i < faults.size(); ++i) {
        assert(r.trace[i].reference == SAMPLE[i]);
        assert(r.trace[i].fault == faults[i]);
        assert(r.trace[i].frames == frames[i]);
    }
}

void test_lru_golden_trace() {
    std::cout << "Running test_lru_golden_trace..." << std::endl;
    auto r = run_page_replacement(SAMPLE, 3, LRU);

    assert(r.fault_count == 10);
    check_trace(r,
        {true, true, true, false, true, true, true, true, false, false, true, true, true},
        {frames_of({1, 0, 0}), frames_of({1, 2, 0}), frames_of({1, 2, 3}),
         frames_of({1, 2, 3}), frames_of({4, 2, 3}), frames_of({4, 2, 1}),
         frames_of({4, 5, 1}), frames_of({2, 5, 1}), frames_of({2, 5, 1}),
         frames_of({2, 5, 1}), frames_of({2, 3, 1}), frames_of({2, 3, 4}),
         frames_of({5, 3, 4})});
    std::cout << "test_lru_golden_trace PASSED" << std::endl;
}

void test_optimal_golden_trace() {
    std::cout << "Running test_optimal_golden_trace..." << std::endl;
    auto r = run_page_replacement(SAMPLE, 3, OPTIMAL);

    assert(r.fault_count == 7);
    // At step 11 pages 1 and 2 are never used again; the lower slot goes.
    check_trace(r,
        {true, true, true, false, true, false, true, false, false, false, true, true, false},
        {frames_of({1, 0, 0}), frames_of({1, 2, 0}), frames_of({1, 2, 3}),
         frames_of({1, 2, 3}), frames_of({1, 2, 4}), frames_of({1, 2, 4}),
         frames_of({1, 2, 5}), frames_of({1, 2, 5}), frames_of({1, 2, 5}),
         frames_of({1, 2, 5}), frames_of({3, 2, 5}), frames_of({4, 2, 5}),
         frames_of({4, 2, 5})});
    std::cout << "test_optimal_golden_trace PASSED" << std::endl;
}

void test_empty_sequence() {
    std::cout << "Running test_empty_sequence..." << std::endl;
    for (auto policy : {LRU, OPTIMAL}) {
        auto r = run_page_replacement({}, 4, policy);
        assert(r.fault_count == 0);
        assert(r.trace.empty());
        assert(r.hit_ratio() == 0.0);
    }
    std::cout << "test_empty_sequence PASSED" << std::endl;
}

void test_zero_frames_rejected() {
    std::cout << "Running test_zero_frames_rejected..." << std::endl;
    bool thrown = false;
    try {
        run_page_replacement(SAMPLE, 0, LRU);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "test_zero_frames_rejected PASSED" << std::endl;
}

void test_fault_count_matches_flags() {
    std::cout << "Running test_fault_count_matches_flags..." << std::endl;
    for (const auto& seq : SEQUENCES) {
        for (uint32_t n = 1; n <= 6; ++n) {
            for (auto policy : {LRU, OPTIMAL}) {
                auto r = run_page_replacement(seq, n, policy);
                auto flagged = std::count_if(r.trace.begin(), r.trace.end(),
                                             [](const StepRecord& s) { return s.fault; });
                assert(static_cast<uint32_t>(flagged) == r.fault_count);
                assert(r.trace.size() == seq.size());
                assert(r.hit_count() + r.fault_count == seq.size());
            }
        }
    }
    std::cout << "test_fault_count_matches_flags PASSED" << std::endl;
}

void test_first_reference_always_faults() {
    std::cout << "Running test_first_reference_always_faults..." << std::endl;
    for (const auto& seq : SEQUENCES) {
        for (uint32_t n = 1; n <= 5; ++n) {
            for (auto policy : {LRU, OPTIMAL}) {
                auto r = run_page_replacement(seq, n, policy);
                std::set<PageReference> seen;
                for (size_t i = 0; i < seq.size(); ++i) {
                    if (seen.insert(seq[i]).second)
                        assert(r.trace[i].fault);
                }
            }
        }
    }
    std::cout << "test_first_reference_always_faults PASSED" << std::endl;
}

void test_enough_frames_faults_once_per_page() {
    std::cout << "Running test_enough_frames_faults_once_per_page..." << std::endl;
    for (const auto& seq : SEQUENCES) {
        std::set<PageReference> distinct(seq.begin(), seq.end());
        const uint32_t n = static_cast<uint32_t>(distinct.size());
        auto lru = run_page_replacement(seq, n, LRU);
        auto opt = run_page_replacement(seq, n + 2, OPTIMAL);
        assert(lru.fault_count == distinct.size());
        assert(opt.fault_count == distinct.size());
        assert(run_page_replacement(seq, n, OPTIMAL).fault_count == lru.fault_count);
    }
    std::cout << "test_enough_frames_faults_once_per_page PASSED" << std::endl;
}

void test_optimal_never_worse_as_frames_grow() {
    std::cout << "Running test_optimal_never_worse_as_frames_grow..." << std::endl;
    for (const auto& seq : SEQUENCES) {
        auto rows = compare_policies(seq, 8);
        assert(rows.size() == std::min<size_t>(8, seq.size()));
        for (size_t i = 0; i < rows.size(); ++i) {
            assert(rows[i].num_frames == i + 1);
            assert(rows[i].optimal_faults <= rows[i].lru_faults);
            if (i > 0)
                assert(rows[i].optimal_faults <= rows[i - 1].optimal_faults);
        }
    }
    std::cout << "test_optimal_never_worse_as_frames_grow PASSED" << std::endl;
}

void test_compare_policies_is_bounded() {
    std::cout << "Running test_compare_policies_is_bounded..." << std::endl;
    assert(max_useful_frames({}) == 1);
    assert(max_useful_frames(SAMPLE) == SAMPLE.size());

    auto rows = compare_policies(SAMPLE, std::numeric_limits<uint32_t>::max());
    assert(rows.size() == SAMPLE.size());
    assert(rows.front().num_frames == 1);
    assert(rows.back().num_frames == SAMPLE.size());
    // 5 distinct pages: from 5 frames on every page faults once
    assert(rows.back().lru_faults == 5);
    assert(rows.back().optimal_faults == 5);

    auto empty = compare_policies({}, 100000);
    assert(empty.size() == 1);
    assert(empty[0].lru_faults == 0 && empty[0].optimal_faults == 0);
    std::cout << "test_compare_policies_is_bounded PASSED" << std::endl;
}

void test_lru_victim_requires_resident_page() {
    std::cout << "Running test_lru_victim_requires_resident_page..." << std::endl;
    FrameSet frames = frames_of({1, 2});

    LRUReplacement<PageReference> untracked;
    bool thrown = false;
    try {
        untracked.select_victim(frames, SAMPLE, 0);
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);

    LRUReplacement<PageReference> stale;
    stale.on_load(9);
    thrown = false;
    try {
        stale.select_victim(frames, SAMPLE, 0);
    } catch (const std::logic_error&) {
        thrown = true;
    }
    assert(thrown);
    // the tracked page is kept when no slot holds it
    assert(stale.recency().size() == 1);
    std::cout << "test_lru_victim_requires_resident_page PASSED" << std::endl;
}

void test_snapshots_are_copies() {
    std::cout << "Running test_snapshots_are_copies..." << std::endl;
    auto r = run_page_replacement({1, 2, 3}, 1, LRU);
    assert(r.trace[0].frames == frames_of({1}));
    assert(r.trace[1].frames == frames_of({2}));
    assert(r.trace[2].frames == frames_of({3}));
    std::cout << "test_snapshots_are_copies PASSED" << std::endl;
}

void test_lru_recency_matches_frames() {
    std::cout << "Running test_lru_recency_matches_frames..." << std::endl;
    LRUReplacement<PageReference> lru;
    FrameSet frames(3);
    for (size_t i = 0; i < SAMPLE.size(); ++i) {
        PageReference page = SAMPLE[i];
        auto hit = std::find(frames.begin(), frames.end(), FrameSlot{page});
        if (hit != frames.end()) {
            lru.on_access(page);
        } else {
            auto empty = std::find(frames.begin(), frames.end(), std::nullopt);
            size_t slot = empty != frames.end()
                ? static_cast<size_t>(empty - frames.begin())
                : lru.select_victim(frames, SAMPLE, i);
            frames[slot] = page;
            lru.on_load(page);
        }

        std::multiset<PageReference> resident;
        for (const auto& f : frames)
            if (f) resident.insert(*f);
        std::multiset<PageReference> tracked(lru.recency().begin(), lru.recency().end());
        assert(resident == tracked);
        assert(lru.recency().back() == page);
    }
    std::cout << "test_lru_recency_matches_frames PASSED" << std::endl;
}

void test_optimal_next_use() {
    std::cout << "Running test_optimal_next_use..." << std::endl;
    using Opt = OptimalReplacement<PageReference>;
    assert(Opt::next_use(1, SAMPLE, 4) == 0);
    assert(Opt::next_use(3, SAMPLE, 4) == 5);
    assert(Opt::next_use(7, SAMPLE, 0) == Opt::NEVER);
    assert(Opt::next_use(5, SAMPLE, 12) == Opt::NEVER);
    std::cout << "test_optimal_next_use PASSED" << std::endl;
}

void test_policy_names() {
    std::cout << "Running test_policy_names..." << std::endl;
    assert(parse_policy("LRU") == LRU);
    assert(parse_policy(" optimal ") == OPTIMAL);
    assert(parse_policy("Optimal") == OPTIMAL);
    assert(!parse_policy("fifo").has_value());
    assert(policy_to_string(LRU) == "LRU");
    assert(policy_to_string(OPTIMAL) == "Optimal");
    std::cout << "test_policy_names PASSED" << std::endl;
}

void test_rerun_is_identical() {
    std::cout << "Running test_rerun_is_identical..." << std::endl;
    for (auto policy : {LRU, OPTIMAL}) {
        auto a = run_page_replacement(SEQUENCES[1], 3, policy);
        auto b = run_page_replacement(SEQUENCES[1], 3, policy);
        assert(a.fault_count == b.fault_count);
        for (size_t i = 0; i < a.trace.size(); ++i) {
            assert(a.trace[i].fault == b.trace[i].fault);
            assert(a.trace[i].frames == b.trace[i].frames);
        }
    }
    std::cout << "test_rerun_is_identical PASSED" << std::endl;
}

int main() {
    try {
        test_lru_golden_trace();
        test_optimal_golden_trace();
        test_empty_sequence();
        test_zero_frames_rejected();
        test_fault_count_matches_flags();
        test_first_reference_always_faults();
        test_enough_frames_faults_once_per_page();
        test_optimal_never_worse_as_frames_grow();
        test_compare_policies_is_bounded();
        test_lru_victim_requires_resident_page();
        test_snapshots_are_copies();
        test_lru_recency_matches_frames();
        test_optimal_next_use();
        test_policy_names();
        test_rerun_is_identical();

        std::cout << "\n========================================" << std::endl;
        std::cout << "All page replacement tests PASSED!" << std::endl;
        std::cout << "========================================\n" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
