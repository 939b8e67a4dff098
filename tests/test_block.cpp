#include <random>
#include <stdexcept>
#include <vector>
#include "doctest.h"
#include "aligner.hpp"
#include "block.hpp"
#include "exceptions.hpp"
#include "testutils.hpp"

namespace {

class RecordingObserver : public BlockObserver {
public:
    void on_block(const BlockEvent& event) override {
        events.push_back(event);
    }

    std::vector<BlockEvent> events;
};

std::pair<std::string, std::string> similar_pair(uint32_t seed, size_t length) {
    std::mt19937 rng(seed);
    auto query = random_sequence(rng, length);
    auto reference = mutate(rng, query, 0.02);
    return {query, reference};
}

}  // namespace

TEST_CASE("boundary cells") {
    GapCosts gaps{5, 2};
    CHECK(boundary_cell(0, 0, gaps) == Cell{0, NEG_INF, NEG_INF});
    CHECK(boundary_cell(0, 3, gaps) == Cell{NEG_INF, NEG_INF, -9});
    CHECK(boundary_cell(1, 0, gaps) == Cell{NEG_INF, -5, NEG_INF});
    CHECK_THROWS_AS(boundary_cell(1, 1, gaps), std::logic_error);
}

TEST_CASE("initial block and growth compute exact prefix scores") {
    std::mt19937 rng(8);
    auto query = random_sequence(rng, 60);
    auto reference = random_sequence(rng, 50);
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    GapCosts gaps{4, 1};
    auto q = scoring.encode(query, "query");
    auto r = scoring.encode(reference, "reference");
    BlockEngine engine(q, r, scoring, gaps, BlockSizeRange{16, 64}, select_kernels(8));
    CHECK(engine.step_size() == 8);

    BlockState state;
    AlignStatistics stats;
    engine.apply(MoveKind::init, state, stats);
    CHECK(state.last_row == 16);
    CHECK(state.last_col == 16);
    CHECK(state.right_edge.size() == 17);
    CHECK(state.bottom_edge.size() == 17);
    CHECK(best_of(state.right_edge.back())
        == full_matrix_align(query.substr(0, 16), reference.substr(0, 16), scoring, gaps).global);
    CHECK(state.right_edge.back() == state.bottom_edge.back());

    REQUIRE(engine.grow_adds_cells(state));
    engine.apply(MoveKind::grow, state, stats);
    CHECK(state.height == 32);
    CHECK(state.width == 32);
    CHECK(best_of(state.right_edge.back())
        == full_matrix_align(query.substr(0, 32), reference.substr(0, 32), scoring, gaps).global);

    // Clipped at the end of the reference
    engine.apply(MoveKind::grow, state, stats);
    CHECK(state.height == 64);
    CHECK(state.last_row == 60);
    CHECK(state.last_col == 50);
    CHECK(best_of(state.right_edge.back()) == full_matrix_align(query, reference, scoring, gaps).global);
    CHECK(!engine.grow_adds_cells(state));
    CHECK(stats.cells == 60 * 50);
}

TEST_CASE("shifts keep the trailing edges aligned with the block") {
    std::mt19937 rng(9);
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    auto q = scoring.encode(random_sequence(rng, 40), "query");
    auto r = scoring.encode(random_sequence(rng, 40), "reference");
    BlockEngine engine(q, r, scoring, GapCosts{2, 1}, BlockSizeRange{16, 32}, select_kernels(4));

    BlockState state;
    AlignStatistics stats;
    engine.apply(MoveKind::init, state, stats);
    engine.apply(MoveKind::right, state, stats);
    CHECK(state.col == 8);
    CHECK(state.last_col == 24);
    CHECK(state.right_edge.size() == 17);
    CHECK(state.bottom_edge.size() == 17);

    engine.apply(MoveKind::diagonal, state, stats);
    CHECK(state.row == 8);
    CHECK(state.col == 16);
    CHECK(state.last_row == 24);
    CHECK(state.last_col == 32);
    CHECK(state.right_edge.size() == 17);
    CHECK(state.bottom_edge.size() == 17);
    CHECK(state.right_edge.back() == state.bottom_edge.back());

    engine.apply(MoveKind::down, state, stats);
    CHECK(state.row == 16);
    CHECK(state.last_row == 32);
    CHECK(stats.cells == 16 * 16 + 4 * 16 * 8);
}

TEST_CASE("block stays within its size range and moves forward") {
    auto [query, reference] = similar_pair(21, 1000);
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{32, 128};
    params.lanes = 8;
    RecordingObserver observer;
    auto result = align(query, reference, scoring, params, &observer);

    REQUIRE(!observer.events.empty());
    CHECK(observer.events.front().move == MoveKind::init);
    size_t row = 0;
    size_t col = 0;
    int best = 0;
    for (const auto& event : observer.events) {
        CHECK(event.height >= 32);
        CHECK(event.height <= 128);
        CHECK(event.width >= 32);
        CHECK(event.width <= 128);
        CHECK(event.height % 8 == 0);
        CHECK(event.width % 8 == 0);
        CHECK(event.row >= row);
        CHECK(event.col >= col);
        CHECK(event.best_score >= best);
        CHECK(event.last_row <= query.size());
        CHECK(event.last_col <= reference.size());
        row = event.row;
        col = event.col;
        best = event.best_score;
    }
    const auto& last = observer.events.back();
    CHECK(last.last_row == query.size());
    CHECK(last.last_col == reference.size());

    const auto& stats = result.statistics;
    CHECK(stats.steps == last.step);
    CHECK(stats.steps <= 2 * (query.size() + reference.size()) / 8 + 16);
    CHECK(stats.steps == 1 + stats.right_shifts + stats.down_shifts + stats.diagonal_shifts + stats.grows);
    CHECK(observer.events.size() == stats.steps + stats.shrinks);
    CHECK(stats.checkpoints == (observer.events.size() + 7) / 8);
}

TEST_CASE("shrinking keeps the trailing edges in place") {
    auto [query, reference] = similar_pair(22, 1000);
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{32, 128};
    params.lanes = 8;
    RecordingObserver observer;
    align(query, reference, scoring, params, &observer);

    for (size_t k = 1; k < observer.events.size(); ++k) {
        const auto& before = observer.events[k - 1];
        const auto& event = observer.events[k];
        if (event.move == MoveKind::shrink_height) {
            CHECK(event.height < before.height);
            CHECK(event.last_row == before.last_row);
            CHECK(event.row + event.height == before.row + before.height);
        }
        if (event.move == MoveKind::shrink_width) {
            CHECK(event.width < before.width);
            CHECK(event.last_col == before.last_col);
            CHECK(event.col + event.width == before.col + before.width);
        }
        if (event.move == MoveKind::grow) {
            CHECK(event.row == before.row);
            CHECK(event.col == before.col);
        }
    }
}

TEST_CASE("identical sequences are followed along the diagonal") {
    std::string sequence;
    for (int k = 0; k < 100; ++k) {
        sequence += "ACGT";
    }
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{5, 1};
    params.block_size = BlockSizeRange{32, 128};
    params.lanes = 8;
    auto result = align(sequence, sequence, scoring, params);
    CHECK(result.score == 800);
    CHECK(result.statistics.right_shifts == 0);
    CHECK(result.statistics.down_shifts == 0);
    CHECK(result.statistics.diagonal_shifts > 0);
    REQUIRE(result.cigar);
    CHECK(result.cigar->to_string() == "400=");
}

TEST_CASE("block grows to cover short sequences") {
    std::string query;
    std::string reference;
    for (int k = 0; k < 25; ++k) {
        query += "ACGT";
        reference += "ACGA";
    }
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{16, 256};
    params.lanes = 8;
    RecordingObserver observer;
    auto result = align(query, reference, scoring, params, &observer);

    CHECK(result.statistics.steps == 4);
    CHECK(result.statistics.grows == 3);
    REQUIRE(observer.events.size() == 4);
    CHECK(observer.events[3].height == 128);
    CHECK(result.score == full_matrix_align(query, reference, scoring, params.gaps).global);
}

TEST_CASE("step budget") {
    std::string query(100, 'A');
    std::string reference(100, 'A');
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{16, 256};
    params.lanes = 8;

    params.max_steps = 3;
    CHECK_THROWS_AS(align(query, reference, scoring, params), StepBudgetExceeded);

    params.max_steps = 4;
    auto result = align(query, reference, scoring, params);
    CHECK(result.score == 100);
}

TEST_CASE("checkpoint interval") {
    auto [query, reference] = similar_pair(23, 400);
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{16, 64};
    params.lanes = 8;

    params.checkpoint_interval = 1;
    RecordingObserver observer;
    auto result = align(query, reference, scoring, params, &observer);
    CHECK(result.statistics.checkpoints == observer.events.size());

    params.checkpoint_interval = 5;
    result = align(query, reference, scoring, params);
    CHECK(result.statistics.checkpoints == (observer.events.size() + 4) / 5);

    params.trace = false;
    result = align(query, reference, scoring, params);
    CHECK(result.statistics.checkpoints == 0);
    CHECK(!result.cigar);
}

TEST_CASE("observers do not change the result") {
    auto [query, reference] = similar_pair(24, 500);
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{5, 1};
    params.block_size = BlockSizeRange{16, 64};
    params.lanes = 16;
    RecordingObserver observer;
    auto watched = align(query, reference, scoring, params, &observer);
    auto unwatched = align(query, reference, scoring, params);
    CHECK(watched.score == unwatched.score);
    CHECK(watched.cigar == unwatched.cigar);
    CHECK(watched.statistics.steps == unwatched.statistics.steps);
}
