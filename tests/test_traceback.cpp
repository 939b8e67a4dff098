#include <random>
#include "doctest.h"
#include "aligner.hpp"
#include "block.hpp"
#include "traceback.hpp"
#include "testutils.hpp"

TEST_CASE("leading gaps run along the matrix border") {
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    std::string sequence = "ACGTACGTACGTACGT";
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{4, 32};
    params.lanes = 4;

    auto deletion = align("CCCC" + sequence, sequence, scoring, params);
    CHECK(deletion.score == 11);
    REQUIRE(deletion.cigar);
    CHECK(deletion.cigar->to_string() == "4D16=");

    auto insertion = align(sequence, "GGGG" + sequence, scoring, params);
    CHECK(insertion.score == 11);
    REQUIRE(insertion.cigar);
    CHECK(insertion.cigar->to_string() == "4I16=");
}

TEST_CASE("trailing deletion") {
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{2, 1};
    params.block_size = BlockSizeRange{2, 8};
    for (int lanes : {1, 2}) {
        params.lanes = lanes;
        auto result = align("AAAAA", "AAA", scoring, params);
        CHECK(result.score == 0);
        CHECK(result.score == full_matrix_align("AAAAA", "AAA", scoring, params.gaps).global);
        REQUIRE(result.cigar);
        CHECK(result.cigar->query_length() == 5);
        CHECK(result.cigar->reference_length() == 3);
        CHECK(result.cigar->edit_distance() == 2);
        CHECK(score_alignment("AAAAA", "AAA", *result.cigar, scoring, params.gaps) == 0);
    }
}

TEST_CASE("traceback does not depend on the checkpoint interval") {
    std::mt19937 rng(31);
    auto query = random_sequence(rng, 600);
    auto reference = mutate(rng, query, 0.03);
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    AlignmentParameters params;
    params.gaps = GapCosts{5, 1};
    params.block_size = BlockSizeRange{16, 64};
    params.lanes = 8;

    params.checkpoint_interval = 1;
    auto reference_result = align(query, reference, scoring, params);
    REQUIRE(reference_result.cigar);
    CHECK(reference_result.statistics.trace_segments >= 1);
    CHECK(reference_result.statistics.trace_segments <= reference_result.statistics.checkpoints);
    CHECK(score_alignment(query, reference, *reference_result.cigar, scoring, params.gaps) == reference_result.score);

    for (size_t interval : {2, 3, 100}) {
        params.checkpoint_interval = interval;
        auto result = align(query, reference, scoring, params);
        CHECK(result.score == reference_result.score);
        CHECK(result.cigar == reference_result.cigar);
        CHECK(result.statistics.trace_segments >= 1);
    }
}

TEST_CASE("traceback follows a local alignment to its end") {
    std::mt19937 rng(32);
    auto scoring = ScoringProfile::constant(1, 1, "ACGT");
    GapCosts gaps{2, 1};
    for (int k = 0; k < 20; ++k) {
        auto query = random_sequence(rng, 80 + k);
        auto reference = mutate(rng, query, 0.05);
        reference += random_sequence(rng, 60);
        query += random_sequence(rng, 40);

        AlignmentParameters params;
        params.gaps = gaps;
        params.block_size = BlockSizeRange{16, 64};
        params.mode = AlignMode::xdrop;
        params.x_drop = 8;
        params.lanes = 4;
        params.checkpoint_interval = 3;
        auto result = align(query, reference, scoring, params);
        REQUIRE(result.cigar);
        CHECK(result.cigar->query_length() == result.query_end);
        CHECK(result.cigar->reference_length() == result.reference_end);
        CHECK(score_alignment(query, reference, *result.cigar, scoring, gaps) == result.score);
    }
}

TEST_CASE("traceback engine on a controller history") {
    std::mt19937 rng(33);
    auto scoring = ScoringProfile::constant(2, 3, "ACGT");
    auto query = random_sequence(rng, 300);
    auto reference_text = mutate(rng, query, 0.04);
    auto q = scoring.encode(query, "query");
    auto r = scoring.encode(reference_text, "reference");

    AlignmentParameters params;
    params.gaps = GapCosts{5, 1};
    params.block_size = BlockSizeRange{32, 64};
    params.checkpoint_interval = 4;
    BlockEngine engine(q, r, scoring, params.gaps, params.block_size, select_kernels(16));
    BlockController controller(engine, params);
    controller.run();

    const auto& history = controller.history();
    REQUIRE(!history.checkpoints.empty());
    CHECK(history.checkpoints.front().move_index == 0);
    CHECK(history.moves.front() == MoveKind::init);
    for (size_t k = 0; k < history.checkpoints.size(); ++k) {
        CHECK(history.checkpoints[k].move_index == 4 * k);
    }

    AlignStatistics stats;
    TracebackEngine traceback(engine, history);
    auto cigar = traceback.trace(controller.query_end(), controller.reference_end(), stats);
    CHECK(cigar.query_length() == query.size());
    CHECK(cigar.reference_length() == reference_text.size());
    CHECK(score_alignment(query, reference_text, cigar, scoring, params.gaps) == controller.score());
    CHECK(stats.trace_segments >= 1);
    CHECK(stats.cells == 0);
}
