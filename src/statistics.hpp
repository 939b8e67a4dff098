#ifndef BLOCKALIGN_STATISTICS_HPP
#define BLOCKALIGN_STATISTICS_HPP

#include <cstddef>
#include <cstdint>
#include <ostream>

/* Counters collected while aligning one pair of sequences */
struct AlignStatistics {
    uint64_t steps{0};  // block steps, including the initial block
    uint64_t right_shifts{0};
    uint64_t down_shifts{0};
    uint64_t diagonal_shifts{0};
    uint64_t grows{0};
    uint64_t shrinks{0};
    uint64_t strips{0};  // strips passed to the lane kernel
    uint64_t cells{0};   // cells computed, excluding traceback recomputation
    uint64_t escalations{0};  // strips recomputed with 32-bit lanes
    uint64_t checkpoints{0};
    uint64_t trace_segments{0};  // checkpoint segments recomputed during traceback

    AlignStatistics& operator+=(const AlignStatistics& other) {
        steps += other.steps;
        right_shifts += other.right_shifts;
        down_shifts += other.down_shifts;
        diagonal_shifts += other.diagonal_shifts;
        grows += other.grows;
        shrinks += other.shrinks;
        strips += other.strips;
        cells += other.cells;
        escalations += other.escalations;
        checkpoints += other.checkpoints;
        trace_segments += other.trace_segments;
        return *this;
    }
};

std::ostream& operator<<(std::ostream& os, const AlignStatistics& stats);

enum class MoveKind {
    init,
    right,
    down,
    diagonal,
    grow,
    shrink_height,
    shrink_width,
};

std::ostream& operator<<(std::ostream& os, const MoveKind& move);

/* State of the block after one move of the block controller */
struct BlockEvent {
    uint64_t step;
    MoveKind move;
    size_t row;
    size_t col;
    size_t height;
    size_t width;
    size_t last_row;  // trailing row, min(row + height, query length)
    size_t last_col;  // trailing column, min(col + width, reference length)
    int block_best;   // best score of the cells computed by this move
    int best_score;   // best score seen so far
};

/*
 * Receives one event per block move. Observers only watch; attaching one
 * does not change the alignment.
 */
class BlockObserver {
public:
    virtual ~BlockObserver() = default;
    virtual void on_block(const BlockEvent& event) = 0;
};

#endif
