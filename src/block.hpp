#ifndef BLOCKALIGN_BLOCK_HPP
#define BLOCKALIGN_BLOCK_HPP

#include <cstddef>
#include <vector>
#include "kernel.hpp"
#include "parameters.hpp"
#include "scoring.hpp"
#include "sequence.hpp"
#include "statistics.hpp"

/*
 * Matrix rows are indexed by query position i (0..n) and columns by
 * reference position j (0..m). Cell (i, j) scores alignments of the first
 * i query symbols with the first j reference symbols.
 */

/* Exact value of a cell in row 0 or column 0 */
Cell boundary_cell(size_t i, size_t j, const GapCosts& gaps);

/*
 * Placement of the block and the cells along its trailing edges. The block
 * covers rows row..row + height and columns col..col + width, clipped at the
 * matrix end (last_row, last_col). Both edges share the corner cell
 * (last_row, last_col) as their final element.
 */
struct BlockState {
    size_t row{0};
    size_t col{0};
    size_t height{0};
    size_t width{0};
    size_t last_row{0};
    size_t last_col{0};
    std::vector<Cell> right_edge;   // column last_col, rows row..last_row
    std::vector<Cell> bottom_edge;  // row last_row, columns col..last_col
};

/* All cells of one computed strip, kept while tracing back */
struct StripPlanes {
    // The strip covers rows (row_begin, row_end] and columns (col_begin, col_end]
    size_t row_begin;
    size_t row_end;
    size_t col_begin;
    size_t col_end;
    std::vector<Cell> cells;         // row-major
    std::vector<Cell> boundary_row;  // row row_begin, columns col_begin..col_end
    std::vector<Cell> boundary_col;  // column col_begin, rows row_begin..row_end

    bool contains(size_t i, size_t j) const {
        return i > row_begin && i <= row_end && j > col_begin && j <= col_end;
    }

    // A cell of the strip or of its input boundary
    const Cell& at(size_t i, size_t j) const {
        if (i == row_begin) {
            return boundary_row[j - col_begin];
        }
        if (j == col_begin) {
            return boundary_col[i - row_begin];
        }
        return cells[(i - row_begin - 1) * (col_end - col_begin) + (j - col_begin - 1)];
    }
};

/* Best cell among those computed by one move */
struct MoveResult {
    Score best{NEG_INF};
    size_t best_row{0};
    size_t best_col{0};
};

/*
 * Executes block moves. A move is fully determined by its kind and the
 * block state it starts from, which is what allows traceback to replay
 * moves from a checkpoint and obtain the same cells.
 */
class BlockEngine {
public:
    BlockEngine(
        const Sequence& query,
        const Sequence& reference,
        const ScoringProfile& scoring,
        const GapCosts& gaps,
        const BlockSizeRange& block_size,
        const LaneKernels& kernels
    );

    /*
     * Apply a move to state. When planes is not null, every computed strip
     * is appended to it with all of its cells.
     */
    MoveResult apply(MoveKind move, BlockState& state, AlignStatistics& stats, std::vector<StripPlanes>* planes = nullptr) const;

    // Whether growing the block at state would compute any new cells
    bool grow_adds_cells(const BlockState& state) const;

    size_t step_size() const { return m_step; }
    size_t query_length() const { return m_query.size(); }
    size_t reference_length() const { return m_reference.size(); }
    const Sequence& query() const { return m_query; }
    const Sequence& reference() const { return m_reference; }
    const ScoringProfile& scoring() const { return m_scoring; }
    const GapCosts& gaps() const { return m_gaps; }
    const BlockSizeRange& block_size() const { return m_block_size; }

private:
    void init(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const;
    void shift_right(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const;
    void shift_down(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const;
    void grow(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const;
    void shrink_height(BlockState& state) const;
    void shrink_width(BlockState& state) const;

    std::vector<Cell> column_zero(size_t first_row, size_t count, bool exact) const;
    std::vector<Cell> row_zero(size_t first_col, size_t count, bool exact) const;

    void compute(
        size_t row_begin, size_t row_end, size_t col_begin, size_t col_end, bool transposed,
        const std::vector<Cell>& leading, const std::vector<Cell>& top,
        StripOutput& out, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes
    ) const;

    const Sequence& m_query;
    const Sequence& m_reference;
    const ScoringProfile& m_scoring;
    GapCosts m_gaps;
    BlockSizeRange m_block_size;
    LaneKernels m_kernels;
    size_t m_step;
    int m_max_gain;
    int m_max_loss;
    LaneProfile m_query_profile;      // lanes along the query
    LaneProfile m_reference_profile;  // lanes along the reference
};

struct Checkpoint {
    size_t move_index;  // state before moves[move_index] was applied
    BlockState state;
};

struct BlockHistory {
    std::vector<MoveKind> moves;
    std::vector<Checkpoint> checkpoints;
};

/*
 * Drives the block across the matrix: decides after every step whether to
 * grow, shrink or shift it and in which direction, and stops when the block
 * reaches the end of both sequences or, in xdrop mode, when its score drops
 * too far below the best score seen.
 */
class BlockController {
public:
    BlockController(const BlockEngine& engine, const AlignmentParameters& params, BlockObserver* observer = nullptr);

    void run();

    Score score() const { return m_score; }
    size_t query_end() const { return m_query_end; }
    size_t reference_end() const { return m_reference_end; }
    const BlockHistory& history() const { return m_history; }
    const AlignStatistics& statistics() const { return m_stats; }
    const BlockState& state() const { return m_state; }

private:
    struct FrontierPeak {
        bool found;
        size_t row;
        size_t col;
    };

    MoveResult execute(MoveKind move);
    bool should_grow(const MoveResult& block);
    bool try_shrink();
    FrontierPeak frontier_peak() const;
    MoveKind choose_direction() const;

    const BlockEngine& m_engine;
    const AlignmentParameters& m_params;
    BlockObserver* m_observer;
    BlockState m_state;
    BlockHistory m_history;
    AlignStatistics m_stats;

    Score m_best{0};
    size_t m_best_row{0};
    size_t m_best_col{0};
    bool m_has_previous{false};
    Score m_previous_best{NEG_INF};
    std::vector<FrontierPeak> m_peaks;

    Score m_score{0};
    size_t m_query_end{0};
    size_t m_reference_end{0};
};

#endif
