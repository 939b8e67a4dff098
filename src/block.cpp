#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "block.hpp"
#include "exceptions.hpp"
#include "logger.hpp"

static Logger& logger = Logger::get();

// Number of recent shifted blocks that must agree before a dimension shrinks
static constexpr size_t SHRINK_HISTORY = 4;

Cell boundary_cell(size_t i, size_t j, const GapCosts& gaps) {
    if (i == 0 && j == 0) {
        return Cell{0, NEG_INF, NEG_INF};
    }
    if (i == 0) {
        return Cell{NEG_INF, NEG_INF, -gaps.cost(j)};
    }
    if (j == 0) {
        return Cell{NEG_INF, -gaps.cost(i), NEG_INF};
    }
    throw std::logic_error("boundary_cell called for an inner cell");
}

BlockEngine::BlockEngine(
    const Sequence& query,
    const Sequence& reference,
    const ScoringProfile& scoring,
    const GapCosts& gaps,
    const BlockSizeRange& block_size,
    const LaneKernels& kernels
)
    : m_query(query)
    , m_reference(reference)
    , m_scoring(scoring)
    , m_gaps(gaps)
    , m_block_size(block_size)
    , m_kernels(kernels)
    , m_step(std::max<size_t>(1, std::min<size_t>(block_size.min / 2, 8)))
    , m_max_gain(std::max(0, scoring.max_score()))
    , m_max_loss(std::max({0, -scoring.min_score(), gaps.open, gaps.extend}))
    , m_query_profile(scoring, query, true)
    , m_reference_profile(scoring, reference, false)
{
}

MoveResult BlockEngine::apply(MoveKind move, BlockState& state, AlignStatistics& stats, std::vector<StripPlanes>* planes) const {
    MoveResult result;
    switch (move) {
        case MoveKind::init:
            init(state, result, stats, planes);
            break;
        case MoveKind::right:
            shift_right(state, result, stats, planes);
            break;
        case MoveKind::down:
            shift_down(state, result, stats, planes);
            break;
        case MoveKind::diagonal:
            shift_right(state, result, stats, planes);
            shift_down(state, result, stats, planes);
            break;
        case MoveKind::grow:
            grow(state, result, stats, planes);
            break;
        case MoveKind::shrink_height:
            shrink_height(state);
            break;
        case MoveKind::shrink_width:
            shrink_width(state);
            break;
    }
    return result;
}

bool BlockEngine::grow_adds_cells(const BlockState& state) const {
    size_t height = std::min(2 * state.height, m_block_size.max);
    size_t width = std::min(2 * state.width, m_block_size.max);
    return std::min(state.row + height, query_length()) > state.last_row
        || std::min(state.col + width, reference_length()) > state.last_col;
}

/* Cells of column 0 in rows first_row.. (or minus infinity if not exact) */
std::vector<Cell> BlockEngine::column_zero(size_t first_row, size_t count, bool exact) const {
    std::vector<Cell> cells(count, NEG_CELL);
    if (exact) {
        for (size_t t = 0; t < count; ++t) {
            cells[t] = boundary_cell(first_row + t, 0, m_gaps);
        }
    }
    return cells;
}

std::vector<Cell> BlockEngine::row_zero(size_t first_col, size_t count, bool exact) const {
    std::vector<Cell> cells(count, NEG_CELL);
    if (exact) {
        for (size_t t = 0; t < count; ++t) {
            cells[t] = boundary_cell(0, first_col + t, m_gaps);
        }
    }
    return cells;
}

void BlockEngine::init(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const {
    state.row = 0;
    state.col = 0;
    state.height = m_block_size.min;
    state.width = m_block_size.min;
    state.last_row = std::min(state.height, query_length());
    state.last_col = std::min(state.width, reference_length());

    auto left = column_zero(0, state.last_row + 1, true);
    auto top = row_zero(1, state.last_col, true);
    StripOutput out;
    compute(0, state.last_row, 0, state.last_col, false, left, top, out, result, stats, planes);

    state.right_edge = std::move(out.right);
    state.bottom_edge.clear();
    state.bottom_edge.reserve(state.last_col + 1);
    state.bottom_edge.push_back(left.back());
    state.bottom_edge.insert(state.bottom_edge.end(), out.bottom.begin(), out.bottom.end());
}

void BlockEngine::shift_right(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const {
    const size_t first = state.last_col;
    const size_t shift = std::min(m_step, reference_length() - first);

    auto top = row_zero(first + 1, shift, state.row == 0);
    StripOutput out;
    compute(state.row, state.last_row, first, first + shift, false, state.right_edge, top, out, result, stats, planes);

    state.col += shift;
    state.last_col = first + shift;
    state.right_edge = std::move(out.right);
    state.bottom_edge.erase(state.bottom_edge.begin(), state.bottom_edge.begin() + shift);
    state.bottom_edge.insert(state.bottom_edge.end(), out.bottom.begin(), out.bottom.end());
}

void BlockEngine::shift_down(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const {
    const size_t first = state.last_row;
    const size_t shift = std::min(m_step, query_length() - first);

    auto top = column_zero(first + 1, shift, state.col == 0);
    StripOutput out;
    compute(first, first + shift, state.col, state.last_col, true, state.bottom_edge, top, out, result, stats, planes);

    state.row += shift;
    state.last_row = first + shift;
    state.bottom_edge = std::move(out.right);
    state.right_edge.erase(state.right_edge.begin(), state.right_edge.begin() + shift);
    state.right_edge.insert(state.right_edge.end(), out.bottom.begin(), out.bottom.end());
}

/*
 * Double both dimensions (up to the maximum size). The new rows below the
 * block are computed first, then the new columns right of it, which then
 * cover the full new height.
 */
void BlockEngine::grow(BlockState& state, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes) const {
    const size_t height = std::min(2 * state.height, m_block_size.max);
    const size_t width = std::min(2 * state.width, m_block_size.max);
    const size_t last_row = std::min(state.row + height, query_length());
    const size_t last_col = std::min(state.col + width, reference_length());

    if (last_row > state.last_row) {
        auto top = column_zero(state.last_row + 1, last_row - state.last_row, state.col == 0);
        StripOutput out;
        compute(state.last_row, last_row, state.col, state.last_col, true, state.bottom_edge, top, out, result, stats, planes);
        state.bottom_edge = std::move(out.right);
        state.right_edge.insert(state.right_edge.end(), out.bottom.begin(), out.bottom.end());
        state.last_row = last_row;
    }
    if (last_col > state.last_col) {
        auto top = row_zero(state.last_col + 1, last_col - state.last_col, state.row == 0);
        StripOutput out;
        compute(state.row, state.last_row, state.last_col, last_col, false, state.right_edge, top, out, result, stats, planes);
        state.right_edge = std::move(out.right);
        state.bottom_edge.insert(state.bottom_edge.end(), out.bottom.begin(), out.bottom.end());
        state.last_col = last_col;
    }
    state.height = height;
    state.width = width;
}

/* Halve the height (rounded down to a multiple of the minimum size), keeping the trailing row in place */
void BlockEngine::shrink_height(BlockState& state) const {
    const size_t min_size = m_block_size.min;
    const size_t height = std::max(min_size, state.height / 2 / min_size * min_size);
    const size_t delta = state.height - height;
    state.row += delta;
    state.height = height;
    state.right_edge.erase(state.right_edge.begin(), state.right_edge.begin() + delta);
}

void BlockEngine::shrink_width(BlockState& state) const {
    const size_t min_size = m_block_size.min;
    const size_t width = std::max(min_size, state.width / 2 / min_size * min_size);
    const size_t delta = state.width - width;
    state.col += delta;
    state.width = width;
    state.bottom_edge.erase(state.bottom_edge.begin(), state.bottom_edge.begin() + delta);
}

/*
 * Compute the cells in rows (row_begin, row_end] and columns
 * (col_begin, col_end]. In the normal orientation the lanes run along the
 * query: leading is column col_begin (rows row_begin..row_end) and top is
 * row row_begin. A transposed strip runs its lanes along the reference:
 * leading is row row_begin (columns col_begin..col_end) and top is column
 * col_begin.
 */
void BlockEngine::compute(
    size_t row_begin, size_t row_end, size_t col_begin, size_t col_end, bool transposed,
    const std::vector<Cell>& leading, const std::vector<Cell>& top,
    StripOutput& out, MoveResult& result, AlignStatistics& stats, std::vector<StripPlanes>* planes
) const {
    const size_t rows = row_end - row_begin;
    const size_t cols = col_end - col_begin;

    StripTask task;
    task.height = transposed ? cols : rows;
    task.width = transposed ? rows : cols;
    task.left = leading.data();
    task.top = top.data();
    task.transposed = transposed;
    const LaneProfile& profile = transposed ? m_reference_profile : m_query_profile;
    task.lane_scores = profile.row(0);
    task.lane_stride = profile.stride();
    task.lane_offset = transposed ? col_begin : row_begin;
    task.columns = transposed ? m_query.data() + row_begin : m_reference.data() + col_begin;
    task.gaps = m_gaps;
    task.max_gain = m_max_gain;
    task.max_loss = m_max_loss;

    if (planes != nullptr) {
        planes->emplace_back();
        StripPlanes& strip = planes->back();
        strip.row_begin = row_begin;
        strip.row_end = row_end;
        strip.col_begin = col_begin;
        strip.col_end = col_end;
        strip.cells.assign(rows * cols, NEG_CELL);
        std::vector<Cell> crossing;
        crossing.reserve(top.size() + 1);
        crossing.push_back(leading.front());
        crossing.insert(crossing.end(), top.begin(), top.end());
        if (transposed) {
            strip.boundary_row = leading;
            strip.boundary_col = std::move(crossing);
        } else {
            strip.boundary_col = leading;
            strip.boundary_row = std::move(crossing);
        }
        task.planes = strip.cells.data();
        task.plane_lane_stride = transposed ? 1 : cols;
        task.plane_column_stride = transposed ? cols : 1;
    }

    if (m_kernels.narrow(task, out) == KernelStatus::numeric_overflow) {
        stats.escalations++;
        logger.debug() << "Recomputing " << rows << "x" << cols << " strip at (" << row_begin << ", "
            << col_begin << ") with 32-bit lanes\n";
        if (m_kernels.wide(task, out) == KernelStatus::numeric_overflow) {
            throw std::logic_error("Scores exceed the range of 32-bit lanes");
        }
    }
    stats.strips++;
    stats.cells += rows * cols;

    if (out.best > result.best) {
        result.best = out.best;
        result.best_row = row_begin + (transposed ? out.best_column : out.best_lane);
        result.best_col = col_begin + (transposed ? out.best_lane : out.best_column);
    }
}

BlockController::BlockController(const BlockEngine& engine, const AlignmentParameters& params, BlockObserver* observer)
    : m_engine(engine)
    , m_params(params)
    , m_observer(observer)
{
}

/*
 * Apply one move: take a checkpoint when due, update the best score and
 * notify the observer.
 */
MoveResult BlockController::execute(MoveKind move) {
    bool computes = move != MoveKind::shrink_height && move != MoveKind::shrink_width;
    if (computes && m_params.max_steps > 0 && m_stats.steps >= m_params.max_steps) {
        std::stringstream s;
        s << "Alignment needs more than " << m_params.max_steps << " block steps";
        throw StepBudgetExceeded(s.str());
    }
    if (m_params.trace && m_history.moves.size() % m_params.checkpoint_interval == 0) {
        m_history.checkpoints.push_back(Checkpoint{m_history.moves.size(), m_state});
        m_stats.checkpoints++;
    }
    MoveResult result = m_engine.apply(move, m_state, m_stats);
    m_history.moves.push_back(move);

    switch (move) {
        case MoveKind::init: break;
        case MoveKind::right: m_stats.right_shifts++; break;
        case MoveKind::down: m_stats.down_shifts++; break;
        case MoveKind::diagonal: m_stats.diagonal_shifts++; break;
        case MoveKind::grow: m_stats.grows++; break;
        case MoveKind::shrink_height:
        case MoveKind::shrink_width:
            m_stats.shrinks++;
            break;
    }
    if (computes) {
        m_stats.steps++;
        if (result.best > m_best) {
            m_best = result.best;
            m_best_row = result.best_row;
            m_best_col = result.best_col;
        }
    }

    if (m_observer != nullptr) {
        BlockEvent event{
            m_stats.steps, move,
            m_state.row, m_state.col, m_state.height, m_state.width,
            m_state.last_row, m_state.last_col,
            result.best, m_best
        };
        m_observer->on_block(event);
    }
    return result;
}

void BlockController::run() {
    const size_t n = m_engine.query_length();
    const size_t m = m_engine.reference_length();
    const bool xdrop = m_params.mode == AlignMode::xdrop;

    MoveResult block = execute(MoveKind::init);
    MoveKind last = MoveKind::init;
    while (true) {
        if (xdrop && (block.best <= NEG_LIMIT || int64_t(block.best) < int64_t(m_best) - m_params.x_drop)) {
            break;
        }
        if (m_state.last_row == n && m_state.last_col == m) {
            break;
        }
        if (should_grow(block)) {
            block = execute(MoveKind::grow);
            m_peaks.clear();
            last = MoveKind::grow;
            continue;
        }
        if (last == MoveKind::right || last == MoveKind::down || last == MoveKind::diagonal) {
            try_shrink();
        }
        last = choose_direction();
        block = execute(last);
    }

    if (xdrop) {
        m_score = m_best;
        m_query_end = m_best_row;
        m_reference_end = m_best_col;
    } else {
        m_score = best_of(m_state.right_edge.back());
        if (m_score <= NEG_LIMIT) {
            throw std::logic_error("Global alignment did not reach the end of the matrix");
        }
        m_query_end = n;
        m_reference_end = m;
    }
    logger.debug() << "Block controller finished after " << m_stats.steps << " steps with score "
        << m_score << " at (" << m_query_end << ", " << m_reference_end << ")\n";
}

/*
 * Grow when the best cell lies inside the block instead of on its trailing
 * edges, when the score did not improve enough over the previous block, or
 * when a block of maximum size would reach the end of both sequences.
 */
bool BlockController::should_grow(const MoveResult& block) {
    const BlockSizeRange& size = m_engine.block_size();
    bool reachable = block.best > NEG_LIMIT;
    bool interior = reachable && block.best_row != m_state.last_row && block.best_col != m_state.last_col;
    bool no_improvement = !reachable
        || (m_has_previous && m_previous_best > NEG_LIMIT
            && int64_t(block.best) < int64_t(m_previous_best) + m_params.min_improvement);
    bool final_block = m_state.row + size.max >= m_engine.query_length()
        && m_state.col + size.max >= m_engine.reference_length();

    m_has_previous = true;
    m_previous_best = block.best;

    bool can_grow = (m_state.height < size.max || m_state.width < size.max) && m_engine.grow_adds_cells(m_state);
    return can_grow && (final_block || interior || no_improvement);
}

/*
 * Remember where the frontier maximum of the last shifted blocks was. If
 * it stayed in the lower half of the block, the upper rows are not needed
 * and the height is reduced; likewise for the right half and the width.
 */
bool BlockController::try_shrink() {
    m_peaks.push_back(frontier_peak());
    if (m_peaks.size() > SHRINK_HISTORY) {
        m_peaks.erase(m_peaks.begin());
    }
    if (m_peaks.size() < SHRINK_HISTORY) {
        return false;
    }
    const size_t min_size = m_engine.block_size().min;
    const BlockState& state = m_state;

    bool low = std::all_of(m_peaks.begin(), m_peaks.end(), [&](const FrontierPeak& peak) {
        return peak.found && peak.row >= state.row + state.height / 2;
    });
    if (low && state.height > min_size && state.row + state.height <= m_engine.query_length()) {
        execute(MoveKind::shrink_height);
        m_peaks.clear();
        return true;
    }
    bool right = std::all_of(m_peaks.begin(), m_peaks.end(), [&](const FrontierPeak& peak) {
        return peak.found && peak.col >= state.col + state.width / 2;
    });
    if (right && state.width > min_size && state.col + state.width <= m_engine.reference_length()) {
        execute(MoveKind::shrink_width);
        m_peaks.clear();
        return true;
    }
    return false;
}

/* First maximum along the trailing row (left to right), then up the trailing column */
BlockController::FrontierPeak BlockController::frontier_peak() const {
    FrontierPeak peak{false, 0, 0};
    Score best = NEG_LIMIT;
    for (size_t t = 0; t < m_state.bottom_edge.size(); ++t) {
        Score score = best_of(m_state.bottom_edge[t]);
        if (score > best) {
            best = score;
            peak = FrontierPeak{true, m_state.last_row, m_state.col + t};
        }
    }
    for (size_t t = 0; t + 1 < m_state.right_edge.size(); ++t) {
        Score score = best_of(m_state.right_edge[t]);
        if (score > best) {
            best = score;
            peak = FrontierPeak{true, m_state.row + t, m_state.last_col};
        }
    }
    return peak;
}

/*
 * Compare the trailing edges: the corner region (the last step + 1 cells of
 * the trailing row and the step cells of the trailing column above the
 * corner) favours a diagonal shift, the rest of the trailing row a shift
 * down and the rest of the trailing column a shift right. Ties are resolved
 * as diagonal, then down, then right.
 */
MoveKind BlockController::choose_direction() const {
    const BlockState& state = m_state;
    const bool can_down = state.last_row < m_engine.query_length();
    const bool can_right = state.last_col < m_engine.reference_length();
    if (!can_down) {
        return MoveKind::right;
    }
    if (!can_right) {
        return MoveKind::down;
    }
    const size_t step = m_engine.step_size();
    const size_t corner_col = state.last_col > state.col + step ? state.last_col - step : state.col;
    const size_t corner_row = state.last_row > state.row + step ? state.last_row - step : state.row;

    Score down = NEG_INF;
    Score corner = NEG_INF;
    for (size_t t = 0; t < state.bottom_edge.size(); ++t) {
        Score& region = state.col + t < corner_col ? down : corner;
        region = std::max(region, best_of(state.bottom_edge[t]));
    }
    Score right = NEG_INF;
    for (size_t t = 0; t + 1 < state.right_edge.size(); ++t) {
        Score& region = state.row + t < corner_row ? right : corner;
        region = std::max(region, best_of(state.right_edge[t]));
    }

    if (corner >= down && corner >= right) {
        return MoveKind::diagonal;
    }
    if (down >= right) {
        return MoveKind::down;
    }
    return MoveKind::right;
}
