#include <stdexcept>
#include "traceback.hpp"
#include "logger.hpp"

static Logger& logger = Logger::get();

namespace {

enum Plane {
    MATCH_PLANE,
    DELETION_PLANE,
    INSERTION_PLANE,
};

Score plane_value(const Cell& cell, Plane plane) {
    switch (plane) {
        case MATCH_PLANE: return cell.m;
        case DELETION_PLANE: return cell.d;
        case INSERTION_PLANE: return cell.i;
    }
    throw std::logic_error("Invalid plane");
}

/*
 * Pick the plane of the predecessor cell from which value was derived,
 * given the cost of leaving each of its planes. The match plane is
 * preferred, then deletion, then insertion.
 */
Plane predecessor(const Cell& cell, int64_t value, int64_t from_match, int64_t from_deletion, int64_t from_insertion) {
    if (cell.m > NEG_LIMIT && int64_t(cell.m) - from_match == value) {
        return MATCH_PLANE;
    }
    if (cell.d > NEG_LIMIT && int64_t(cell.d) - from_deletion == value) {
        return DELETION_PLANE;
    }
    if (cell.i > NEG_LIMIT && int64_t(cell.i) - from_insertion == value) {
        return INSERTION_PLANE;
    }
    throw std::logic_error("Traceback found no predecessor cell");
}

}  // namespace

void TracebackEngine::replay_segment(size_t segment, std::vector<StripPlanes>& strips) const {
    const Checkpoint& checkpoint = m_history.checkpoints[segment];
    size_t end = segment + 1 < m_history.checkpoints.size()
        ? m_history.checkpoints[segment + 1].move_index
        : m_history.moves.size();

    strips.clear();
    BlockState state = checkpoint.state;
    AlignStatistics replay_stats;
    for (size_t k = checkpoint.move_index; k < end; ++k) {
        m_engine.apply(m_history.moves[k], state, replay_stats, &strips);
    }
}

Cigar TracebackEngine::trace(size_t query_end, size_t reference_end, AlignStatistics& stats) const {
    const Sequence& query = m_engine.query();
    const Sequence& reference = m_engine.reference();
    const ScoringProfile& scoring = m_engine.scoring();
    const GapCosts& gaps = m_engine.gaps();

    Cigar cigar;
    size_t i = query_end;
    size_t j = reference_end;

    std::vector<StripPlanes> strips;
    size_t segment = m_history.checkpoints.size();
    size_t current = 0;
    bool loaded = false;

    // Make strips[current] the strip containing inner cell (row, col)
    auto locate = [&](size_t row, size_t col) {
        if (loaded) {
            for (size_t k = current + 1; k-- > 0; ) {
                if (strips[k].contains(row, col)) {
                    current = k;
                    return;
                }
            }
        }
        while (segment > 0) {
            --segment;
            replay_segment(segment, strips);
            stats.trace_segments++;
            loaded = !strips.empty();
            for (size_t k = strips.size(); k-- > 0; ) {
                if (strips[k].contains(row, col)) {
                    current = k;
                    return;
                }
            }
        }
        throw std::logic_error("Traceback left the computed part of the matrix");
    };

    if (i > 0 && j > 0) {
        locate(i, j);
        const Cell& end = strips[current].at(i, j);
        Score score = best_of(end);
        if (score <= NEG_LIMIT) {
            throw std::logic_error("Traceback started at an unreachable cell");
        }
        Plane plane = end.m == score ? MATCH_PLANE : (end.d == score ? DELETION_PLANE : INSERTION_PLANE);

        while (i > 0 && j > 0) {
            const StripPlanes& strip = strips[current];
            const int64_t value = plane_value(strip.at(i, j), plane);
            if (plane == MATCH_PLANE) {
                uint8_t a = query[i - 1];
                uint8_t b = reference[j - 1];
                cigar.push(a == b ? CIGAR_EQ : CIGAR_X, 1);
                plane = predecessor(strip.at(i - 1, j - 1), value - scoring.score(a, b), 0, 0, 0);
                --i;
                --j;
            } else if (plane == DELETION_PLANE) {
                cigar.push(CIGAR_DEL, 1);
                plane = predecessor(strip.at(i - 1, j), value, gaps.open, gaps.extend, gaps.open);
                --i;
            } else {
                cigar.push(CIGAR_INS, 1);
                plane = predecessor(strip.at(i, j - 1), value, gaps.open, gaps.open, gaps.extend);
                --j;
            }
            if (i > 0 && j > 0 && !strips[current].contains(i, j)) {
                locate(i, j);
            }
        }
    }
    // The rest of the path runs along row 0 or column 0
    cigar.push(CIGAR_DEL, i);
    cigar.push(CIGAR_INS, j);
    cigar.reverse();

    logger.debug() << "Traceback recomputed " << stats.trace_segments << " of "
        << m_history.checkpoints.size() << " segments\n";
    return cigar;
}
