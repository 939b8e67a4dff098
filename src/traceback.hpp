#ifndef BLOCKALIGN_TRACEBACK_HPP
#define BLOCKALIGN_TRACEBACK_HPP

#include <vector>
#include "block.hpp"
#include "cigar.hpp"
#include "statistics.hpp"

/*
 * Reconstructs the alignment path from the checkpoints recorded by the
 * block controller. The moves between two consecutive checkpoints form a
 * segment; segments are replayed one at a time, newest first, keeping all
 * cells of their strips, and the path is followed backwards through them.
 * At most one segment is held in memory at a time.
 */
class TracebackEngine {
public:
    TracebackEngine(const BlockEngine& engine, const BlockHistory& history)
        : m_engine(engine)
        , m_history(history)
    { }

    /* Operations from (0, 0) to (query_end, reference_end) */
    Cigar trace(size_t query_end, size_t reference_end, AlignStatistics& stats) const;

private:
    void replay_segment(size_t segment, std::vector<StripPlanes>& strips) const;

    const BlockEngine& m_engine;
    const BlockHistory& m_history;
};

#endif
