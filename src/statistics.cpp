#include "statistics.hpp"

std::ostream& operator<<(std::ostream& os, const AlignStatistics& stats) {
    os << "Block steps: " << stats.steps
        << " (right: " << stats.right_shifts
        << ", down: " << stats.down_shifts
        << ", diagonal: " << stats.diagonal_shifts
        << ", grow: " << stats.grows
        << ", shrink: " << stats.shrinks << ")\n"
        << "Strips computed: " << stats.strips << " (" << stats.cells << " cells, "
        << stats.escalations << " with 32-bit lanes)\n"
        << "Checkpoints: " << stats.checkpoints
        << ", traceback segments recomputed: " << stats.trace_segments << '\n';
    return os;
}

std::ostream& operator<<(std::ostream& os, const MoveKind& move) {
    switch (move) {
        case MoveKind::init: os << "init"; break;
        case MoveKind::right: os << "right"; break;
        case MoveKind::down: os << "down"; break;
        case MoveKind::diagonal: os << "diagonal"; break;
        case MoveKind::grow: os << "grow"; break;
        case MoveKind::shrink_height: os << "shrink_height"; break;
        case MoveKind::shrink_width: os << "shrink_width"; break;
    }
    return os;
}
