#include "parameters.hpp"

std::ostream& operator<<(std::ostream& os, const AlignMode& mode) {
    switch (mode) {
        case AlignMode::global: os << "global"; break;
        case AlignMode::xdrop: os << "xdrop"; break;
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const AlignmentParameters& params) {
    os << "AlignmentParameters("
        << "gap_open=" << params.gaps.open
        << ", gap_extend=" << params.gaps.extend
        << ", min_block=" << params.block_size.min
        << ", max_block=" << params.block_size.max
        << ", mode=" << params.mode;
    if (params.mode == AlignMode::xdrop) {
        os << ", x_drop=" << params.x_drop;
    }
    os << ", trace=" << (params.trace ? "yes" : "no")
        << ", lanes=" << params.lanes
        << ", min_improvement=" << params.min_improvement
        << ", checkpoint_interval=" << params.checkpoint_interval
        << ", max_steps=" << params.max_steps
        << ")";
    return os;
}
