#ifndef BLOCKALIGN_PARAMETERS_HPP
#define BLOCKALIGN_PARAMETERS_HPP

#include <cstddef>
#include <ostream>
#include "scoring.hpp"

struct BlockSizeRange {
    size_t min;
    size_t max;
};

enum class AlignMode {
    global,
    xdrop,
};

struct AlignmentParameters {
    GapCosts gaps{11, 1};
    BlockSizeRange block_size{32, 256};
    AlignMode mode{AlignMode::global};

    // Stop once the block score falls more than this below the best score (xdrop mode only)
    int x_drop{50};

    bool trace{true};

    // Number of 16-bit lanes; 0 picks the widest the CPU supports
    int lanes{0};

    // A block whose best score is not at least this much higher than the
    // previous block's best makes the block grow
    int min_improvement{1};

    // Block steps between two trace checkpoints
    size_t checkpoint_interval{8};

    // Maximum number of block steps, 0 for no limit
    size_t max_steps{0};
};

std::ostream& operator<<(std::ostream& os, const AlignMode& mode);
std::ostream& operator<<(std::ostream& os, const AlignmentParameters& params);

#endif
