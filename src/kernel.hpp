#ifndef BLOCKALIGN_KERNEL_HPP
#define BLOCKALIGN_KERNEL_HPP

#include <algorithm>
#include <cstdint>
#include <limits>
#include <vector>
#include "scoring.hpp"

using Score = int32_t;

// Minus infinity: a cell that no alignment reaches
constexpr Score NEG_INF = std::numeric_limits<int32_t>::min() / 2;

// Every value at or below NEG_LIMIT is treated as minus infinity
constexpr Score NEG_LIMIT = NEG_INF / 2;

/*
 * The three affine-gap planes at one matrix position: best score of an
 * alignment ending in a match or mismatch (m), in a deletion that
 * consumes a query symbol (d) or in an insertion that consumes a
 * reference symbol (i).
 */
struct Cell {
    Score m;
    Score d;
    Score i;

    bool operator==(const Cell& other) const {
        return m == other.m && d == other.d && i == other.i;
    }
};

constexpr Cell NEG_CELL{NEG_INF, NEG_INF, NEG_INF};

inline Score best_of(const Cell& cell) {
    return std::max(cell.m, std::max(cell.d, cell.i));
}

enum class KernelStatus {
    ok,
    numeric_overflow,  // scores do not fit the lane width; retry with wider lanes
};

/*
 * A rectangular strip of cells, height cells along the lanes and width
 * columns across. In the normal orientation the lanes run down the query
 * and the columns along the reference; a transposed strip swaps the two.
 *
 * The inputs are the column of cells left of the strip (left[0] is the
 * corner diagonally above-left of the first cell) and the row above it.
 */
struct StripTask {
    size_t height;
    size_t width;
    const Cell* left;    // height + 1 cells
    const Cell* top;     // width cells
    bool transposed;

    const int16_t* lane_scores;  // LaneProfile table of the sequence along the lanes
    size_t lane_stride;
    size_t lane_offset;          // sequence position of the first lane cell
    const uint8_t* columns;      // symbols of the sequence across, one per column

    GapCosts gaps;
    int max_gain;  // largest substitution score
    int max_loss;  // largest cost of a single alignment column

    // Optional: receives every computed cell. Cell (lane k, column c),
    // both counted from zero, goes to planes[k * plane_lane_stride + c * plane_column_stride].
    Cell* planes{nullptr};
    size_t plane_lane_stride{0};
    size_t plane_column_stride{0};
};

struct StripOutput {
    std::vector<Cell> right;   // last column, height + 1 cells including the top row
    std::vector<Cell> bottom;  // last lane of every column, width cells
    Score best{NEG_INF};
    // Position of best counted from 1 within the strip. Ties go to the
    // earliest column, then to the lowest lane.
    size_t best_lane{0};
    size_t best_column{0};
};

using StripFunction = KernelStatus (*)(const StripTask& task, StripOutput& out);

struct LaneKernels {
    int lanes;
    StripFunction narrow;  // 16-bit scores, lanes wide
    StripFunction wide;    // 32-bit scores, max(1, lanes / 2) wide
};

LaneKernels select_kernels(int lanes);

#endif
