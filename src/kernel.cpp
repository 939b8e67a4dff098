#include <array>
#include <stdexcept>
#include <string>
#include "kernel.hpp"
#include "lanes.hpp"
#include "exceptions.hpp"

namespace {

/*
 * Column-by-column update of a strip. Each column is processed in chunks of
 * N lanes. Match scores and gaps entering from the previous column are plain
 * lane-wise operations; the gap running along the lanes depends on the
 * lane above and is resolved with a prefix maximum over the chunk
 * (log2(N) shift-and-max rounds, each lane losing one extension per row).
 *
 * Scores are kept relative to the largest finite input value. Before
 * starting, the reachable value range is checked against the lane type;
 * if it does not fit, nothing is computed and numeric_overflow is returned.
 */
template <typename T, int N>
KernelStatus compute_strip(const StripTask& task, StripOutput& out) {
    using Vec = LaneVector<T, N>;
    using Limits = std::numeric_limits<T>;

    const size_t height = task.height;
    const size_t width = task.width;
    if (height == 0 || width == 0) {
        throw std::logic_error("Empty strip passed to the lane kernel");
    }
    out.right.assign(height + 1, NEG_CELL);
    out.bottom.assign(width, NEG_CELL);
    out.best = NEG_INF;
    out.best_lane = 0;
    out.best_column = 0;

    int64_t base = 0;
    int64_t low = 0;
    bool reachable = false;
    auto include = [&](Score value) {
        if (value <= NEG_LIMIT) {
            return;
        }
        if (!reachable) {
            base = low = value;
            reachable = true;
        } else {
            base = std::max<int64_t>(base, value);
            low = std::min<int64_t>(low, value);
        }
    };
    for (size_t k = 0; k <= height; ++k) {
        include(task.left[k].m);
        include(task.left[k].d);
        include(task.left[k].i);
    }
    for (size_t c = 0; c < width; ++c) {
        include(task.top[c].m);
        include(task.top[c].d);
        include(task.top[c].i);
    }
    if (!reachable) {
        return KernelStatus::ok;
    }

    const int64_t span = static_cast<int64_t>(height + width + 1);
    const int64_t gain = std::max(0, task.max_gain);
    const int64_t loss = std::max({0, task.max_loss, task.gaps.open, task.gaps.extend});
    const int64_t floor = Limits::min();
    // Lane values at or below ceiling derive from minus infinity
    const int64_t ceiling = floor + span * gain;
    if (span * gain > Limits::max()
        || task.gaps.open > Limits::max()
        || int64_t(N) * task.gaps.extend > Limits::max()
        || (low - base) - span * loss <= ceiling) {
        return KernelStatus::numeric_overflow;
    }

    const T open = static_cast<T>(task.gaps.open);
    const T extend = static_cast<T>(task.gaps.extend);
    std::array<T, 6> scan_cost{};
    for (int s = 1, r = 0; s < N; s <<= 1, ++r) {
        scan_cost[r] = static_cast<T>(int64_t(s) * task.gaps.extend);
    }

    auto to_lane = [&](Score value) -> T {
        return value <= NEG_LIMIT ? Limits::min() : static_cast<T>(value - base);
    };
    auto from_lane = [&](T value) -> Score {
        return value <= ceiling ? NEG_INF : static_cast<Score>(base + value);
    };
    // v is the gap along the lanes, h the gap across columns
    auto lane_v = [&](const Cell& cell) { return task.transposed ? cell.i : cell.d; };
    auto lane_h = [&](const Cell& cell) { return task.transposed ? cell.d : cell.i; };
    auto to_cell = [&](T m, T v, T h) {
        return task.transposed
            ? Cell{from_lane(m), from_lane(h), from_lane(v)}
            : Cell{from_lane(m), from_lane(v), from_lane(h)};
    };

    const size_t chunks = (height + N - 1) / N;
    const size_t rows = 1 + chunks * N;
    std::vector<T> buffer(8 * rows, Limits::min());
    T* prev_m = buffer.data();
    T* prev_v = prev_m + rows;
    T* prev_h = prev_v + rows;
    T* prev_best = prev_h + rows;
    T* cur_m = prev_best + rows;
    T* cur_v = cur_m + rows;
    T* cur_h = cur_v + rows;
    T* cur_best = cur_h + rows;

    for (size_t k = 0; k <= height; ++k) {
        const Cell& cell = task.left[k];
        prev_m[k] = to_lane(cell.m);
        prev_v[k] = to_lane(lane_v(cell));
        prev_h[k] = to_lane(lane_h(cell));
        prev_best[k] = std::max(prev_m[k], std::max(prev_v[k], prev_h[k]));
    }

    for (size_t col = 0; col < width; ++col) {
        const Cell& top = task.top[col];
        cur_m[0] = to_lane(top.m);
        cur_v[0] = to_lane(lane_v(top));
        cur_h[0] = to_lane(lane_h(top));
        cur_best[0] = std::max(cur_m[0], std::max(cur_v[0], cur_h[0]));

        T carry = std::max(
            saturating_sub(cur_v[0], extend),
            saturating_sub(std::max(cur_m[0], cur_h[0]), open)
        );
        const int16_t* scores = task.lane_scores + task.columns[col] * task.lane_stride + task.lane_offset;
        Vec column_max = Vec::set1(Limits::min());

        for (size_t k0 = 1; k0 <= height; k0 += N) {
            Vec diagonal = Vec::load(prev_best + k0 - 1);
            Vec m = adds(diagonal, Vec::template load_from<int16_t>(scores + k0 - 1));
            Vec h = lane_max(
                subs(Vec::load(prev_h + k0), extend),
                subs(lane_max(Vec::load(prev_m + k0), Vec::load(prev_v + k0)), open)
            );
            Vec x = lane_max(m, h);

            // Lane t opens from lane t - 1 or, for lane 0, continues the carry
            Vec v = shift_lanes(subs(x, open), 1, carry);
            for (int s = 1, r = 0; s < N; s <<= 1, ++r) {
                v = lane_max(v, subs(shift_lanes(v, s, Limits::min()), scan_cost[r]));
            }
            carry = std::max(saturating_sub(v[N - 1], extend), saturating_sub(x[N - 1], open));

            Vec best = lane_max(x, v);
            m.store(cur_m + k0);
            v.store(cur_v + k0);
            h.store(cur_h + k0);
            best.store(cur_best + k0);

            int valid = static_cast<int>(std::min<size_t>(N, height - k0 + 1));
            column_max = lane_max(column_max, valid == N ? best : mask_tail(best, valid, Limits::min()));
        }

        T top_value = hmax(column_max);
        if (top_value > ceiling && from_lane(top_value) > out.best) {
            size_t k = 1;
            while (cur_best[k] != top_value) {
                ++k;
            }
            out.best = from_lane(top_value);
            out.best_lane = k;
            out.best_column = col + 1;
        }

        out.bottom[col] = to_cell(cur_m[height], cur_v[height], cur_h[height]);
        if (task.planes != nullptr) {
            Cell* target = task.planes + col * task.plane_column_stride;
            for (size_t k = 1; k <= height; ++k) {
                target[(k - 1) * task.plane_lane_stride] = to_cell(cur_m[k], cur_v[k], cur_h[k]);
            }
        }

        std::swap(prev_m, cur_m);
        std::swap(prev_v, cur_v);
        std::swap(prev_h, cur_h);
        std::swap(prev_best, cur_best);
    }

    for (size_t k = 0; k <= height; ++k) {
        out.right[k] = to_cell(prev_m[k], prev_v[k], prev_h[k]);
    }
    return KernelStatus::ok;
}

template <int N>
LaneKernels make_kernels() {
    return LaneKernels{N, &compute_strip<int16_t, N>, &compute_strip<int32_t, (N > 1 ? N / 2 : 1)>};
}

}  // namespace

LaneKernels select_kernels(int lanes) {
    switch (lanes) {
        case 1: return make_kernels<1>();
        case 2: return make_kernels<2>();
        case 4: return make_kernels<4>();
        case 8: return make_kernels<8>();
        case 16: return make_kernels<16>();
        case 32: return make_kernels<32>();
        default:
            throw ConfigError("Unsupported lane width " + std::to_string(lanes));
    }
}
