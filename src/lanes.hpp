#ifndef BLOCKALIGN_LANES_HPP
#define BLOCKALIGN_LANES_HPP

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

/*
 * Lane widths are counted in 16-bit scores; the 32-bit kernel uses half as
 * many lanes (at least one).
 */
constexpr int SUPPORTED_LANE_WIDTHS[] = {1, 2, 4, 8, 16, 32};

bool is_supported_lane_width(int lanes);

/* Number of 16-bit lanes matching the widest vector unit of this CPU */
int probe_lane_width();

/* Space-separated list of detected vector extensions ("None" if none) */
std::string cpu_features();

template <typename T>
inline T saturating_add(T a, T b) {
    int64_t r = int64_t(a) + int64_t(b);
    return static_cast<T>(std::clamp<int64_t>(r, std::numeric_limits<T>::min(), std::numeric_limits<T>::max()));
}

template <typename T>
inline T saturating_sub(T a, T b) {
    int64_t r = int64_t(a) - int64_t(b);
    return static_cast<T>(std::clamp<int64_t>(r, std::numeric_limits<T>::min(), std::numeric_limits<T>::max()));
}

/*
 * N scores of type T processed together. The operations are written as
 * fixed-length loops so that the compiler can map them onto the vector
 * unit selected at build time.
 */
template <typename T, int N>
struct LaneVector {
    static_assert(N >= 1 && (N & (N - 1)) == 0, "lane count must be a power of two");

    static constexpr int LANES = N;

    static LaneVector set1(T x) {
        LaneVector r;
        for (int i = 0; i < N; ++i) {
            r.v[i] = x;
        }
        return r;
    }

    static LaneVector load(const T* p) {
        LaneVector r;
        std::memcpy(r.v, p, sizeof(T) * N);
        return r;
    }

    // Load with conversion from a narrower type
    template <typename U>
    static LaneVector load_from(const U* p) {
        LaneVector r;
        for (int i = 0; i < N; ++i) {
            r.v[i] = static_cast<T>(p[i]);
        }
        return r;
    }

    void store(T* p) const {
        std::memcpy(p, v, sizeof(T) * N);
    }

    T operator[](int i) const { return v[i]; }

    alignas(sizeof(T) * N) T v[N];
};

template <typename T, int N>
inline LaneVector<T, N> adds(const LaneVector<T, N>& a, const LaneVector<T, N>& b) {
    LaneVector<T, N> r;
    for (int i = 0; i < N; ++i) {
        r.v[i] = saturating_add(a.v[i], b.v[i]);
    }
    return r;
}

template <typename T, int N>
inline LaneVector<T, N> subs(const LaneVector<T, N>& a, T b) {
    LaneVector<T, N> r;
    for (int i = 0; i < N; ++i) {
        r.v[i] = saturating_sub(a.v[i], b);
    }
    return r;
}

template <typename T, int N>
inline LaneVector<T, N> lane_max(const LaneVector<T, N>& a, const LaneVector<T, N>& b) {
    LaneVector<T, N> r;
    for (int i = 0; i < N; ++i) {
        r.v[i] = std::max(a.v[i], b.v[i]);
    }
    return r;
}

/* Move every lane k positions up (towards higher indices), filling the low lanes */
template <typename T, int N>
inline LaneVector<T, N> shift_lanes(const LaneVector<T, N>& a, int k, T fill) {
    LaneVector<T, N> r;
    for (int i = 0; i < N; ++i) {
        r.v[i] = i >= k ? a.v[i - k] : fill;
    }
    return r;
}

/* Lanes at index valid and above are replaced by fill */
template <typename T, int N>
inline LaneVector<T, N> mask_tail(const LaneVector<T, N>& a, int valid, T fill) {
    LaneVector<T, N> r;
    for (int i = 0; i < N; ++i) {
        r.v[i] = i < valid ? a.v[i] : fill;
    }
    return r;
}

template <typename T, int N>
inline T hmax(const LaneVector<T, N>& a) {
    T r = a.v[0];
    for (int i = 1; i < N; ++i) {
        r = std::max(r, a.v[i]);
    }
    return r;
}

#endif
