#include <sstream>
#include "lanes.hpp"

namespace {

enum Features {
    SSE2 = 1,
    AVX2 = 2,
    AVX512BW = 4,
};

int detect_features() {
    int flags = 0;
#if (defined(__GNUC__) || defined(__clang__)) && (defined(__x86_64__) || defined(__i386__))
    __builtin_cpu_init();
    if (__builtin_cpu_supports("sse2")) {
        flags |= SSE2;
    }
    if (__builtin_cpu_supports("avx2")) {
        flags |= AVX2;
    }
    if (__builtin_cpu_supports("avx512bw")) {
        flags |= AVX512BW;
    }
#endif
    return flags;
}

int features() {
    static int flags = detect_features();
    return flags;
}

}  // namespace

bool is_supported_lane_width(int lanes) {
    for (auto width : SUPPORTED_LANE_WIDTHS) {
        if (width == lanes) {
            return true;
        }
    }
    return false;
}

int probe_lane_width() {
    int flags = features();
    if (flags & AVX512BW) {
        return 32;
    }
    if (flags & AVX2) {
        return 16;
    }
    if (flags & SSE2) {
        return 8;
    }
    return 1;
}

std::string cpu_features() {
    int flags = features();
    std::stringstream s;
    if (flags & SSE2) {
        s << " sse2";
    }
    if (flags & AVX2) {
        s << " avx2";
    }
    if (flags & AVX512BW) {
        s << " avx512bw";
    }
    auto result = s.str();
    return result.empty() ? "None" : result.substr(1);
}
