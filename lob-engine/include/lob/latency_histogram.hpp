#pragma once
#include <cstdint>

namespace lob {

// Log2-bucketed nanosecond latencies. Percentiles are upper bucket bounds.
// Not synchronized.
struct LatencyHistogram {
    static constexpr int kBuckets = 64;
    uint64_t counts[kBuckets]{};
    uint64_t total = 0;
    uint64_t max_ns = 0;

    static int bucket(uint64_t ns) {
        if (ns == 0) return 0;
#if defined(__GNUG__) || defined(__clang__)
        return 63 - __builtin_clzll(ns);
#else
        int b = 0;
        while (b < 63 && (1ull << (b + 1)) <= ns) ++b;
        return b;
#endif
    }

    void record(uint64_t ns) {
        counts[bucket(ns)]++;
        total++;
        if (ns > max_ns) max_ns = ns;
    }

    void merge(const LatencyHistogram& o) {
        for (int b = 0; b < kBuckets; ++b) counts[b] += o.counts[b];
        total += o.total;
        if (o.max_ns > max_ns) max_ns = o.max_ns;
    }

    // p in [0, 1]
    uint64_t percentile(double p) const {
        if (total == 0) return 0;
        if (p < 0) p = 0;
        if (p > 1) p = 1;

        uint64_t target = static_cast<uint64_t>(p * (double)total);
        if (target == 0) target = 1;

        uint64_t cum = 0;
        for (int b = 0; b < kBuckets; ++b) {
            cum += counts[b];
            if (cum >= target) {
                return b >= 63 ? (1ull << 63) : (1ull << (b + 1));
            }
        }
        return 1ull << 63;
    }
};

} // namespace lob
