#include "lob/fixed_point.hpp"

#include <cmath>
#include <limits>

namespace lob {

static inline bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool parse_fixed(std::string_view sv, int64_t& out) {
    if (sv.empty()) return false;

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();

    int64_t whole = 0;
    size_t i = 0;
    bool any_digit = false;

    while (i < sv.size() && is_digit(sv[i])) {
        const int d = sv[i] - '0';
        if (whole > (kMax - d) / 10) return false;
        whole = whole * 10 + d;
        any_digit = true;
        ++i;
    }

    int64_t frac = 0;
    int frac_digits = 0;
    if (i < sv.size() && sv[i] == '.') {
        ++i;
        while (i < sv.size() && is_digit(sv[i])) {
            if (frac_digits == kFixedDecimals) return false;
            frac = frac * 10 + (sv[i] - '0');
            ++frac_digits;
            any_digit = true;
            ++i;
        }
    }

    if (!any_digit || i != sv.size()) return false;

    for (int k = frac_digits; k < kFixedDecimals; ++k) frac *= 10;

    if (whole > (kMax - frac) / kFixedScale) return false;
    out = whole * kFixedScale + frac;
    return true;
}

bool parse_signed_fixed(std::string_view sv, int64_t& out) {
    if (!sv.empty() && sv.front() == '-') {
        int64_t mag = 0;
        if (!parse_fixed(sv.substr(1), mag)) return false;
        out = -mag;
        return true;
    }
    return parse_fixed(sv, out);
}

std::string format_fixed(int64_t v) {
    std::string s;
    uint64_t mag = static_cast<uint64_t>(v);
    if (v < 0) {
        s.push_back('-');
        // unsigned negate keeps INT64_MIN defined
        mag = static_cast<uint64_t>(0) - mag;
    }

    const uint64_t scale = static_cast<uint64_t>(kFixedScale);
    s += std::to_string(mag / scale);

    const uint64_t frac = mag % scale;
    if (frac != 0) {
        std::string f = std::to_string(frac);
        f.insert(0, kFixedDecimals - f.size(), '0');
        while (f.back() == '0') f.pop_back();
        s += '.';
        s += f;
    }
    return s;
}

int64_t from_double(double v) {
    return static_cast<int64_t>(std::llround(v * static_cast<double>(kFixedScale)));
}

double to_double(int64_t v) {
    return static_cast<double>(v) / static_cast<double>(kFixedScale);
}

} // namespace lob
