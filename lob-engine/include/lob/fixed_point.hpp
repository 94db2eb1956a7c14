#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace lob {

// Prices and amounts are fixed-point integers: value * kFixedScale.
using Price = int64_t;
using Amount = int64_t;

constexpr int kFixedDecimals = 8;
constexpr int64_t kFixedScale = 100'000'000;

// Parse an unsigned decimal like "101", "0.25" or "64.83" exactly.
// Rejects signs, exponents, more than kFixedDecimals fraction digits and overflow.
bool parse_fixed(std::string_view sv, int64_t& out);

// parse_fixed plus an optional leading '-'. Wire decoders use it so that
// negative values reach the book's own validation instead of failing as text.
bool parse_signed_fixed(std::string_view sv, int64_t& out);

// Canonical decimal text: no trailing zeros, no trailing dot ("1.5", "100").
std::string format_fixed(int64_t v);

// Round-to-nearest conversion for callers holding binary floating point.
int64_t from_double(double v);

double to_double(int64_t v);

} // namespace lob
