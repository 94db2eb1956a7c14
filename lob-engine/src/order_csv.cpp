#include "lob/order_csv.hpp"

#include <string_view>
#include <vector>

namespace lob {

static inline void split_csv_simple(std::string_view s, std::vector<std::string_view>& out) {
    out.clear();
    out.reserve(4);

    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i == s.size() || s[i] == ',') {
            out.emplace_back(s.data() + start, i - start);
            start = i + 1;
        }
    }
}

static inline std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool parse_order_csv_line(const std::string& line, Order& out) {
    std::string_view s(line);
    if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
    if (trim(s).empty()) return false;
    if (s.rfind("side,", 0) == 0) return false;

    static thread_local std::vector<std::string_view> f;
    split_csv_simple(s, f);
    if (f.size() < 3 || f.size() > 4) return false;

    Order o;
    if (!parse_side(std::string(trim(f[0])), o.side)) return false;
    if (!parse_fixed(trim(f[1]), o.price)) return false;
    if (!parse_fixed(trim(f[2]), o.amount)) return false;
    if (f.size() == 4) o.id = std::string(trim(f[3]));

    out = std::move(o);
    return true;
}

} // namespace lob
