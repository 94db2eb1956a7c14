#pragma once
#include <cstdint>
#include <functional>
#include <string>

namespace lob {

// Source of unique order / book identifiers.
using IdGenerator = std::function<std::string()>;

// Source of wall time, UNIX epoch microseconds.
using Clock = std::function<int64_t()>;

// Random (v4) UUID strings, thread-safe.
IdGenerator make_uuid_generator();

int64_t now_wall_us();

} // namespace lob
