#pragma once
#include <stdexcept>
#include <string>

namespace lob {

enum class ErrorKind {
    InvalidOrder,           // non-positive price/amount, unknown side
    InvalidModification,    // non-positive new price/amount
    OrderNotFound,
    NoOrders,               // best bid/ask on an empty side
    DuplicateOrderId
};

const char* to_string(ErrorKind kind);

// Thrown by OrderBook operations. Book state is unchanged when this escapes.
class BookError : public std::runtime_error {
public:
    explicit BookError(ErrorKind kind);
    BookError(ErrorKind kind, const std::string& detail);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace lob
