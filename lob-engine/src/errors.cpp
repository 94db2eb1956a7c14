#include "lob/errors.hpp"

namespace lob {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidOrder:        return "Invalid order's values";
        case ErrorKind::InvalidModification: return "Invalid modification parameters";
        case ErrorKind::OrderNotFound:       return "Order not found";
        case ErrorKind::NoOrders:            return "No orders available";
        case ErrorKind::DuplicateOrderId:    return "Order id already in book";
    }
    return "Unknown error";
}

BookError::BookError(ErrorKind kind)
    : std::runtime_error(to_string(kind)), kind_(kind) {}

BookError::BookError(ErrorKind kind, const std::string& detail)
    : std::runtime_error(std::string(to_string(kind)) + ": " + detail), kind_(kind) {}

} // namespace lob
