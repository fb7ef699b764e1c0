/**
 * rowstream/errors.hpp - Error types and producer error normalization
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * Contract violations (bad options, calls made in the wrong phase) throw
 * synchronously. Producer failures and cancellations travel as
 * std::exception_ptr: they reject pending pulls and are kept on Rows::err().
 */

#pragma once

#include "json.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <cstddef>

namespace rowstream {

// ============================================================================
// Error Types
// ============================================================================

class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid configuration, raised at construction
class validation_error : public error {
public:
    using error::error;
};

/// API used in the wrong phase (before columns, second pending next(), ...)
class state_error : public error {
public:
    using error::error;
};

/// Failure reported by the producer
class underlying_error : public error {
public:
    using error::error;
};

/// Raised by a cancellation source
class canceled_error : public error {
public:
    canceled_error() : error("context canceled") {}
    using error::error;
};

constexpr const char* default_underlying_message = "Underlying stream encountered an error";

// ============================================================================
// Normalization
// ============================================================================

inline std::exception_ptr default_error() {
    return std::make_exception_ptr(underlying_error(default_underlying_message));
}

inline std::exception_ptr as_error(std::exception_ptr err) {
    return err ? err : default_error();
}

inline std::exception_ptr as_error(std::nullptr_t) {
    return default_error();
}

/// Exception objects pass through unchanged
template <typename E,
          typename = std::enable_if_t<std::is_base_of<std::exception, E>::value>>
std::exception_ptr as_error(const E& err) {
    return std::make_exception_ptr(err);
}

inline std::exception_ptr as_error(const std::string& message) {
    return std::make_exception_ptr(underlying_error(message));
}

inline std::exception_ptr as_error(const char* message) {
    if (message == nullptr) return default_error();
    return as_error(std::string(message));
}

/**
 * Normalize a dynamic error payload:
 *   null               -> default underlying error
 *   {"message": m,...} -> underlying_error(m)
 *   "text"             -> underlying_error("text")
 *   anything else      -> underlying_error(value.dump())
 */
inline std::exception_ptr as_error(const json& err) {
    if (err.is_null()) {
        return default_error();
    }
    if (err.is_object()) {
        auto it = err.find("message");
        if (it != err.end()) {
            return as_error(it->is_string() ? it->get<std::string>() : it->dump());
        }
    }
    if (err.is_string()) {
        return as_error(err.get<std::string>());
    }
    return as_error(err.dump());
}

/// what() of the error held by err, or an empty string for a null pointer.
/// Values that are not std::exception report "unknown error".
inline std::string error_message(const std::exception_ptr& err) {
    if (!err) return "";
    try {
        std::rethrow_exception(err);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace rowstream
