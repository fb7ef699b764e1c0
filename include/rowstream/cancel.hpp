/**
 * rowstream/cancel.hpp - Cooperative cancellation
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * A Canceler is the listening side of a cancellation context: callers
 * register a callback and get a token back to remove it later. The owner
 * of a CancelSource fires it; every registered callback runs at most once
 * and is removed before it is invoked.
 *
 *   rowstream::CancelSource source;
 *   rowstream::RowStreamOptions opts;
 *   opts.canceler = &source.canceler();
 *   rowstream::RowStream rows(opts);
 *   ...
 *   source.cancel();   // pending next() rejects with canceled_error
 */

#pragma once

#include "errors.hpp"

#include <cstdint>
#include <exception>
#include <functional>
#include <utility>
#include <vector>

namespace rowstream {

using CancelToken = uint64_t;
using CancelCallback = std::function<void(std::exception_ptr err)>;

/// Token value meaning "no registration"
constexpr CancelToken kNoCancelToken = 0;

// ============================================================================
// Canceler interface
// ============================================================================

class Canceler {
public:
    virtual ~Canceler() = default;

    /**
     * Register fn to be called once with the cancellation error.
     * If cancellation already happened fn runs immediately and
     * kNoCancelToken is returned.
     */
    virtual CancelToken on_cancel(CancelCallback fn) = 0;

    /// Remove a registration. Returns false if the token is unknown.
    virtual bool off(CancelToken token) = 0;
};

// ============================================================================
// CancelSource
// ============================================================================

class CancelSource : public Canceler {
public:
    CancelSource() = default;

    // Non-copyable: registrations point at this object
    CancelSource(const CancelSource&) = delete;
    CancelSource& operator=(const CancelSource&) = delete;

    Canceler& canceler() { return *this; }

    CancelToken on_cancel(CancelCallback fn) override {
        if (err_) {
            fn(err_);
            return kNoCancelToken;
        }
        CancelToken token = ++last_token_;
        callbacks_.push_back(Registration{token, std::move(fn)});
        return token;
    }

    bool off(CancelToken token) override {
        for (auto it = callbacks_.begin(); it != callbacks_.end(); ++it) {
            if (it->token == token) {
                callbacks_.erase(it);
                return true;
            }
        }
        return false;
    }

    void cancel() { cancel(std::make_exception_ptr(canceled_error())); }

    /// Fire all registered callbacks. Only the first call has any effect.
    void cancel(std::exception_ptr err) {
        if (err_) return;
        err_ = err ? std::move(err) : std::make_exception_ptr(canceled_error());

        while (!callbacks_.empty()) {
            Registration next = std::move(callbacks_.front());
            callbacks_.erase(callbacks_.begin());
            next.fn(err_);
        }
    }

    bool is_canceled() const { return static_cast<bool>(err_); }
    std::exception_ptr err() const { return err_; }

    /// Number of live registrations
    size_t size() const { return callbacks_.size(); }

private:
    struct Registration {
        CancelToken token;
        CancelCallback fn;
    };

    std::vector<Registration> callbacks_;
    std::exception_ptr err_;
    CancelToken last_token_ = kNoCancelToken;
};

} // namespace rowstream
