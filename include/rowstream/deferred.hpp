/**
 * rowstream/deferred.hpp - Single-slot completion cells
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * A Promise<T> is the writing end, a Deferred<T> the reading end of one
 * shared cell. The cell is settled exactly once, either with a value or
 * with an error. Everything runs on one thread: continuations registered
 * with then() run synchronously at the moment the cell settles (or at once,
 * if it already has).
 *
 *   rowstream::Promise<bool> p;
 *   auto d = p.deferred();
 *   d.then([](const rowstream::Deferred<bool>& r) {
 *       if (r.is_resolved()) printf("%d\n", r.value());
 *   });
 *   p.resolve(true);   // prints 1
 */

#pragma once

#include "errors.hpp"

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace rowstream {

template <typename T> class Deferred;
template <typename T> class Promise;

namespace detail {

enum class Settled {
    pending,
    resolved,
    rejected
};

template <typename T>
struct ValueSlot {
    std::optional<T> value;
};

template <>
struct ValueSlot<void> {};

template <typename T>
struct DeferredState : ValueSlot<T> {
    Settled status = Settled::pending;
    std::exception_ptr error;
    std::vector<std::function<void(const Deferred<T>&)>> continuations;
};

template <typename T>
struct ValueRef {
    using type = const T&;
};

template <>
struct ValueRef<void> {
    using type = void;
};

template <typename T>
const T& load(const DeferredState<T>& state) {
    return *state.value;
}

inline void load(const DeferredState<void>&) {}

template <typename T, typename U>
void store(DeferredState<T>& state, U&& value) {
    state.value.emplace(std::forward<U>(value));
}

inline void store(DeferredState<void>&) {}

} // namespace detail

// ============================================================================
// Deferred - reading end
// ============================================================================

template <typename T>
class Deferred {
public:
    using value_type = T;
    using reference = typename detail::ValueRef<T>::type;
    using continuation_t = std::function<void(const Deferred&)>;

    static Deferred rejected(std::exception_ptr err) {
        Promise<T> p;
        p.reject(std::move(err));
        return p.deferred();
    }

    bool is_pending() const { return state_->status == detail::Settled::pending; }
    bool is_resolved() const { return state_->status == detail::Settled::resolved; }
    bool is_rejected() const { return state_->status == detail::Settled::rejected; }
    bool is_settled() const { return !is_pending(); }

    /// Rejection error, or null
    std::exception_ptr error() const { return state_->error; }

    /**
     * Resolved value. Rethrows the error of a rejected cell and throws
     * state_error while the cell is still pending.
     */
    reference value() const {
        if (is_pending()) {
            throw state_error("Deferred value is not yet available");
        }
        if (is_rejected()) {
            std::rethrow_exception(state_->error);
        }
        return detail::load(*state_);
    }

    /// Same as value(), reads better for Deferred<void>
    reference get() const { return value(); }

    /**
     * Run fn once the cell settles. Continuations run in registration
     * order; fn runs immediately if the cell has already settled.
     */
    void then(continuation_t fn) const {
        if (is_settled()) {
            fn(*this);
            return;
        }
        state_->continuations.push_back(std::move(fn));
    }

    /// True if both refer to the same cell
    bool same_as(const Deferred& other) const { return state_ == other.state_; }

private:
    friend class Promise<T>;

    explicit Deferred(std::shared_ptr<detail::DeferredState<T>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::DeferredState<T>> state_;
};

// ============================================================================
// Promise - writing end
// ============================================================================

template <typename T>
class Promise {
public:
    Promise() : state_(std::make_shared<detail::DeferredState<T>>()) {}

    Deferred<T> deferred() const { return Deferred<T>(state_); }

    bool is_pending() const { return state_->status == detail::Settled::pending; }

    /// resolve(value) for Promise<T>, resolve() for Promise<void>
    template <typename... Args>
    void resolve(Args&&... args) {
        ensure_pending();
        detail::store(*state_, std::forward<Args>(args)...);
        settle(detail::Settled::resolved);
    }

    void reject(std::exception_ptr err) {
        if (!err) {
            throw state_error("Promise rejected without an error");
        }
        ensure_pending();
        state_->error = std::move(err);
        settle(detail::Settled::rejected);
    }

private:
    void ensure_pending() const {
        if (!is_pending()) {
            throw state_error("Promise already settled");
        }
    }

    void settle(detail::Settled status) {
        state_->status = status;

        // Continuations may register new ones on this cell; those run
        // immediately because the cell is already settled.
        auto continuations = std::move(state_->continuations);
        state_->continuations.clear();

        Deferred<T> self(state_);
        for (auto& fn : continuations) {
            fn(self);
        }
    }

    std::shared_ptr<detail::DeferredState<T>> state_;
};

// ============================================================================
// Helpers
// ============================================================================

template <typename T>
Deferred<std::decay_t<T>> resolved(T&& value) {
    Promise<std::decay_t<T>> p;
    p.resolve(std::forward<T>(value));
    return p.deferred();
}

inline Deferred<void> resolved() {
    Promise<void> p;
    p.resolve();
    return p.deferred();
}

} // namespace rowstream
