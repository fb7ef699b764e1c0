/**
 * rowstream/iterate.hpp - Iteration over Rows
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * Two ways to walk a result, both of which always close the rows:
 *
 * RowRange - range-for over rows. When next() cannot complete on its own
 * the range calls a pump function that lets the producer make progress
 * (for example StatementSource::step). The destructor closes the rows,
 * whether the loop ran to the end, hit `break`, or threw.
 *
 *   for (const auto& row : rowstream::RowRange(rows, [&] { return src.step(); })) {
 *       printf("%s\n", row["name"].dump().c_str());
 *   }
 *
 * for_each - continuation-driven loop for producers that push on their own
 * schedule. The returned Deferred settles after the rows are closed.
 *
 *   rowstream::for_each(rows, [&](const rowstream::Row& row) { ... })
 *       .then([](const rowstream::Deferred<void>& done) { ... });
 */

#pragma once

#include "deferred.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rows.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <utility>

namespace rowstream {

/// Lets the producer make progress. Returns false if it cannot.
using PumpFn = std::function<bool()>;

// ============================================================================
// RowRange
// ============================================================================

class RowRange {
public:
    explicit RowRange(Rows& rows, PumpFn pump = nullptr)
        : rows_(rows), pump_(std::move(pump)) {}

    ~RowRange() {
        try {
            finish();
        } catch (const std::exception& e) {
            log(LogLevel::error, std::string("failed to close rows: ") + e.what());
        }
    }

    // Non-copyable
    RowRange(const RowRange&) = delete;
    RowRange& operator=(const RowRange&) = delete;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Row;
        using difference_type = std::ptrdiff_t;
        using pointer = const Row*;
        using reference = const Row&;

        iterator() = default;
        explicit iterator(RowRange* range) : range_(range) {}

        reference operator*() const { return range_->rows_.row(); }
        pointer operator->() const { return &range_->rows_.row(); }

        iterator& operator++() {
            if (!range_->advance()) {
                range_ = nullptr;
            }
            return *this;
        }

        bool operator==(const iterator& other) const { return range_ == other.range_; }
        bool operator!=(const iterator& other) const { return range_ != other.range_; }

    private:
        RowRange* range_ = nullptr;
    };

    /// Single pass: a second begin() throws state_error
    iterator begin() {
        if (started_) {
            throw state_error("RowRange can only be iterated once");
        }
        started_ = true;
        return advance() ? iterator(this) : iterator();
    }

    iterator end() { return iterator(); }

    /// Close the rows and pump until the close has completed
    void finish() {
        if (finished_) return;
        finished_ = true;
        wait(rows_.close());
    }

private:
    bool advance() {
        auto more = rows_.next();
        wait(more);
        return more.value();
    }

    template <typename T>
    void wait(const Deferred<T>& d) {
        while (d.is_pending()) {
            if (!pump_ || !pump_()) {
                throw state_error("Row stream stalled: producer cannot make progress");
            }
        }
    }

    Rows& rows_;
    PumpFn pump_;
    bool started_ = false;
    bool finished_ = false;
};

// ============================================================================
// for_each
// ============================================================================

namespace detail {

class ForEachLoop : public std::enable_shared_from_this<ForEachLoop> {
public:
    ForEachLoop(Rows& rows, std::function<void(const Row&)> on_row)
        : rows_(rows), on_row_(std::move(on_row)) {}

    Deferred<void> deferred() const { return done_.deferred(); }

    void run() {
        for (;;) {
            auto more = rows_.next();
            if (more.is_pending()) {
                auto self = shared_from_this();
                more.then([self](const Deferred<bool>& settled) {
                    if (self->step(settled)) {
                        self->run();
                    }
                });
                return;
            }
            if (!step(more)) {
                return;
            }
        }
    }

private:
    // Returns true while there may be more rows to read
    bool step(const Deferred<bool>& more) {
        if (more.is_rejected()) {
            finish(more.error());
            return false;
        }
        if (!more.value()) {
            finish(nullptr);
            return false;
        }
        try {
            on_row_(rows_.row());
        } catch (...) {
            finish(std::current_exception());
            return false;
        }
        return true;
    }

    void finish(std::exception_ptr err) {
        auto self = shared_from_this();
        rows_.close().then([self, err](const Deferred<void>&) {
            if (err) {
                self->done_.reject(err);
            } else {
                self->done_.resolve();
            }
        });
    }

    Rows& rows_;
    std::function<void(const Row&)> on_row_;
    Promise<void> done_;
};

} // namespace detail

/**
 * Call on_row for every row. The result resolves after the rows are
 * exhausted and closed, or rejects (after closing) with the stream error
 * or with an exception thrown by on_row. rows must outlive the loop.
 */
inline Deferred<void> for_each(Rows& rows, std::function<void(const Row&)> on_row) {
    auto loop = std::make_shared<detail::ForEachLoop>(rows, std::move(on_row));
    auto result = loop->deferred();
    loop->run();
    return result;
}

} // namespace rowstream
