/**
 * rowstream/row_stream.hpp - Buffered row cursor fed by a push-style producer
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * RowStream adapts drivers that cannot hand out a cursor, and instead
 * deliver rows through callbacks, to the pull-based Rows contract.
 * The producer talks to the stream only through its RowController:
 *
 *   rowstream::RowStream rows;
 *   auto& ctrl = rows.controller();
 *
 *   // producer side
 *   ctrl.set_columns({{"id", "INTEGER", false}, {"name", "TEXT", true}});
 *   ctrl.push_array(json::array({1, "alice"}));
 *   ctrl.end();
 *
 *   // consumer side
 *   rows.next().then(...);
 *
 * Producers that can throttle or abort listen for `pause`, `resume` and
 * `cancel` on the controller. `complete` is emitted as soon as the
 * producer calls end(), even while buffered rows are still unread, so the
 * underlying connection can be released early.
 *
 * Everything is single-threaded. Pending operations (ready, next, close)
 * are single-slot Promises owned by the stream.
 */

#pragma once

#include "cancel.hpp"
#include "deferred.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "json.hpp"
#include "log.hpp"
#include "options.hpp"
#include "row.hpp"
#include "rows.hpp"

#include <deque>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace rowstream {

class RowStream;

// ============================================================================
// Controller
// ============================================================================

class RowController {
public:
    explicit RowController(RowStream& stream) : stream_(stream) {}

    // Bound to one stream for its whole life
    RowController(const RowController&) = delete;
    RowController& operator=(const RowController&) = delete;

    /**
     * Resolves once columns are set, or the stream ended, failed or was
     * closed. The value is the terminal error, or null.
     */
    Deferred<std::exception_ptr> ready();

    /// Set the column info. Must be called before pushing rows.
    void set_columns(std::vector<ColumnInfo> columns);

    void push_row(Row row);

    /// Push positional values, named by the column info
    void push_array(const json& values);

    /// Push a record, picking values by column name
    void push_object(const json& record);

    /**
     * Report a failure. Accepts an exception_ptr, an exception object,
     * a message, or any JSON payload (see as_error()). Cancels the stream
     * and then ends it.
     */
    template <typename E>
    void error(const E& err);

    /// All rows have been pushed
    void end();

    /// Subscribe to pause, resume or cancel
    ListenerId on(Event e, EventEmitter::listener_t fn);
    bool off(Event e, ListenerId id);

private:
    RowStream& stream_;
};

// ============================================================================
// Stats
// ============================================================================

struct RowStreamStats {
    bool ready = false;
    size_t size = 0;
    bool paused = false;
    bool can_pause = false;
    std::optional<int> pause_count;
    std::optional<int> resume_count;

    bool operator==(const RowStreamStats& o) const {
        return ready == o.ready && size == o.size && paused == o.paused &&
               can_pause == o.can_pause && pause_count == o.pause_count &&
               resume_count == o.resume_count;
    }
    bool operator!=(const RowStreamStats& o) const { return !(*this == o); }
};

inline void to_json(json& j, const RowStreamStats& s) {
    j = json{
        {"ready", s.ready},
        {"size", s.size},
        {"paused", s.paused},
        {"canPause", s.can_pause},
        {"pauseCount", s.pause_count ? json(*s.pause_count) : json()},
        {"resumeCount", s.resume_count ? json(*s.resume_count) : json()},
    };
}

// ============================================================================
// RowStream
// ============================================================================

class RowStream : public Rows {
public:
    /// Non-cancelable stream without backpressure
    RowStream() : RowStream(RowStreamOptions{}) {}

    /// Throws validation_error for bad backpressure settings
    explicit RowStream(const RowStreamOptions& options)
        : controller_(*this),
          bp_(validate_options(options)),
          canceler_(options.canceler) {
        if (canceler_ != nullptr) {
            // May fire immediately if the context is already canceled
            cancel_token_ = canceler_->on_cancel([this](std::exception_ptr err) {
                cancel_token_ = kNoCancelToken;
                on_external_cancel(std::move(err));
            });
        }
    }

    ~RowStream() override {
        unsubscribe_cancel();
        if (!done_) {
            log(LogLevel::warn, "row stream destroyed before the producer ended it");
        }
    }

    // The controller and the cancel callback hold this address
    RowStream(const RowStream&) = delete;
    RowStream& operator=(const RowStream&) = delete;
    RowStream(RowStream&&) = delete;
    RowStream& operator=(RowStream&&) = delete;

    RowController& controller() { return controller_; }

    // ========================================================================
    // Rows
    // ========================================================================

    Deferred<bool> next() override {
        if (closed_) {
            return resolved(false);
        }
        if (closing_) {
            // Resolve once the in-flight close finishes
            Promise<bool> p;
            wait_close_->deferred().then([p](const Deferred<void>&) mutable {
                p.resolve(false);
            });
            return p.deferred();
        }
        if (wait_next_) {
            throw state_error("Existing next() call has not yet resolved");
        }

        if (!buf_.empty()) {
            row_ = std::move(buf_.front());
            buf_.pop_front();

            if (bp_.can_pause && paused_ &&
                buf_.size() <= static_cast<size_t>(bp_.resume_count)) {
                resume();
            }
            return resolved(true);
        }

        if (done_) {
            // Exhausted: close automatically
            close();
            return resolved(false);
        }

        wait_next_.emplace();
        return wait_next_->deferred();
    }

    const Row& row() const override {
        if (!row_) {
            throw state_error("No row loaded. Call next()");
        }
        return *row_;
    }

    std::vector<std::string> columns() const override {
        if (!field_names_) {
            throw state_error("Column information not yet available");
        }
        return *field_names_;
    }

    std::vector<ColumnInfo> column_types() const override {
        if (!columns_) {
            throw state_error("Column information not yet available");
        }
        return *columns_;
    }

    /**
     * Close the rows. If the producer has already ended, this completes
     * immediately. Otherwise the producer is asked to stop (`cancel`) and
     * the returned Deferred resolves when it calls end(). A pending next()
     * resolves false at the same time.
     */
    Deferred<void> close() override {
        if (closed_) {
            return resolved();
        }
        if (closing_) {
            return wait_close_->deferred();
        }
        closing_ = true;
        unsubscribe_cancel();

        auto wnx = take(wait_next_);

        if (done_) {
            closed_ = true;
            closing_ = false;
            trace("closed");
            if (wnx) wnx->resolve(false);
            return resolved();
        }

        // Registered before `cancel` is emitted so a producer that ends
        // synchronously from its listener finishes this close.
        wait_close_.emplace();
        auto wc = wait_close_->deferred();
        if (wnx) {
            wc.then([p = *wnx](const Deferred<void>&) mutable { p.resolve(false); });
        }

        if (!ready_) {
            resolve_ready(nullptr);
        }

        if (!canceling_) {
            canceling_ = true;
            trace("close requested, canceling producer");
            events_.emit(Event::cancel);
        }
        return wc;
    }

    std::exception_ptr err() const override { return err_; }

    ListenerId on_complete(std::function<void()> fn) override {
        return events_.on(Event::complete, std::move(fn));
    }

    bool off_complete(ListenerId id) override {
        return events_.off(Event::complete, id);
    }

    // ========================================================================
    // Owner-side inspection
    // ========================================================================

    ListenerId on(Event e, EventEmitter::listener_t fn) { return events_.on(e, std::move(fn)); }
    bool off(Event e, ListenerId id) { return events_.off(e, id); }

    bool is_closed() const { return closed_; }
    bool is_done() const { return done_; }
    bool is_canceling() const { return canceling_; }

    /// Number of buffered, unread rows
    size_t size() const { return buf_.size(); }

    RowStreamStats stats() const {
        RowStreamStats s;
        s.ready = ready_;
        s.size = buf_.size();
        s.paused = paused_;
        s.can_pause = bp_.can_pause;
        if (bp_.can_pause) {
            s.pause_count = bp_.pause_count;
            s.resume_count = bp_.resume_count;
        }
        return s;
    }

private:
    friend class RowController;

    template <typename T>
    static std::optional<T> take(std::optional<T>& slot) {
        std::optional<T> out;
        out.swap(slot);
        return out;
    }

    void trace(const char* what) const {
        if (log_enabled(LogLevel::debug)) {
            log(LogLevel::debug, std::string(what) + ", " +
                std::to_string(buf_.size()) + " rows buffered");
        }
    }

    Deferred<std::exception_ptr> ready_deferred() {
        if (ready_) {
            return resolved(err_);
        }
        if (!wait_ready_) {
            wait_ready_.emplace();
        }
        return wait_ready_->deferred();
    }

    void resolve_ready(std::exception_ptr err) {
        ready_ = true;
        if (auto p = take(wait_ready_)) {
            p->resolve(std::move(err));
        }
    }

    void set_columns(std::vector<ColumnInfo> columns) {
        if (columns_) {
            throw state_error("Column info already set");
        }
        field_names_ = make_field_names(columns);
        columns_ = std::move(columns);
        if (!ready_) {
            resolve_ready(nullptr);
        }
    }

    void ensure_fields(const char* op) const {
        if (!columns_) {
            throw state_error(std::string("Column info not yet set. Call set_columns() before ") + op);
        }
    }

    void push(Row row) {
        if (canceling_) {
            // Query is being canceled, drop the row
            return;
        }
        if (done_) {
            throw state_error("Rows already ended");
        }

        if (buf_.empty() && wait_next_) {
            // Consumer is already waiting: hand the row over directly
            row_ = std::move(row);
            auto p = take(wait_next_);
            p->resolve(true);
            return;
        }

        buf_.push_back(std::move(row));
        if (bp_.can_pause && !paused_ &&
            buf_.size() >= static_cast<size_t>(bp_.pause_count)) {
            pause();
        }
    }

    void pause() {
        paused_ = true;
        trace("paused");
        events_.emit(Event::pause);
    }

    void resume() {
        paused_ = false;
        trace("resumed");
        events_.emit(Event::resume);
    }

    /// Producer reported an error
    void fail(std::exception_ptr err) {
        if (done_) {
            log(LogLevel::warn, "error reported after end() ignored: " + error_message(err));
            return;
        }
        err_ = err;
        cancel(err);
        end();
    }

    void cancel(std::exception_ptr err) {
        if (canceling_) {
            return;
        }
        canceling_ = true;
        err_ = err;
        unsubscribe_cancel();

        // Taken first: a producer may call end() from its cancel listener,
        // and the pending pull must still see the error.
        auto wnx = take(wait_next_);

        auto settle = [&] {
            if (!ready_) {
                resolve_ready(err);
            }
            if (wnx) {
                take(wnx)->reject(err);
            }
        };

        trace("canceled");
        try {
            events_.emit(Event::cancel);
        } catch (...) {
            // A throwing listener must not strand the pending pull
            settle();
            throw;
        }
        settle();
    }

    void on_external_cancel(std::exception_ptr err) {
        if (canceling_) {
            return;
        }
        cancel(as_error(std::move(err)));
        if (done_) {
            // Producer already finished; unread rows are abandoned
            finish_closed();
        } else {
            end();
        }
    }

    void end() {
        if (done_) {
            trace("repeated end() ignored");
            return;
        }
        done_ = true;

        if (!ready_) {
            // Ended without data
            field_names_ = make_field_names(std::vector<std::string>{});
            columns_.emplace();
            resolve_ready(err_);
        }

        trace("producer ended");
        events_.emit(Event::complete);

        if (auto wc = take(wait_close_)) {
            finish_closed();
            wc->resolve();
        } else if (err_) {
            finish_closed();
        }

        if (wait_next_ && buf_.empty()) {
            close();
        }
    }

    /// Enter the terminal state. A next() issued from a continuation that
    /// ran during cancel or end is still waiting and resolves false here.
    void finish_closed() {
        closed_ = true;
        closing_ = false;
        if (auto p = take(wait_next_)) {
            p->resolve(false);
        }
    }

    void unsubscribe_cancel() {
        if (canceler_ != nullptr && cancel_token_ != kNoCancelToken) {
            canceler_->off(cancel_token_);
            cancel_token_ = kNoCancelToken;
        }
    }

    RowController controller_;
    EventEmitter events_;
    const Backpressure bp_;

    Canceler* canceler_ = nullptr;
    CancelToken cancel_token_ = kNoCancelToken;

    std::deque<Row> buf_;
    std::optional<Row> row_;
    std::optional<std::vector<ColumnInfo>> columns_;
    FieldNames field_names_;
    std::exception_ptr err_;

    bool ready_ = false;

    // Producer has signaled that all data was delivered
    bool done_ = false;

    // Consumer requested close, producer has not finished yet
    bool closing_ = false;

    // Close finished, no further interaction
    bool closed_ = false;

    // Cancellation started (context, producer error, or early close)
    bool canceling_ = false;

    bool paused_ = false;

    std::optional<Promise<std::exception_ptr>> wait_ready_;
    std::optional<Promise<bool>> wait_next_;
    std::optional<Promise<void>> wait_close_;
};

// ============================================================================
// RowController implementation
// ============================================================================

inline Deferred<std::exception_ptr> RowController::ready() {
    return stream_.ready_deferred();
}

inline void RowController::set_columns(std::vector<ColumnInfo> columns) {
    stream_.set_columns(std::move(columns));
}

inline void RowController::push_row(Row row) {
    stream_.ensure_fields("push_row()");
    stream_.push(std::move(row));
}

inline void RowController::push_array(const json& values) {
    stream_.ensure_fields("push_array()");
    stream_.push(Row::from_array(values, stream_.field_names_));
}

inline void RowController::push_object(const json& record) {
    stream_.ensure_fields("push_object()");
    stream_.push(Row::from_object(record, stream_.field_names_));
}

template <typename E>
void RowController::error(const E& err) {
    stream_.fail(as_error(err));
}

inline void RowController::end() {
    stream_.end();
}

inline ListenerId RowController::on(Event e, EventEmitter::listener_t fn) {
    if (e == Event::complete) {
        throw std::invalid_argument("complete is observed on the rows, not the controller");
    }
    return stream_.events_.on(e, std::move(fn));
}

inline bool RowController::off(Event e, ListenerId id) {
    return stream_.events_.off(e, id);
}

} // namespace rowstream
