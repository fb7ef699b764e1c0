/**
 * rowstream/statement_source.hpp - SQLite statement as a row producer
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * StatementSource prepares one statement and feeds its result into a
 * RowController, one sqlite3_step() per pushed row. It follows the
 * stream's hints: it stops stepping on `pause`, may continue after
 * `resume`, and on `cancel` finalizes the statement and ends the stream.
 *
 *   rowstream::RowStream rows;
 *   rowstream::StatementSource src(db.handle(), "SELECT * FROM t", rows.controller());
 *   src.pump();   // push until paused or finished
 *
 * The stream must outlive the source.
 */

#pragma once

#include "errors.hpp"
#include "events.hpp"
#include "json.hpp"
#include "log.hpp"
#include "row.hpp"
#include "row_stream.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <string>
#include <vector>

namespace rowstream {

// ============================================================================
// Value conversion
// ============================================================================

inline json column_value(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return json(static_cast<int64_t>(sqlite3_column_int64(stmt, col)));
        case SQLITE_FLOAT:
            return json(sqlite3_column_double(stmt, col));
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            return json(std::string(text ? text : "", static_cast<size_t>(len)));
        }
        case SQLITE_BLOB: {
            const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
            int len = sqlite3_column_bytes(stmt, col);
            std::vector<uint8_t> bytes;
            if (data && len > 0) {
                bytes.assign(data, data + len);
            }
            return json::binary(std::move(bytes));
        }
        case SQLITE_NULL:
        default:
            return json();
    }
}

inline std::vector<ColumnInfo> statement_columns(sqlite3_stmt* stmt) {
    int col_count = sqlite3_column_count(stmt);
    std::vector<ColumnInfo> cols;
    cols.reserve(col_count);
    for (int i = 0; i < col_count; ++i) {
        const char* name = sqlite3_column_name(stmt, i);
        const char* decl = sqlite3_column_decltype(stmt, i);
        // SQLite does not report nullability for result columns
        cols.emplace_back(name ? name : "", decl ? decl : "", true);
    }
    return cols;
}

// ============================================================================
// StatementSource
// ============================================================================

class StatementSource {
public:
    /**
     * Prepare sql on db. A prepare failure is reported to the stream
     * through controller.error(), which leaves the source finished.
     */
    StatementSource(sqlite3* db, const std::string& sql, RowController& controller)
        : db_(db), ctrl_(controller) {
        pause_id_ = ctrl_.on(Event::pause, [this] { paused_ = true; });
        resume_id_ = ctrl_.on(Event::resume, [this] { paused_ = false; });
        cancel_id_ = ctrl_.on(Event::cancel, [this] { on_cancel(); });

        if (db_ == nullptr) {
            fail("Database not open");
            return;
        }
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
        if (rc != SQLITE_OK) {
            fail(sqlite3_errmsg(db_));
            return;
        }
        ctrl_.set_columns(statement_columns(stmt_));
    }

    ~StatementSource() {
        ctrl_.off(Event::pause, pause_id_);
        ctrl_.off(Event::resume, resume_id_);
        ctrl_.off(Event::cancel, cancel_id_);
        finalize();
    }

    // Non-copyable
    StatementSource(const StatementSource&) = delete;
    StatementSource& operator=(const StatementSource&) = delete;

    /**
     * Push at most one row. Returns true if a row was pushed or the
     * stream was ended by this call, false if there was nothing to do
     * (already finished).
     */
    bool step() {
        if (finished_) return false;

        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            ++rows_pushed_;
            std::vector<json> values;
            int col_count = sqlite3_column_count(stmt_);
            values.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                values.push_back(column_value(stmt_, i));
            }
            ctrl_.push_array(json(std::move(values)));
            return true;
        }

        if (rc == SQLITE_DONE) {
            finalize();
            finished_ = true;
            ctrl_.end();
            return true;
        }

        fail(sqlite3_errmsg(db_));
        return true;
    }

    /// Step until paused or finished. Returns the number of rows pushed.
    size_t pump() {
        size_t pushed = 0;
        while (!finished_ && !paused_) {
            size_t before = rows_pushed_;
            step();
            pushed += rows_pushed_ - before;
        }
        return pushed;
    }

    bool finished() const { return finished_; }
    bool paused() const { return paused_; }
    bool canceled() const { return canceled_; }
    size_t rows_pushed() const { return rows_pushed_; }

private:
    void on_cancel() {
        if (finished_) return;
        log(LogLevel::debug, "statement canceled after " + std::to_string(rows_pushed_) + " rows");
        canceled_ = true;
        finalize();
        finished_ = true;
        ctrl_.end();
    }

    void fail(const std::string& msg) {
        log(LogLevel::info, "statement failed: " + msg);
        finalize();
        finished_ = true;
        ctrl_.error(msg);
    }

    void finalize() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    RowController& ctrl_;

    ListenerId pause_id_ = 0;
    ListenerId resume_id_ = 0;
    ListenerId cancel_id_ = 0;

    size_t rows_pushed_ = 0;
    bool paused_ = false;
    bool canceled_ = false;
    bool finished_ = false;
};

} // namespace rowstream
