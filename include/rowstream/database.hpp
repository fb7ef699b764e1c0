/**
 * rowstream/database.hpp - SQLite connection that hands out streaming queries
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * Example usage:
 *
 *   rowstream::Database db;
 *   if (!db.open(":memory:")) {
 *       fprintf(stderr, "Error: %s\n", db.last_error().c_str());
 *       return 1;
 *   }
 *
 *   rowstream::RowStream rows;
 *   auto src = db.stream("SELECT id, name FROM users", rows);
 *
 *   for (const auto& row : rowstream::RowRange(rows, [&] { return src->step(); })) {
 *       printf("%s\n", row["name"].get<std::string>().c_str());
 *   }
 */

#pragma once

#include "row_stream.hpp"
#include "statement_source.hpp"

#include <sqlite3.h>

#include <memory>
#include <string>

namespace rowstream {

class Database {
public:
    Database() = default;

    /// Opens `path`; check is_open() and last_error()
    explicit Database(const std::string& path) { open(path); }

    // ========================================================================
    // Connection
    // ========================================================================

    bool open(const std::string& path = ":memory:") {
        conn_.reset();
        sqlite3* db = nullptr;
        int rc = sqlite3_open(path.c_str(), &db);
        // sqlite3_open hands back a handle even on failure, so take ownership first
        conn_.reset(db);
        if (rc != SQLITE_OK) {
            last_error_ = db ? sqlite3_errmsg(db) : "Failed to allocate database";
            conn_.reset();
            return false;
        }
        last_error_.clear();
        return true;
    }

    void close() { conn_.reset(); }

    bool is_open() const { return conn_ != nullptr; }

    /// Runs statements that return no rows (schema, inserts)
    int exec(const std::string& sql) {
        if (!conn_) {
            last_error_ = "Database not open";
            return SQLITE_ERROR;
        }

        char* err = nullptr;
        int rc = sqlite3_exec(conn_.get(), sql.c_str(), nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(conn_.get());
        } else {
            last_error_.clear();
        }
        return rc;
    }

    // ========================================================================
    // Streaming
    // ========================================================================

    /**
     * Start a streaming query into rows. Column info is set right away;
     * rows are pushed as the returned source is stepped or pumped.
     * SQL errors surface on rows.err() and reject a pending next().
     * The source must be destroyed before rows and before this database
     * is closed.
     */
    std::unique_ptr<StatementSource> stream(const std::string& sql, RowStream& rows) {
        return std::make_unique<StatementSource>(conn_.get(), sql, rows.controller());
    }

    sqlite3* handle() const { return conn_.get(); }
    const std::string& last_error() const { return last_error_; }

private:
    struct Closer {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };

    std::unique_ptr<sqlite3, Closer> conn_;
    std::string last_error_;
};

} // namespace rowstream
