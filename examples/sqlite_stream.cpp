/**
 * sqlite_stream.cpp - Stream a SQLite query through a RowStream
 *
 * Usage: sqlite_stream [database] [sql]
 *
 * Without arguments, builds a small in-memory table and streams it with
 * backpressure enabled, printing pause/resume hints as they happen.
 */

#include <rowstream/rowstream.hpp>
#include <cstdio>
#include <string>

namespace {

bool create_sample(rowstream::Database& db) {
    const char* setup =
        "CREATE TABLE products (id INTEGER PRIMARY KEY, name TEXT, price REAL);"
        "INSERT INTO products (name, price) VALUES"
        "  ('Apple', 1.50), ('Banana', 0.75), ('Cherry', 3.00),"
        "  ('Date', 2.25), ('Elderberry', 4.50), ('Fig', 2.80),"
        "  ('Grape', 1.95), ('Honeydew', 3.40);";
    if (db.exec(setup) != SQLITE_OK) {
        fprintf(stderr, "Setup failed: %s\n", db.last_error().c_str());
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    const char* path = argc > 1 ? argv[1] : ":memory:";
    std::string sql = argc > 2 ? argv[2] : "SELECT id, name, price FROM products ORDER BY id";

    rowstream::Database db;
    if (!db.open(path)) {
        fprintf(stderr, "Failed to open database: %s\n", db.last_error().c_str());
        return 1;
    }
    if (argc <= 1 && !create_sample(db)) {
        return 1;
    }

    rowstream::set_log_level(rowstream::LogLevel::info);

    // Backpressure settings, the way a service would load them from its config
    rowstream::RowStreamOptions opts;
    try {
        opts = rowstream::RowStreamOptions::from_json(
            rowstream::json::parse(R"({"pause_count": 4, "resume_count": 1})"));
    } catch (const std::exception& e) {
        fprintf(stderr, "Bad options: %s\n", e.what());
        return 1;
    }

    rowstream::RowStream rows(opts);
    auto& ctrl = rows.controller();
    ctrl.on(rowstream::Event::pause, [&] {
        printf("  -- paused, %zu rows buffered\n", rows.size());
    });
    ctrl.on(rowstream::Event::resume, [&] {
        printf("  -- resumed, %zu rows buffered\n", rows.size());
    });
    rows.on_complete([] { printf("  -- statement complete\n"); });

    auto src = db.stream(sql, rows);

    // Columns are known as soon as the statement is prepared
    if (!rows.err()) {
        for (const auto& col : rows.column_types()) {
            printf("%-12s", (col.name + ":" + col.type_name).c_str());
        }
        printf("\n");
    }

    // Refill the buffer up to the pause mark whenever the reader runs dry
    auto refill = [&] {
        if (src->finished()) return false;
        src->pump();
        return true;
    };

    try {
        for (const auto& row : rowstream::RowRange(rows, refill)) {
            for (const auto& value : row) {
                printf("%-12s", value.is_string() ? value.get<std::string>().c_str()
                                                  : value.dump().c_str());
            }
            printf("\n");
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "Query error: %s\n", e.what());
        return 1;
    }

    printf("\n%zu rows, stats: %s\n", src->rows_pushed(),
           rowstream::json(rows.stats()).dump().c_str());
    return 0;
}
