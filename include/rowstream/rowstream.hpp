/**
 * rowstream/rowstream.hpp - Master include for rowstream
 *
 * rowstream - a buffered, cancelable row cursor for push-style drivers
 *
 * Include this single header to get all rowstream functionality:
 *   - RowStream, RowController - buffered cursor and its producer facade
 *   - Rows - consumer contract (next / row / close)
 *   - RowRange, for_each - iteration that always closes the rows
 *   - CancelSource - cooperative cancellation context
 *   - Database, StatementSource - SQLite statements as row producers
 *
 * Example:
 *
 *   rowstream::RowStreamOptions opts;
 *   opts.pause_count = 100;
 *   rowstream::RowStream rows(opts);
 *
 *   auto& ctrl = rows.controller();
 *   ctrl.on(rowstream::Event::pause, [&] { driver.pause(); });
 *   ctrl.on(rowstream::Event::resume, [&] { driver.resume(); });
 *   ctrl.on(rowstream::Event::cancel, [&] { driver.abort(); });
 *
 *   driver.on_fields([&](auto cols) { ctrl.set_columns(cols); });
 *   driver.on_row([&](const json& rec) { ctrl.push_object(rec); });
 *   driver.on_end([&] { ctrl.end(); });
 *   driver.on_error([&](const json& err) { ctrl.error(err); });
 */

#pragma once

#include "json.hpp"
#include "log.hpp"
#include "errors.hpp"
#include "deferred.hpp"
#include "row.hpp"
#include "events.hpp"
#include "cancel.hpp"
#include "options.hpp"
#include "rows.hpp"
#include "row_stream.hpp"
#include "iterate.hpp"
#include "statement_source.hpp"
#include "database.hpp"
