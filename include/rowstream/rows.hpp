/**
 * rowstream/rows.hpp - Consumer-side cursor contract
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * A Rows is read one row at a time:
 *
 *   rows.next().then([&](const rowstream::Deferred<bool>& more) {
 *       if (more.is_rejected()) { ... rows.err() ... }
 *       else if (more.value()) { use(rows.row()); }
 *   });
 *
 * Only one next() may be outstanding. Reaching the end closes the rows
 * automatically; close() may also be called early and is idempotent.
 * The `complete` notification tells an owner (e.g. a connection pool)
 * that the underlying transport is free again.
 */

#pragma once

#include "deferred.hpp"
#include "events.hpp"
#include "row.hpp"

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace rowstream {

class Rows {
public:
    virtual ~Rows() = default;

    /// Advance to the next row. Resolves false once no rows remain.
    virtual Deferred<bool> next() = 0;

    /// Row loaded by the last successful next(). Throws state_error if none.
    virtual const Row& row() const = 0;

    /// Column names. Throws state_error before columns are known.
    virtual std::vector<std::string> columns() const = 0;

    /// Column metadata. Throws state_error before columns are known.
    virtual std::vector<ColumnInfo> column_types() const = 0;

    /// Stop reading. Never rejects.
    virtual Deferred<void> close() = 0;

    /// Terminal error, or null
    virtual std::exception_ptr err() const = 0;

    virtual ListenerId on_complete(std::function<void()> fn) = 0;
    virtual bool off_complete(ListenerId id) = 0;
};

} // namespace rowstream
