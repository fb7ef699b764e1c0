/**
 * rowstream/options.hpp - RowStream configuration
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * Backpressure is off unless pause_count is set. When the buffer grows to
 * pause_count rows the stream emits `pause`; once the consumer drains it to
 * resume_count rows (default pause_count / 2) it emits `resume`. Both are
 * hints to the producer, the buffer itself is never capped.
 */

#pragma once

#include "cancel.hpp"
#include "errors.hpp"
#include "json.hpp"

#include <limits>
#include <optional>
#include <string>

namespace rowstream {

// ============================================================================
// Options
// ============================================================================

struct RowStreamOptions {
    /// Optional cancellation context. Must outlive the stream.
    Canceler* canceler = nullptr;

    std::optional<int> pause_count;
    std::optional<int> resume_count;

    /**
     * Read backpressure settings from a config object:
     *   {"pause_count": 100, "resume_count": 20}
     * Absent or null keys stay unset. Validation happens when the
     * stream is constructed.
     */
    static RowStreamOptions from_json(const json& j) {
        if (!j.is_null() && !j.is_object()) {
            throw validation_error("row stream options must be a JSON object");
        }
        RowStreamOptions opts;
        if (j.is_object()) {
            opts.pause_count = read_count(j, "pause_count");
            opts.resume_count = read_count(j, "resume_count");
        }
        return opts;
    }

private:
    static std::optional<int> read_count(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        if (!it->is_number_integer()) {
            throw validation_error(std::string(key) + " must be an integer");
        }
        // Wider values would be silently truncated by get<int>()
        if (it->is_number_unsigned()) {
            if (it->get<json::number_unsigned_t>() >
                static_cast<json::number_unsigned_t>(std::numeric_limits<int>::max())) {
                throw validation_error(std::string(key) + " is out of range");
            }
        } else {
            auto v = it->get<json::number_integer_t>();
            if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
                throw validation_error(std::string(key) + " is out of range");
            }
        }
        return it->get<int>();
    }
};

// ============================================================================
// Validation
// ============================================================================

struct Backpressure {
    bool can_pause = false;
    int pause_count = 0;
    int resume_count = 0;
};

inline Backpressure validate_options(const RowStreamOptions& options) {
    Backpressure bp;

    if (!options.pause_count) {
        if (options.resume_count) {
            throw validation_error("pause_count must be provided with resume_count");
        }
        return bp;
    }

    const int pause_count = *options.pause_count;
    if (pause_count < 2) {
        throw validation_error("pause_count must be greater than 1");
    }

    int resume_count = pause_count / 2;
    if (options.resume_count) {
        resume_count = *options.resume_count;
        if (resume_count < 0) {
            throw validation_error("resume_count cannot be negative");
        }
        if (resume_count >= pause_count) {
            throw validation_error("resume_count must be less than pause_count");
        }
    }

    bp.can_pause = true;
    bp.pause_count = pause_count;
    bp.resume_count = resume_count;
    return bp;
}

} // namespace rowstream
