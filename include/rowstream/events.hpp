/**
 * rowstream/events.hpp - Lifecycle notifications
 *
 * Part of rowstream - a buffered, cancelable row cursor.
 *
 * One listener list per event kind. emit() calls listeners synchronously in
 * the order they were added. A listener may add or remove listeners while
 * an event is being delivered: a listener removed before its turn is
 * skipped, one added during delivery waits for the next emit().
 */

#pragma once

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace rowstream {

enum class Event {
    pause,     // buffer reached pause_count
    resume,    // buffer drained to resume_count
    cancel,    // producer should stop
    complete   // producer finished, transport may be reclaimed
};

inline const char* event_name(Event e) {
    switch (e) {
        case Event::pause:    return "pause";
        case Event::resume:   return "resume";
        case Event::cancel:   return "cancel";
        case Event::complete: return "complete";
    }
    return "unknown";
}

using ListenerId = uint64_t;

class EventEmitter {
public:
    using listener_t = std::function<void()>;

    EventEmitter() = default;

    // Non-copyable
    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    ListenerId on(Event e, listener_t fn) {
        ListenerId id = ++last_id_;
        slot(e).push_back(Listener{id, std::move(fn)});
        return id;
    }

    bool off(Event e, ListenerId id) {
        auto& list = slot(e);
        for (auto it = list.begin(); it != list.end(); ++it) {
            if (it->id == id) {
                list.erase(it);
                return true;
            }
        }
        return false;
    }

    size_t listener_count(Event e) const { return slot(e).size(); }

    void emit(Event e) {
        auto snapshot = slot(e);
        for (auto& l : snapshot) {
            if (is_registered(e, l.id)) {
                l.fn();
            }
        }
    }

private:
    struct Listener {
        ListenerId id;
        listener_t fn;
    };

    static constexpr size_t kEventCount = 4;

    std::vector<Listener>& slot(Event e) { return listeners_[static_cast<size_t>(e)]; }
    const std::vector<Listener>& slot(Event e) const { return listeners_[static_cast<size_t>(e)]; }

    bool is_registered(Event e, ListenerId id) const {
        for (const auto& l : slot(e)) {
            if (l.id == id) return true;
        }
        return false;
    }

    std::vector<Listener> listeners_[kEventCount];
    ListenerId last_id_ = 0;
};

} // namespace rowstream
