/**
 * push_driver.cpp - Adapting a callback-style driver to the Rows contract
 *
 * A stand-in driver delivers records from a single-threaded event loop,
 * one record per loop turn, the way network drivers hand out rows as
 * packets arrive. It stops sending on `pause`, starts again on `resume`,
 * and aborts on `cancel`. The consumer reads with for_each and the whole
 * query is canceled through a CancelSource after a fixed number of rows.
 */

#include <rowstream/rowstream.hpp>
#include <cstdio>
#include <deque>
#include <functional>
#include <string>

namespace {

class EventLoop {
public:
    void post(std::function<void()> fn) { queue_.push_back(std::move(fn)); }

    void run() {
        while (!queue_.empty()) {
            auto fn = std::move(queue_.front());
            queue_.pop_front();
            fn();
        }
    }

private:
    std::deque<std::function<void()>> queue_;
};

/// Sends `total` records, one per loop turn
class FakeDriver {
public:
    FakeDriver(EventLoop& loop, rowstream::RowController& ctrl, int total)
        : loop_(loop), ctrl_(ctrl), total_(total) {
        ctrl_.on(rowstream::Event::pause, [this] {
            printf("  driver: pause at record %d\n", sent_);
            paused_ = true;
        });
        ctrl_.on(rowstream::Event::resume, [this] {
            printf("  driver: resume at record %d\n", sent_);
            paused_ = false;
            schedule();
        });
        ctrl_.on(rowstream::Event::cancel, [this] {
            printf("  driver: cancel after %d records\n", sent_);
            canceled_ = true;
            ctrl_.end();
        });
    }

    void start() {
        loop_.post([this] {
            ctrl_.set_columns({
                {"seq", "number", false},
                {"payload", "string", true},
            });
            schedule();
        });
    }

private:
    void schedule() {
        if (scheduled_) return;
        scheduled_ = true;
        loop_.post([this] {
            scheduled_ = false;
            send();
        });
    }

    void send() {
        if (canceled_ || paused_) return;
        if (sent_ == total_) {
            ctrl_.end();
            return;
        }
        ++sent_;
        ctrl_.push_object({{"seq", sent_}, {"payload", "record " + std::to_string(sent_)}});
        schedule();
    }

    EventLoop& loop_;
    rowstream::RowController& ctrl_;
    int total_;
    int sent_ = 0;
    bool paused_ = false;
    bool canceled_ = false;
    bool scheduled_ = false;
};

} // namespace

int main() {
    EventLoop loop;
    rowstream::CancelSource source;

    rowstream::RowStreamOptions opts;
    opts.canceler = &source.canceler();
    opts.pause_count = 5;

    rowstream::RowStream rows(opts);
    FakeDriver driver(loop, rows.controller(), 100);

    // Slow consumer: takes one row per loop turn, and gives up after 12
    int seen = 0;
    std::function<void()> read_one = [&] {
        rows.next().then([&](const rowstream::Deferred<bool>& more) {
            if (more.is_rejected()) {
                printf("reader: stopped, %s\n", rowstream::error_message(more.error()).c_str());
                return;
            }
            if (!more.value()) {
                printf("reader: done\n");
                return;
            }
            printf("reader: %s\n", rows.row()["payload"].get<std::string>().c_str());
            if (++seen == 12) {
                source.cancel();
                return;
            }
            loop.post(read_one);
        });
    };

    driver.start();
    loop.post(read_one);
    loop.run();

    printf("closed=%s err=%s\n", rows.is_closed() ? "yes" : "no",
           rowstream::error_message(rows.err()).c_str());

    // Same driver, drained with for_each
    rowstream::RowStream all;
    FakeDriver second(loop, all.controller(), 8);
    int total = 0;
    auto done = rowstream::for_each(all, [&](const rowstream::Row& row) {
        total += row["seq"].get<int>();
    });
    second.start();
    loop.run();

    if (done.is_rejected()) {
        fprintf(stderr, "for_each failed: %s\n", rowstream::error_message(done.error()).c_str());
        return 1;
    }
    printf("for_each: sum of seq = %d\n", total);
    return 0;
}
