#ifndef TRIPWIRE_TESTS_MANUAL_SCHEDULER_H
#define TRIPWIRE_TESTS_MANUAL_SCHEDULER_H

#include <tripwire/logger.h>
#include <tripwire/scheduler.h>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tripwire::testing {

// Fake clock: timers fire only inside advance(), in due-time order.
class ManualScheduler : public Scheduler {
    struct Entry {
        Callback callback;
    };
    using Key = std::pair<Millis::rep, std::uint64_t>;  // (due, sequence)

    class ManualTimer : public Timer {
    public:
        ManualTimer(ManualScheduler& owner, Key key) : owner_(owner), key_(key) {}
        bool cancel() override { return owner_.erase(key_); }
    private:
        ManualScheduler& owner_;
        Key key_;
    };

public:
    Millis now() const override { return Millis(now_); }

    std::shared_ptr<Timer> schedule(Millis delay, Callback callback) override {
        Key key{now_ + delay.count(), next_seq_++};
        pending_.emplace(key, Entry{std::move(callback)});
        return std::make_shared<ManualTimer>(*this, key);
    }

    void advance(Millis by) {
        const auto target = now_ + by.count();
        while (!pending_.empty() && pending_.begin()->first.first <= target) {
            auto it = pending_.begin();
            now_ = it->first.first;
            auto callback = std::move(it->second.callback);
            pending_.erase(it);
            callback();
        }
        now_ = target;
    }

    std::size_t pending() const { return pending_.size(); }

private:
    bool erase(Key key) { return pending_.erase(key) > 0; }

    Millis::rep now_ = 0;
    std::uint64_t next_seq_ = 0;
    std::map<Key, Entry> pending_;
};

// Keeps every line instead of queueing it for the writer thread.
class CaptureLogger : public Logger {
public:
    void log(LogLevel level, std::string_view message) override {
        std::lock_guard<std::mutex> lock(mtx_);
        lines_.emplace_back(level, std::string(message));
    }

    bool contains(std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& [level, line] : lines_) {
            if (line.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    std::size_t count(std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t n = 0;
        for (const auto& [level, line] : lines_) {
            if (line.find(fragment) != std::string::npos) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};

} // namespace tripwire::testing

#endif
