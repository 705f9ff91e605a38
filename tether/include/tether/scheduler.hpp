#pragma once
// Scheduler: periodic automation ticks on a background thread
//
// One thread, so ticks never overlap. stop() wakes the thread and joins
// it; a tick already running finishes first.

#include "types.hpp"
#include "automation.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <iostream>

namespace tether {

enum class SchedulerEvent {
    Started,
    Tick,       // Tick completed
    Failed,     // Tick threw
    Stopped
};

using SchedulerCallback = std::function<void(SchedulerEvent, const std::string&)>;

class AutomationScheduler {
public:
    using TickFn = std::function<AutomationReport()>;

    struct Stats {
        size_t ticks = 0;
        size_t failures = 0;
        size_t proposals = 0;
        size_t applied = 0;
        size_t advisories = 0;
        Timestamp last_tick = 0;
    };

    AutomationScheduler(TickFn tick, int64_t interval_ms, bool quiet = false)
        : tick_(std::move(tick)), interval_ms_(interval_ms), quiet_(quiet), running_(false) {}

    ~AutomationScheduler() {
        stop();
    }

    AutomationScheduler(const AutomationScheduler&) = delete;
    AutomationScheduler& operator=(const AutomationScheduler&) = delete;

    void on_event(SchedulerCallback callback) {
        callback_ = std::move(callback);
    }

    // First tick runs immediately
    void start() {
        if (running_.exchange(true)) return;  // Already running

        thread_ = std::thread([this]() {
            run_loop();
        });

        if (!quiet_) std::cerr << "[Scheduler] Started, every " << interval_ms_ << "ms\n";
        emit(SchedulerEvent::Started, "Scheduler started");
    }

    void stop() {
        if (!running_.exchange(false)) return;  // Not running

        { std::lock_guard<std::mutex> lock(wait_mutex_); }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }

        if (!quiet_) std::cerr << "[Scheduler] Stopped after " << stats().ticks << " ticks\n";
        emit(SchedulerEvent::Stopped, "Scheduler stopped");
    }

    bool is_running() const { return running_; }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    // One tick on the caller's thread
    bool run_once() {
        AutomationReport report;
        try {
            report = tick_();
        } catch (const std::exception& e) {
            std::cerr << "[Scheduler] Tick failed: " << e.what() << "\n";
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.failures;
            }
            emit(SchedulerEvent::Failed, e.what());
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.ticks;
            stats_.proposals += report.proposals.size();
            stats_.applied += report.applied.size();
            stats_.advisories += report.advisories.size();
            stats_.last_tick = now();
        }
        emit(SchedulerEvent::Tick, std::to_string(report.applied.size()) + " applied");
        return true;
    }

private:
    void run_loop() {
        while (running_) {
            run_once();

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(interval_ms_),
                           [this] { return !running_; });
        }
    }

    void emit(SchedulerEvent event, const std::string& msg) {
        if (callback_) {
            callback_(event, msg);
        }
    }

    TickFn tick_;
    int64_t interval_ms_;
    bool quiet_;
    std::atomic<bool> running_;
    std::thread thread_;
    SchedulerCallback callback_;

    std::mutex wait_mutex_;
    std::condition_variable wake_;

    mutable std::mutex mutex_;
    Stats stats_;
};

} // namespace tether
