#pragma once
// Scheduler: maintenance jobs triggered by elapsed time or event count
//
// A job is due when interval_ms has passed since it last ran, or when
// event_threshold events were recorded since then. tick() runs every due
// job on the caller's thread; MaintenanceDaemon calls tick() from its own
// thread. Time comes from the injected Clock, so tests drive it directly.

#include "log.hpp"
#include "status.hpp"
#include "types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <algorithm>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cortex {

using JobFn = std::function<Status()>;

struct JobSpec {
    std::string name;
    int64_t interval_ms = MS_PER_HOUR;
    uint64_t event_threshold = 0;       // 0 = time trigger only
    JobFn run;
};

struct JobRun {
    std::string name;
    std::string trigger;                // interval | events
    Status status;
    Timestamp at = 0;
};

class Scheduler {
public:
    explicit Scheduler(std::shared_ptr<Clock> clock = system_clock())
        : clock_(std::move(clock)) {}

    // The interval starts counting when the job is added
    Status add_job(JobSpec spec) {
        if (spec.name.empty()) return Status::validation("job name is empty");
        if (!spec.run) return Status::validation("job '" + spec.name + "' has no function");
        if (spec.interval_ms <= 0 && spec.event_threshold == 0) {
            return Status::validation("job '" + spec.name + "' has no trigger");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& j : jobs_) {
            if (j.spec.name == spec.name) return Status::validation("job '" + spec.name + "' already exists");
        }
        jobs_.push_back({std::move(spec), clock_->now(), 0, 0, false});
        return Status::ok();
    }

    // Count one (or n) foreground writes towards every job's threshold
    void record_event(uint64_t n = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& j : jobs_) j.events += n;
    }

    // Names of jobs that would run on the next tick
    std::vector<std::string> due() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Timestamp current = clock_->now();
        std::vector<std::string> names;
        for (const auto& j : jobs_) {
            if (!trigger_of(j, current).empty()) names.push_back(j.spec.name);
        }
        return names;
    }

    // Run every due job. A failing job is logged and retried on its next
    // trigger; it never stops the others.
    std::vector<JobRun> tick() {
        std::vector<std::pair<std::string, std::string>> to_run;
        Timestamp current = clock_->now();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& j : jobs_) {
                std::string trigger = trigger_of(j, current);
                if (trigger.empty()) continue;
                to_run.emplace_back(j.spec.name, trigger);
                j.last_run = current;
                j.events = 0;
            }
        }

        std::vector<JobRun> runs;
        for (const auto& [name, trigger] : to_run) {
            JobFn fn;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                Job* j = find(name);
                if (!j) continue;  // Removed since the due check
                j->running = true;
                fn = j->spec.run;
            }

            JobRun run{name, trigger, Status::ok(), current};
            try {
                run.status = fn();
            } catch (const std::exception& e) {
                run.status = Status::io(std::string("job threw: ") + e.what());
            }

            if (run.status) {
                log::debug("Scheduler", "Job ", name, " ran (", trigger, ")");
            } else {
                log::warn("Scheduler", "Job ", name, " failed: ", run.status.to_string());
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                // remove_job waits for running to clear, so the job is still here
                Job* j = find(name);
                j->runs++;
                j->running = false;
            }
            finished_.notify_all();
            runs.push_back(std::move(run));
        }
        return runs;
    }

    // Remove a job, waiting for a run in progress on another thread to end.
    // Must not be called from inside the job itself.
    bool remove_job(const std::string& name) {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_.wait(lock, [&]() {
            const Job* j = find(name);
            return !j || !j->running;
        });
        auto it = std::find_if(jobs_.begin(), jobs_.end(),
                               [&name](const Job& j) { return j.spec.name == name; });
        if (it == jobs_.end()) return false;
        jobs_.erase(it);
        log::debug("Scheduler", "Removed job ", name);
        return true;
    }

    size_t job_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    // Completed runs of a job, 0 if unknown
    uint64_t run_count(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& j : jobs_) {
            if (j.spec.name == name) return j.runs;
        }
        return 0;
    }

    uint64_t pending_events(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& j : jobs_) {
            if (j.spec.name == name) return j.events;
        }
        return 0;
    }

private:
    struct Job {
        JobSpec spec;
        Timestamp last_run;
        uint64_t events;
        uint64_t runs;
        bool running;
    };

    Job* find(const std::string& name) {
        for (auto& j : jobs_) {
            if (j.spec.name == name) return &j;
        }
        return nullptr;
    }

    static std::string trigger_of(const Job& j, Timestamp current) {
        if (j.spec.event_threshold > 0 && j.events >= j.spec.event_threshold) return "events";
        if (j.spec.interval_ms > 0 && current - j.last_run >= j.spec.interval_ms) return "interval";
        return "";
    }

    std::shared_ptr<Clock> clock_;
    mutable std::mutex mutex_;
    std::condition_variable finished_;
    std::vector<Job> jobs_;
};

// Background thread that ticks a Scheduler every poll interval
class MaintenanceDaemon {
public:
    MaintenanceDaemon(Scheduler& scheduler, int64_t poll_interval_ms)
        : scheduler_(scheduler), poll_interval_ms_(poll_interval_ms) {}

    ~MaintenanceDaemon() { stop(); }

    MaintenanceDaemon(const MaintenanceDaemon&) = delete;
    MaintenanceDaemon& operator=(const MaintenanceDaemon&) = delete;

    void start() {
        if (running_.exchange(true)) return;  // Already running
        thread_ = std::thread([this]() { run_loop(); });
        log::info("Scheduler", "Maintenance daemon started (poll ", poll_interval_ms_, "ms)");
    }

    void stop() {
        {
            // Under the wait mutex so the wakeup cannot slip in between the
            // loop's predicate check and its wait
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false)) return;  // Not running
        }
        wake_.notify_all();
        if (thread_.joinable()) thread_.join();
        log::info("Scheduler", "Maintenance daemon stopped after ", ticks_.load(), " ticks");
    }

    bool is_running() const { return running_; }
    uint64_t ticks() const { return ticks_; }

private:
    void run_loop() {
        while (running_) {
            scheduler_.tick();
            ticks_++;

            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_),
                           [this]() { return !running_; });
        }
    }

    Scheduler& scheduler_;
    int64_t poll_interval_ms_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wake_;
};

} // namespace cortex
