#pragma once

#include "config.hpp"
#include "pipeline/job_runner.hpp"
#include "storage/job_db.hpp"
#include "util/clock.hpp"
#include "util/sleeper.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

// Fixed-size pool of threads, each claiming the oldest runnable job and
// running it to a natural stopping point before claiming the next.
class WorkerPool {
public:
    enum class State { Stopped, Running, Draining };

    WorkerPool(const Config& config, JobDb& db, JobRunner& runner, Sleeper& sleeper,
               bool verbose = false, ClockFn clock = now_ms);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    bool start();

    // Wakes idle workers, e.g. after a job was queued.
    void notify();

    // Claims nothing new and waits for in-flight jobs to finish.
    void drain();

    // Claims nothing new; in-flight jobs stop at their next segment or stage
    // boundary and return to the queue.
    void stop();

    State state() const { return state_.load(); }
    size_t size() const { return count_; }
    size_t busy() const { return busy_.load(); }

    // Claims and runs a single job on the calling thread. False when the queue is empty.
    bool run_once(const std::string& owner, std::stop_token stop = {});

private:
    void worker_loop(std::stop_token stop, size_t index);
    void process(TranscriptionJob job, const std::string& owner, std::stop_token stop);
    void join_all();
    void log(const std::string& msg);

    JobDb& db_;
    JobRunner& runner_;
    Sleeper& sleeper_;
    bool verbose_;
    ClockFn clock_;

    size_t count_;
    int64_t lease_ms_;
    std::chrono::milliseconds poll_interval_;
    Config::Workers workers_cfg_;
    std::string owner_prefix_;

    std::atomic<State> state_{State::Stopped};
    std::atomic<size_t> busy_{0};
    std::atomic<bool> draining_{false};

    std::mutex wake_mutex_;
    std::condition_variable_any wake_cv_;
    uint64_t wake_generation_ = 0;

    std::vector<std::jthread> threads_;
};

std::string_view to_string(WorkerPool::State state);
