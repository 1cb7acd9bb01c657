#include "worker/worker_pool.hpp"

#include "util/ids.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <unistd.h>

std::string_view to_string(WorkerPool::State state) {
    switch (state) {
        case WorkerPool::State::Stopped:  return "stopped";
        case WorkerPool::State::Running:  return "running";
        case WorkerPool::State::Draining: return "draining";
    }
    return "unknown";
}

WorkerPool::WorkerPool(const Config& config, JobDb& db, JobRunner& runner, Sleeper& sleeper,
                       bool verbose, ClockFn clock)
    : db_(db), runner_(runner), sleeper_(sleeper), verbose_(verbose), clock_(std::move(clock)),
      count_(std::max<uint32_t>(config.workers.count, 1)),
      lease_ms_(static_cast<int64_t>(config.workers.lease_seconds) * 1000),
      poll_interval_(config.workers.poll_interval_ms),
      workers_cfg_(config.workers),
      owner_prefix_(std::format("{}-{}", ::getpid(), ids::generate().substr(0, 8))) {}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::start() {
    if (state_ != State::Stopped) return false;

    draining_ = false;
    sleeper_.reset();
    state_ = State::Running;
    for (size_t i = 0; i < count_; ++i) {
        threads_.emplace_back([this, i](std::stop_token st) { worker_loop(st, i); });
    }
    log(std::format("{} worker(s) started", count_));
    return true;
}

void WorkerPool::notify() {
    {
        std::lock_guard lock(wake_mutex_);
        ++wake_generation_;
    }
    wake_cv_.notify_all();
}

void WorkerPool::drain() {
    if (state_ == State::Stopped) return;
    state_ = State::Draining;
    draining_ = true;
    notify();
    join_all();
    state_ = State::Stopped;
    log("workers drained");
}

void WorkerPool::stop() {
    if (state_ == State::Stopped) return;
    state_ = State::Draining;
    draining_ = true;
    for (auto& t : threads_) t.request_stop();
    sleeper_.interrupt();
    notify();
    join_all();
    state_ = State::Stopped;
    log("workers stopped");
}

void WorkerPool::join_all() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker_loop(std::stop_token stop, size_t index) {
    const std::string owner = std::format("{}-w{}", owner_prefix_, index);

    while (!stop.stop_requested() && !draining_) {
        uint64_t seen;
        {
            std::lock_guard lock(wake_mutex_);
            seen = wake_generation_;
        }

        if (run_once(owner, stop)) continue;

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, poll_interval_,
                          [this, seen] { return wake_generation_ != seen || draining_; });
    }
}

bool WorkerPool::run_once(const std::string& owner, std::stop_token stop) {
    auto job = db_.claim_next(owner, clock_(), lease_ms_);
    if (!job) return false;

    ++busy_;
    process(std::move(*job), owner, stop);
    --busy_;
    return true;
}

void WorkerPool::process(TranscriptionJob job, const std::string& owner, std::stop_token stop) {
    const int64_t claimed_at = clock_();
    const int64_t deadline =
        claimed_at + static_cast<int64_t>(workers_cfg_.job_timeout_seconds(job.total_size)) * 1000;
    int64_t renewed_at = claimed_at;

    log(std::format("{} claimed job {} at {}", owner, job.id, to_string(job.stage)));

    auto persist = [&](TranscriptionJob& j) {
        int64_t now = clock_();
        if (j.status == JobStatus::Running) {
            j.owner = owner;
            j.lease_expires_at = now + lease_ms_;
            renewed_at = now;
        } else {
            j.owner.clear();
            j.lease_expires_at = 0;
        }
        return db_.save_job(j, owner);
    };

    bool lease_lost = false;
    auto interrupted = [&]() -> Interrupt {
        if (db_.is_cancel_requested(job.id)) return Interrupt::Cancelled;
        if (stop.stop_requested()) return Interrupt::Shutdown;

        int64_t now = clock_();
        if (now >= deadline) return Interrupt::TimedOut;
        if (now - renewed_at > lease_ms_ / 2) {
            if (!db_.renew_lease(job.id, owner, now + lease_ms_)) {
                lease_lost = true;
                return Interrupt::Shutdown;
            }
            renewed_at = now;
        }
        return Interrupt::None;
    };

    auto outcome = runner_.run(job, persist, interrupted);
    switch (outcome) {
        case JobRunner::Outcome::Completed:
            log(std::format("job {} complete", job.id));
            break;
        case JobRunner::Outcome::Failed:
            log(std::format("job {} failed: {}", job.id, job.error));
            break;
        case JobRunner::Outcome::Retrying:
            log(std::format("job {} queued for retry {}/{}", job.id, job.retry_count, job.max_retries));
            notify();
            break;
        case JobRunner::Outcome::Requeued:
            log(std::format("job {} returned to the queue", job.id));
            break;
        case JobRunner::Outcome::LeaseLost:
            std::println(stderr, "worker: lost lease on job {}{}", job.id,
                         lease_lost ? " (lease expired)" : "");
            break;
    }
}

void WorkerPool::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
