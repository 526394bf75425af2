/**
 * \file coroIoContext.cpp
 * \brief Operational implementation for `transport::CoroIoContext`.
 * \details
 * - The ready queue is swapped out under the lock and drained outside it; coroutines posted while
 *   draining run on the next tick, so a task that yields in a loop cannot starve the others.
 * - Pending operations are stolen in one batch, polled, and unfinished ones requeued with their
 *   attempt counter incremented.
 * - Statistics are touched only from the loop thread.
 */
#include "coroIoContext.hpp"

#include <algorithm>
#include <utility>

namespace transport {

CoroIoContext::CoroIoContext() = default;

CoroIoContext::~CoroIoContext() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (logger_ && (!ready_.empty() || !pending_ops_.empty())) {
        logger_->warning("CoroIoContext: destroyed with " + std::to_string(ready_.size()) + " ready and " +
                         std::to_string(pending_ops_.size()) + " pending coroutine(s)");
    }
}

void CoroIoContext::post(std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ready_.push_back(handle);
    }
    wake_();
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete), handle);
}

void CoroIoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        PendingOp op{};
        op.try_complete = std::move(try_complete);
        op.handle = handle;
        op.category = category;
        pending_ops_.push_back(std::move(op));
    }
    wake_();
}

void CoroIoContext::run() {
    run_until([] { return false; });
}

bool CoroIoContext::run_until(const std::function<bool()>& done) {
    const bool was_running = running_;
    running_ = true;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_requested_ = false;
    }

    while (!done()) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (stop_requested_) break;
        }
        const bool progressed = run_once();
        if (done()) break;
        if (progressed) continue;

        if (idle()) {
            if (logger_) logger_->debug("CoroIoContext: no runnable work left");
            break;
        }
        // Timed wait: pending operations are re-polled at least every poll_interval_.
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, poll_interval_, [this] { return stop_requested_ || !ready_.empty(); });
    }

    running_ = was_running;
    return done();
}

void CoroIoContext::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stop_requested_ = true;
    }
    wake_();
}

bool CoroIoContext::run_once() {
    bool progressed = false;

    std::deque<std::coroutine_handle<>> ready;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ready.swap(ready_);
    }
    for (auto handle : ready) {
        resume(handle);
        progressed = true;
    }

    std::vector<PendingOp> fetched;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        fetched.swap(pending_ops_);
    }
    if (fetched.empty()) {
        return progressed;
    }

    std::vector<PendingOp> requeue;
    for (auto& op : fetched) {
        bool completed = false;
        try {
            completed = !op.try_complete || op.try_complete();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("CoroIoContext: error in try_complete: ") + e.what());
            completed = true; // resume so the awaiting coroutine observes its own failure
        }
        if (!completed) {
            if (op.attempts < std::numeric_limits<uint32_t>::max()) ++op.attempts;
            requeue.push_back(std::move(op));
            continue;
        }

        const size_t failures = op.attempts;
        size_t cat_idx = static_cast<size_t>(op.category);
        if (cat_idx >= category_count_) cat_idx = 0;
        completed_by_category_[cat_idx]++;
        min_failures_before_success_ = std::min(min_failures_before_success_, failures);
        max_failures_before_success_ = std::max(max_failures_before_success_, failures);
        sum_failures_before_success_ += failures;
        completed_ops_for_avg_++;

        resume(op.handle);
        progressed = true;
    }

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& op : requeue) {
            pending_ops_.push_back(std::move(op));
        }
    }
    return progressed;
}

bool CoroIoContext::idle() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ready_.empty() && pending_ops_.empty();
}

void CoroIoContext::resume(std::coroutine_handle<> handle) {
    if (!handle || handle.done()) return;
    try {
        handle.resume();
        total_operations_processed_++;
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("CoroIoContext: error resuming coroutine: ") + e.what());
    }
}

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> CoroIoContext::get_logger() const { return logger_; }

size_t CoroIoContext::ready_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return ready_.size();
}

size_t CoroIoContext::pending_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_ops_.size();
}

size_t CoroIoContext::get_total_operations_processed() const { return total_operations_processed_; }

size_t CoroIoContext::get_completed_operations(PendingOpCategory category) const {
    const size_t idx = static_cast<size_t>(category);
    return idx < category_count_ ? completed_by_category_[idx] : 0;
}

CoroIoContext::FailureAttemptStats CoroIoContext::get_failure_attempt_stats() const {
    FailureAttemptStats s{};
    s.samples = completed_ops_for_avg_;
    if (completed_ops_for_avg_ == 0) {
        s.min = 0;
        s.max = 0;
        s.average = 0.0;
    } else {
        s.min = min_failures_before_success_;
        s.max = max_failures_before_success_;
        s.average = static_cast<double>(sum_failures_before_success_) / static_cast<double>(completed_ops_for_avg_);
    }
    return s;
}

std::string CoroIoContext::format_detailed_statistics() const {
    auto cat_name = [](PendingOpCategory c) -> const char* {
        switch (c) {
            case PendingOpCategory::Generic: return "Generic";
            case PendingOpCategory::Timer: return "Timer";
            case PendingOpCategory::Io: return "Io";
            default: return "Unknown";
        }
    };

    std::string out;
    out += "CoroIoContext Statistics\n";
    out += "Total resumptions: " + std::to_string(total_operations_processed_) + "\n";
    for (size_t cat = 0; cat < category_count_; ++cat) {
        if (completed_by_category_[cat] == 0) continue;
        out += std::string("Completed pending [") + cat_name(static_cast<PendingOpCategory>(cat)) + "]: " +
               std::to_string(completed_by_category_[cat]) + "\n";
    }
    const auto stats = get_failure_attempt_stats();
    if (stats.samples > 0) {
        out += "Polls before completion (min/avg/max): " + std::to_string(stats.min) + "/" +
               std::to_string(stats.average) + "/" + std::to_string(stats.max) + "\n";
    } else {
        out += "Polls before completion: (no completed ops)\n";
    }
    return out;
}

void CoroIoContext::log_detailed_statistics() const {
    if (!logger_) return;
    logger_->debug(format_detailed_statistics());
}

void CoroIoContext::reset_statistics() {
    total_operations_processed_ = 0;
    completed_by_category_.fill(0);
    min_failures_before_success_ = std::numeric_limits<size_t>::max();
    max_failures_before_success_ = 0;
    sum_failures_before_success_ = 0;
    completed_ops_for_avg_ = 0;
}

} // namespace transport
