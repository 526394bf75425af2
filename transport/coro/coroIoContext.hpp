/**
 * \file coroIoContext.hpp
 * \brief Single-threaded cooperative event loop for coroutine tasks, plus its awaitables.
 * \details Coroutines are resumed from two sources each tick: the ready queue (`post()`, used by
 * `yield()` and by wakers) and the pending-operation list, whose non-blocking `try_complete()`
 * functors are polled until they report readiness (`sleep_for()` and backends waiting on I/O).
 * When a tick resumes nothing the loop waits on a condition variable for at most
 * `poll_interval_`, so other threads may `post()` safely. Completion counts are kept per category.
 */
// CoroIoContext.hpp - Coroutine event loop context.
#pragma once

#include "logger.hpp"
#include "CoroTask.hpp"
#include "Cancellation.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstdint>
#include <deque>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace transport {

/** \defgroup coro_context Event Loop
 *  \ingroup coro_module
 *  \brief Cooperative scheduler for coroutine tasks and polled pending operations.
 */

/** \brief Cooperative event loop that resumes posted coroutines and polls pending operations.
 *  \details All coroutines run on the thread that calls `run()` / `run_until()`, so state touched
 *  only by tasks of one context needs no locking.
 *  \ingroup coro_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	CoroIoContext();
	~CoroIoContext();

	CoroIoContext(const CoroIoContext&) = delete;
	CoroIoContext& operator=(const CoroIoContext&) = delete;

	// --- Types ---
	/** \brief Classification for per-category completion statistics. */
	enum class PendingOpCategory : uint8_t { Generic = 0, Timer, Io, Count };
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Scheduling ---
	/** \brief Queue `handle` for resumption on the next tick. Thread-safe. */
	void post(std::coroutine_handle<> handle);
	/** \brief Register a pending operation; resumes `handle` once `try_complete` returns true. */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);
	/** \brief Register a categorized pending operation for metrics. */
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle);

	/** \brief Bind a root task to this loop and queue its first resumption. */
	template<typename T>
	void spawn(Task<T>& task, std::shared_ptr<CancellationState> cancellation) {
		auto handle = task.get_handle();
		handle.promise().bind(this, std::move(cancellation));
		post(handle);
	}

	// --- Lifecycle ---
	/** \brief Run until `stop()` is called or no work is left. */
	void run();
	/**
	 * \brief Run until `done()` holds.
	 * \return false if the loop was stopped or ran out of work first.
	 */
	bool run_until(const std::function<bool()>& done);
	/**
	 * \brief Drive `task` to completion on the calling thread and return its result.
	 * \details Rethrows the task's exception; throws `std::runtime_error` if the loop stalls
	 * or is stopped before the task finishes. Must not be called from inside a task.
	 */
	template<typename T>
	T run_until_complete(Task<T> task) {
		spawn(task, std::make_shared<CancellationState>());
		if (!run_until([&task] { return task.done(); })) {
			throw std::runtime_error("CoroIoContext: loop stopped before task completed");
		}
		return task.get_result();
	}
	/** \brief Request the running loop to return. Thread-safe. */
	void stop();
	/** \brief True while `run()` / `run_until()` is executing. */
	bool is_running() const { return running_; }

	// --- Logger ---
	void set_logger(std::shared_ptr<Logger> logger);
	std::shared_ptr<Logger> get_logger() const;

	// --- Introspection & statistics ---
	/** \brief Number of coroutines waiting in the ready queue. */
	size_t ready_count() const;
	/** \brief Number of registered pending operations. */
	size_t pending_count() const;
	/** \brief Total coroutine resumptions performed (ready queue and pending operations). */
	size_t get_total_operations_processed() const;
	/** \brief Completed pending operations of one category. */
	size_t get_completed_operations(PendingOpCategory category) const;
	/** \brief Failure attempt aggregate statistics for pending operations. */
	struct FailureAttemptStats { size_t min; size_t max; double average; unsigned long long samples; };
	FailureAttemptStats get_failure_attempt_stats() const;
	/** \brief Human-readable multi-line summary of the statistics. */
	std::string format_detailed_statistics() const;
	/** \brief Log the statistics summary via logger (if set). */
	void log_detailed_statistics() const;
	void reset_statistics();

private:
	/** \brief One scheduling pass; returns true if any coroutine was resumed. */
	bool run_once();
	/** \brief True when nothing is queued, pending, or able to arrive. */
	bool idle() const;
	void resume(std::coroutine_handle<> handle);
	void wake_() { cv_.notify_one(); }

	/** \brief Internal representation of a pending operation awaiting readiness. */
	struct PendingOp {
		std::function<bool()> try_complete;      ///< Readiness predicate
		std::coroutine_handle<> handle;          ///< Coroutine to resume on success
		uint32_t attempts{0};                    ///< Failed polls before success
		PendingOpCategory category{PendingOpCategory::Generic};
	};

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<std::coroutine_handle<>> ready_;
	std::vector<PendingOp> pending_ops_;
	bool running_{false};
	bool stop_requested_{false};
	std::shared_ptr<Logger> logger_;
	/** \brief Maximum sleep before re-polling pending operations without a notification. */
	std::chrono::milliseconds poll_interval_{std::chrono::milliseconds(1)};

	// Statistics (loop thread only)
	size_t total_operations_processed_{0};
	std::array<size_t, category_count_> completed_by_category_{};
	size_t min_failures_before_success_{std::numeric_limits<size_t>::max()};
	size_t max_failures_before_success_{0};
	unsigned long long sum_failures_before_success_{0};
	unsigned long long completed_ops_for_avg_{0};
};

/** \brief Awaitable giving the scheduler a turn without delay (zero-duration sleep).
 *  \ingroup coro_context
 */
struct YieldAwaitable {
	std::shared_ptr<CancellationState> cancellation;

	bool await_ready() const noexcept { return false; }
	template<typename Promise>
	void await_suspend(std::coroutine_handle<Promise> handle) {
		auto& promise = handle.promise();
		if (!promise.context()) {
			throw std::logic_error("yield: task is not bound to a CoroIoContext");
		}
		cancellation = promise.cancellation();
		promise.context()->post(handle);
	}
	void await_resume() {
		if (cancellation) cancellation->throw_if_requested();
	}
};

/** \brief Awaitable resuming after `duration`, or earlier with `OperationCancelled`.
 *  \ingroup coro_context
 */
struct SleepAwaitable {
	std::chrono::steady_clock::duration duration;
	std::shared_ptr<CancellationState> cancellation;

	bool await_ready() const noexcept { return false; }
	template<typename Promise>
	void await_suspend(std::coroutine_handle<Promise> handle) {
		auto& promise = handle.promise();
		if (!promise.context()) {
			throw std::logic_error("sleep_for: task is not bound to a CoroIoContext");
		}
		cancellation = promise.cancellation();
		const auto deadline = std::chrono::steady_clock::now() + duration;
		promise.context()->register_pending(CoroIoContext::PendingOpCategory::Timer,
			[deadline, c = cancellation]() {
				return (c && c->requested()) || std::chrono::steady_clock::now() >= deadline;
			}, handle);
	}
	void await_resume() {
		if (cancellation) cancellation->throw_if_requested();
	}
};

/** \brief `co_await transport::yield();` */
inline YieldAwaitable yield() { return YieldAwaitable{}; }

/** \brief `co_await transport::sleep_for(std::chrono::milliseconds(50));` */
template<typename Rep, typename Period>
SleepAwaitable sleep_for(std::chrono::duration<Rep, Period> duration) {
	return SleepAwaitable{std::chrono::duration_cast<std::chrono::steady_clock::duration>(duration), nullptr};
}

} // namespace transport
