/**
 * \file CoroTask.hpp
 * \brief Awaitable C++20 coroutine task type used by the coro module.
 * \details `Task<T>` owns its coroutine handle and starts lazily: the body runs when the task is
 * awaited by another task, or when it is handed to `CoroIoContext` / `TaskSupervisor` as a root.
 * On completion control transfers symmetrically back to the awaiting coroutine.
 *
 * Exception policy: an exception escaping the body is captured by the promise and rethrown at
 * the `co_await` site (or from `get_result()` for roots), so failures travel up the await chain.
 *
 * Every promise carries the executing `transport::CoroIoContext` and the task's
 * `transport::CancellationState`; an awaited child inherits both from its parent.
 */
// CoroTask.hpp - Awaitable coroutine task type
#pragma once
#include "Cancellation.hpp"

#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <utility>

/**
 * \defgroup coro_module Coroutine Runtime Module
 * \brief Event loop, task types, cancellation and supervision for cooperative single-threaded work.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Lazily started, awaitable coroutine task wrappers.
 */

namespace transport {

class CoroIoContext; // fwd

namespace detail {

/** \brief Promise state shared by `Task<T>` and `Task<void>`. */
struct PromiseBase {
    /// Checks for a cancellation request that arrived before a root task first ran
    struct InitialAwaiter {
        PromiseBase* promise;
        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<>) const noexcept {}
        void await_resume() const {
            if (!promise->continuation_ && promise->cancellation_) {
                promise->cancellation_->throw_if_requested();
            }
        }
    };

    /// Resume whoever awaited us; roots stay suspended until their owner destroys them
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }
        template<typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) const noexcept {
            auto continuation = handle.promise().continuation_;
            if (continuation) return continuation;
            return std::noop_coroutine();
        }
        void await_resume() const noexcept {}
    };

    InitialAwaiter initial_suspend() noexcept { return InitialAwaiter{this}; }
    FinalAwaiter final_suspend() noexcept { return {}; }
    void unhandled_exception() { exception_ = std::current_exception(); }

    /// Attach the loop and cancellation state this task executes under
    void bind(CoroIoContext* context, std::shared_ptr<CancellationState> cancellation) {
        context_ = context;
        cancellation_ = std::move(cancellation);
    }

    CoroIoContext* context() const { return context_; }
    const std::shared_ptr<CancellationState>& cancellation() const { return cancellation_; }

    void rethrow_if_failed() const {
        if (exception_) std::rethrow_exception(exception_);
    }

    CoroIoContext* context_{nullptr};
    std::shared_ptr<CancellationState> cancellation_;
    std::coroutine_handle<> continuation_;
    std::exception_ptr exception_;
};

/** \brief Awaiter starting a child task under the awaiting task's context and cancellation. */
template<typename TaskType>
struct TaskAwaiter {
    typename TaskType::handle_type child;

    bool await_ready() const noexcept { return !child || child.done(); }

    template<typename Promise>
    std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> parent) noexcept {
        auto& parent_promise = parent.promise();
        child.promise().continuation_ = parent;
        child.promise().bind(parent_promise.context(), parent_promise.cancellation());
        return child;
    }

    decltype(auto) await_resume() { return TaskType::take_result(child); }
};

} // namespace detail
} // namespace transport

/** \addtogroup coro_task
 *  @{ */

/** \brief Lazily started awaitable coroutine task producing a `T`.
 *  \see transport::CoroIoContext::run_until_complete \see transport::TaskSupervisor::add_task
 */
template<typename T = void>
struct Task {
    struct promise_type : transport::detail::PromiseBase {
        /// Returns a Task that owns the coroutine handle
        Task<T> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        /// Store the result value for retrieval by the awaiter
        template<typename U>
        void return_value(U&& value) {
            result_.emplace(std::forward<U>(value));
        }

        std::optional<T> result_;
    };
    using handle_type = std::coroutine_handle<promise_type>;

    handle_type h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(handle_type handle) : h(handle) {}
    /// Destroys the coroutine frame if still present
    ~Task() { if (h) h.destroy(); }
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h || h.done(); }
    /// Access the underlying coroutine handle (do not destroy externally)
    handle_type get_handle() const { return h; }

    /// Retrieve the result of a completed task, rethrowing a captured exception
    T get_result() { return take_result(h); }

    static T take_result(handle_type handle) {
        auto& promise = handle.promise();
        promise.rethrow_if_failed();
        return std::move(*promise.result_);
    }

    auto operator co_await() && noexcept { return transport::detail::TaskAwaiter<Task<T>>{h}; }
    auto operator co_await() & noexcept { return transport::detail::TaskAwaiter<Task<T>>{h}; }
};

/** \brief Specialization for `Task<void>` implementing the same lifetime semantics. */
template<>
struct Task<void> {
    struct promise_type : transport::detail::PromiseBase {
        /// Returns a Task<void> that owns the coroutine handle
        Task<void> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        void return_void() {}
    };
    using handle_type = std::coroutine_handle<promise_type>;

    handle_type h;

    explicit Task(handle_type handle) : h(handle) {}
    ~Task() { if (h) h.destroy(); }
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool done() const { return !h || h.done(); }
    handle_type get_handle() const { return h; }

    /// Rethrow the exception captured by a completed task, if any
    void get_result() { take_result(h); }

    static void take_result(handle_type handle) { handle.promise().rethrow_if_failed(); }

    auto operator co_await() && noexcept { return transport::detail::TaskAwaiter<Task<void>>{h}; }
    auto operator co_await() & noexcept { return transport::detail::TaskAwaiter<Task<void>>{h}; }
};

/** @} */
