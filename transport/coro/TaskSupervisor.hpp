// TaskSupervisor.hpp - Named background tasks grouped by key
#pragma once

#include "CoroTask.hpp"
#include "Cancellation.hpp"
#include "coroIoContext.hpp"
#include "logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace transport {

/**
 * \file transport/coro/TaskSupervisor.hpp
 * \brief Runs named background coroutines and cancels them by key group.
 * \ingroup coro_module
 */

/**
 * \brief Owns background tasks for a scoped lifetime (enter/exit).
 * \ingroup coro_module
 *
 * Responsibilities:
 * - Start root tasks on the shared `CoroIoContext`, each with its own cancellation state.
 * - Cancel tasks by key group (e.g. "SPAMAN", "SPA") or all at once.
 * - Reap finished tasks, logging failures by name; cancellation counts as a clean finish.
 * - On exit, cancel everything and wait until all tasks have finished.
 */
class TaskSupervisor {
public:
    TaskSupervisor(std::shared_ptr<CoroIoContext> context, std::shared_ptr<Logger> logger);
    /// Cancels and drains unfinished tasks by running the loop; must not run inside a task.
    ~TaskSupervisor();

    TaskSupervisor(const TaskSupervisor&) = delete;
    TaskSupervisor& operator=(const TaskSupervisor&) = delete;

    /** \brief Begin the supervised scope. */
    Task<void> async_enter();

    /** \brief Cancel all tasks and wait for them to finish. Must not be awaited by a supervised task. */
    Task<void> async_exit();

    /**
     * \brief Start `task` in the background.
     * \param name Human-readable task name used in logs.
     * \param key Group key used by `cancel_key_tasks()`.
     */
    void add_task(Task<void> task, const std::string& name, const std::string& key);

    /** \brief Request cancellation of every unfinished task in group `key`. */
    void cancel_key_tasks(const std::string& key);

    /** \brief Request cancellation of every unfinished task. */
    void cancel_all_tasks();

    /**
     * \brief Remove finished tasks, reporting how each one ended.
     * \return Number of tasks removed.
     */
    size_t cleanup_completed_tasks();

    /** \brief Number of unfinished tasks. */
    size_t task_count() const;

    /** \brief Number of unfinished tasks in group `key`. */
    size_t task_count(const std::string& key) const;

    /** \brief "key:name" of every unfinished task. */
    std::vector<std::string> task_names() const;

    bool is_entered() const { return entered_; }

    CoroIoContext& context() { return *context_; }

private:
    struct SupervisedTask {
        std::string name;
        std::string key;
        std::shared_ptr<CancellationState> cancellation;
        std::unique_ptr<Task<void>> task;
    };

    void report_completion(SupervisedTask& entry);

    std::shared_ptr<CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;
    std::vector<SupervisedTask> tasks_;
    bool entered_{false};
};

} // namespace transport
