// TaskSupervisor.cpp - Background task ownership and key-group cancellation
#include "TaskSupervisor.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

/**
 * \file transport/coro/TaskSupervisor.cpp
 * \brief Implements background task start, cancellation and reaping.
 * \ingroup coro_module
 */

namespace transport {

TaskSupervisor::TaskSupervisor(std::shared_ptr<CoroIoContext> context, std::shared_ptr<Logger> logger)
    : context_(std::move(context))
    , logger_(std::move(logger)) {
    if (!context_ || !logger_) {
        throw std::invalid_argument("TaskSupervisor: context and logger cannot be null");
    }
}

TaskSupervisor::~TaskSupervisor() {
    if (task_count() > 0) {
        logger_->warning("TaskSupervisor: destroyed with " + std::to_string(task_count()) +
                         " running task(s); cancelling");
        cancel_all_tasks();
        context_->run_until([this] { return task_count() == 0; });
    }
    cleanup_completed_tasks();
}

Task<void> TaskSupervisor::async_enter() {
    entered_ = true;
    logger_->debug("TaskSupervisor: entered");
    co_return;
}

Task<void> TaskSupervisor::async_exit() {
    cancel_all_tasks();
    while (task_count() > 0) {
        co_await transport::yield();
    }
    cleanup_completed_tasks();
    entered_ = false;
    logger_->debug("TaskSupervisor: exited");
}

void TaskSupervisor::add_task(Task<void> task, const std::string& name, const std::string& key) {
    cleanup_completed_tasks();

    SupervisedTask entry;
    entry.name = name;
    entry.key = key;
    entry.cancellation = std::make_shared<CancellationState>();
    entry.task = std::make_unique<Task<void>>(std::move(task));

    context_->spawn(*entry.task, entry.cancellation);
    logger_->debug("TaskSupervisor: started task " + key + ":" + name);
    tasks_.push_back(std::move(entry));
}

void TaskSupervisor::cancel_key_tasks(const std::string& key) {
    size_t count = 0;
    for (auto& entry : tasks_) {
        if (entry.key == key && !entry.task->done()) {
            entry.cancellation->request();
            count++;
        }
    }
    if (count > 0) {
        logger_->debug("TaskSupervisor: requested cancellation of " + std::to_string(count) +
                       " task(s) with key " + key);
    }
}

void TaskSupervisor::cancel_all_tasks() {
    for (auto& entry : tasks_) {
        if (!entry.task->done()) {
            entry.cancellation->request();
        }
    }
}

size_t TaskSupervisor::cleanup_completed_tasks() {
    size_t cleaned_up = 0;
    auto it = tasks_.begin();
    while (it != tasks_.end()) {
        if (it->task->done()) {
            report_completion(*it);
            it = tasks_.erase(it);
            cleaned_up++;
        } else {
            ++it;
        }
    }
    return cleaned_up;
}

size_t TaskSupervisor::task_count() const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const SupervisedTask& entry) { return !entry.task->done(); }));
}

size_t TaskSupervisor::task_count(const std::string& key) const {
    return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [&key](const SupervisedTask& entry) { return entry.key == key && !entry.task->done(); }));
}

std::vector<std::string> TaskSupervisor::task_names() const {
    std::vector<std::string> names;
    for (const auto& entry : tasks_) {
        if (!entry.task->done()) {
            names.push_back(entry.key + ":" + entry.name);
        }
    }
    return names;
}

void TaskSupervisor::report_completion(SupervisedTask& entry) {
    const std::string label = entry.key + ":" + entry.name;
    try {
        entry.task->get_result();
        logger_->debug("TaskSupervisor: task " + label + " finished");
    } catch (const OperationCancelled&) {
        logger_->debug("TaskSupervisor: task " + label + " cancelled");
    } catch (const std::exception& e) {
        logger_->error("TaskSupervisor: task " + label + " failed: " + e.what());
    }
}

} // namespace transport
