/**
 * @file AsyncTaskManager.hpp
 * @brief Runs pipeline jobs on background threads and tracks their completion.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace finfacts::application {

/**
 * @enum TaskType
 */
enum class TaskType {
    Extraction
};

/**
 * @struct TaskStatus
 * @brief Shared between the submitter and the worker thread.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;       ///< Written before isCompleted is set.
    std::shared_future<void> done;
};

/**
 * @class AsyncTaskManager
 * @brief One detached thread per task. The destructor drains every task still running.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_running == 0; });
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Starts @p f(status, args...) on a new thread.
     * Exceptions thrown by the job mark the task failed with their message.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;
        auto finished = std::make_shared<std::promise<void>>();
        status->done = finished->get_future().share();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_running;
        }

        std::thread([this, status, finished](auto job, auto... jobArgs) {
            try {
                job(status, std::move(jobArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during task execution.";
            }
            status->isCompleted = true;
            finished->set_value();
            TaskFinished();
        }, std::forward<F>(f), std::forward<Args>(args)...).detach();

        return status;
    }

    /** @brief Blocks until every given task reached a terminal state. */
    static void WaitAll(const std::vector<std::shared_ptr<TaskStatus>>& tasks) {
        for (const auto& task : tasks) {
            if (task && task->done.valid()) task->done.wait();
        }
    }

    int RunningCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

private:
    void TaskFinished() {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_running;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::mutex m_mutex;
    std::condition_variable m_idle;
    int m_running = 0;
};

} // namespace finfacts::application
