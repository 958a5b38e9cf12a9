/**
 * @file PersistenceService.hpp
 * @brief Centralized service for atomic file I/O, synchronous or queued.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace finfacts::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Every write goes through temp file + rename, so readers never see a partial file.
 *
 * Synchronous writes are used for transactional data (report versions, resolved facts);
 * the background queue takes artifacts nobody waits on (run reports).
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Writes the content atomically before returning.
     * @throws std::runtime_error if the file could not be written or renamed.
     */
    void saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every queued write has been performed. */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename). Returns an error text or "".
     */
    std::string performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_drained;
    int m_inFlight = 0;
    std::atomic<unsigned long long> m_tempCounter{0};

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace finfacts::infrastructure
