/**
 * @file PersistenceService.hpp
 * @brief Serialized background writer for whole-document state files.
 */

#pragma once
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <cstddef>

namespace assetbridge::infrastructure {

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
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * Documents are always written whole, so a queued write that has not started
 * yet is replaced by a newer write to the same file.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Absolute path to the file.
     * @param content The string content to write.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Blocks until every write queued so far has reached the disk.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Number of writes that failed and left the previous file in place. */
    std::size_t failedWrites() const { return m_failedWrites; }

private:
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    std::deque<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_writing = false;
    bool m_exited = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<std::size_t> m_failedWrites{0};
};

} // namespace assetbridge::infrastructure
