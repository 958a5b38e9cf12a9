/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

namespace finfacts::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() : m_running(true) {
    m_worker = std::thread(&PersistenceService::workerLoop, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) return;
        m_running = false;
    }
    m_cv.notify_all();

    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PersistenceService::saveText(const std::string& filename, const std::string& content) {
    const std::string error = performAtomicWrite(SaveTask{filename, content});
    if (!error.empty()) {
        throw std::runtime_error(error);
    }
}

void PersistenceService::saveTextAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            // Worker is gone; write inline so nothing is lost on shutdown.
            std::cerr << "[PersistenceService] Queue stopped, writing inline: " << filename << std::endl;
        } else {
            m_queue.push(SaveTask{filename, content});
            m_cv.notify_one();
            return;
        }
    }
    const std::string error = performAtomicWrite(SaveTask{filename, content});
    if (!error.empty()) {
        std::cerr << "[PersistenceService] " << error << std::endl;
    }
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_drained.wait(lock, [this] { return m_queue.empty() && m_inFlight == 0; });
}

void PersistenceService::workerLoop() {
    while (true) {
        SaveTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_drained.notify_all();
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            ++m_inFlight;
        }

        const std::string error = performAtomicWrite(task);
        if (!error.empty()) {
            std::cerr << "[PersistenceService] " << error << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
        }
        m_drained.notify_all();
    }
}

std::string PersistenceService::performAtomicWrite(const SaveTask& task) {
    const fs::path target = task.filename;
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) return "Cannot create directory for " + target.string() + ": " + ec.message();
    }

    // The CLI and the review server may write into the same store; the pid keeps temp names apart.
    fs::path temp = target;
    temp += ".tmp." + std::to_string(::getpid()) + "." + std::to_string(m_tempCounter++);

    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) return "Cannot open temp file " + temp.string();
    out.write(task.content.data(), static_cast<std::streamsize>(task.content.size()));
    out.close();
    if (out.fail()) {
        fs::remove(temp, ec);
        return "Short write to " + temp.string();
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return "Cannot replace " + target.string() + ": " + ec.message();
    }
    return "";
}

} // namespace finfacts::infrastructure
