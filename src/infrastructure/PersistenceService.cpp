/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace forker::infrastructure {

namespace fs = std::filesystem;

namespace {

std::string ErrnoText(const std::string& what, int err) {
    return what + ": " + std::strerror(err);
}

void WriteAll(int fd, const std::string& content) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error(ErrnoText("write failed", errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void EnsureParentDirectory(const fs::path& path) {
    if (!path.has_parent_path()) return;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
}

} // namespace

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

void PersistenceService::SyncDirectory(const std::string& directory) {
    int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        throw std::runtime_error(ErrnoText("Cannot open directory " + directory, errno));
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error(ErrnoText("fsync of directory " + directory + " failed", err));
    }
}

void PersistenceService::writeAtomic(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;
    EnsureParentDirectory(finalPath);

    // Temp name unique per write: <file>.<counter>.<pid>.tmp
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(m_tempCounter.fetch_add(1)) + "." + std::to_string(::getpid()) + ".tmp";

    int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0640);
    if (fd < 0) {
        throw std::runtime_error(ErrnoText("Cannot open temp file " + tempPath.string(), errno));
    }

    try {
        WriteAll(fd, content);
        if (::fsync(fd) != 0) {
            throw std::runtime_error(ErrnoText("fsync failed for " + tempPath.string(), errno));
        }
    } catch (const std::runtime_error&) {
        ::close(fd);
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw;
    }

    if (::close(fd) != 0) {
        int err = errno;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error(ErrnoText("close failed for " + tempPath.string(), err));
    }

    if (::rename(tempPath.c_str(), finalPath.c_str()) != 0) {
        int err = errno;
        std::error_code ec;
        fs::remove(tempPath, ec);
        throw std::runtime_error(ErrnoText("rename to " + finalPath.string() + " failed", err));
    }

    SyncDirectory(finalPath.has_parent_path() ? finalPath.parent_path().string() : std::string("."));
}

void PersistenceService::moveDurable(const std::string& from, const std::string& to) {
    fs::path target = to;
    EnsureParentDirectory(target);
    if (::rename(from.c_str(), to.c_str()) != 0) {
        throw std::runtime_error(ErrnoText("rename " + from + " -> " + to + " failed", errno));
    }
    SyncDirectory(target.has_parent_path() ? target.parent_path().string() : std::string("."));
    fs::path source = from;
    if (source.has_parent_path() && source.parent_path() != target.parent_path()) {
        SyncDirectory(source.parent_path().string());
    }
}

void PersistenceService::appendAsync(const std::string& filename, const std::string& content) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running) {
            std::cerr << "[PersistenceService] Append after stop ignored: " << filename << std::endl;
            return;
        }
        m_queue.push(AppendTask{filename, content});
    }
    m_cv.notify_one();
}

void PersistenceService::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this] {
        return m_queue.empty() && !m_busy;
    });
}

void PersistenceService::workerLoop() {
    while (true) {
        AppendTask task;

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return !m_queue.empty() || !m_running;
            });

            if (!m_running && m_queue.empty()) {
                m_idleCv.notify_all();
                return;
            }

            if (m_queue.empty()) {
                continue;
            }

            task = std::move(m_queue.front());
            m_queue.pop();
            m_busy = true;
        }

        // Process outside lock
        performAppend(task);

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
        }
        m_idleCv.notify_all();
    }
}

void PersistenceService::performAppend(const AppendTask& task) {
    fs::path path = task.filename;
    try {
        EnsureParentDirectory(path);
    } catch (const std::exception& e) {
        std::cerr << "[PersistenceService] " << e.what() << std::endl;
        return;
    }

    bool created = !fs::exists(path);
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0640);
    if (fd < 0) {
        std::cerr << "[PersistenceService] " << ErrnoText("Cannot open " + path.string(), errno) << std::endl;
        return;
    }

    try {
        WriteAll(fd, task.content);
        if (::fdatasync(fd) != 0) {
            std::cerr << "[PersistenceService] " << ErrnoText("fdatasync failed for " + path.string(), errno) << std::endl;
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "[PersistenceService] Append failed for " << path << ": " << e.what() << std::endl;
    }
    ::close(fd);

    if (created && path.has_parent_path()) {
        try {
            SyncDirectory(path.parent_path().string());
        } catch (const std::runtime_error& e) {
            std::cerr << "[PersistenceService] " << e.what() << std::endl;
        }
    }
}

} // namespace forker::infrastructure
