/**
 * @file JobTokenTable.hpp
 * @brief Exclusive per-job execution tokens.
 */

#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace forker::application {

/**
 * @class JobTokenTable
 * @brief Guarantees that at most one step of a given job runs at any instant.
 *
 * Acquisition never blocks: a caller that finds the token taken skips the
 * job instead of queueing behind it.
 */
class JobTokenTable {
public:
    /**
     * @class JobToken
     * @brief Holds a job's token and gives it back on destruction.
     */
    class JobToken {
    public:
        JobToken(JobToken&& other) noexcept : m_table(other.m_table), m_jobId(std::move(other.m_jobId)) {
            other.m_table = nullptr;
        }
        JobToken(const JobToken&) = delete;
        JobToken& operator=(const JobToken&) = delete;
        JobToken& operator=(JobToken&&) = delete;

        ~JobToken() {
            if (m_table) m_table->release(m_jobId);
        }

        const std::string& jobId() const { return m_jobId; }

    private:
        friend class JobTokenTable;
        JobToken(JobTokenTable* table, std::string jobId) : m_table(table), m_jobId(std::move(jobId)) {}

        JobTokenTable* m_table;
        std::string m_jobId;
    };

    /** @brief Takes the token if it is free. */
    std::optional<JobToken> tryAcquire(const std::string& jobId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_held.insert(jobId).second) {
            return std::nullopt;
        }
        return JobToken(this, jobId);
    }

    bool isHeld(const std::string& jobId) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_held.count(jobId) > 0;
    }

    size_t heldCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_held.size();
    }

private:
    void release(const std::string& jobId) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held.erase(jobId);
    }

    mutable std::mutex m_mutex;
    std::set<std::string> m_held;
};

} // namespace forker::application
