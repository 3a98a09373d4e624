/**
 * @file JsonStateStore.hpp
 * @brief File system implementation of the job state store, one JSON document per job.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "domain/repositories/IStateStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace forker::infrastructure {

/**
 * @class JsonStateStore
 * @brief Keeps <stateRoot>/jobs/<jobId>.json, replaced atomically on every write.
 *
 * Documents that cannot be parsed are moved to <stateRoot>/quarantine/ and
 * reported; they are never repaired or deleted. In their place a quarantined
 * record is written, carrying whatever identity could still be read, so the
 * job stays visible until an operator reconciles it. Retired jobs move to
 * <stateRoot>/archive/.
 */
class JsonStateStore : public domain::IStateStore {
public:
    static constexpr int kSchemaVersion = 1;

    JsonStateStore(std::string stateRoot, std::shared_ptr<PersistenceService> persistence);

    void put(const domain::FileJob& job) override;
    void put(const std::string& jobId, const domain::Target& target) override;
    std::optional<domain::FileJob> get(const std::string& jobId) override;
    std::vector<domain::FileJob> listIncomplete() override;
    std::vector<domain::FileJob> listAll() override;
    void archive(const std::string& jobId) override;

    /** @brief Number of documents moved to quarantine since construction. */
    size_t quarantinedDocumentCount() const;

    /** @brief Per-job locks currently allocated. Entries are dropped once no caller holds them. */
    size_t lockTableSize() const;

private:
    class JobLock;

    std::string m_stateRoot;
    std::shared_ptr<PersistenceService> m_persistence;

    mutable std::mutex m_locksMutex;
    std::map<std::string, std::shared_ptr<std::mutex>> m_jobLocks;
    size_t m_quarantinedDocuments = 0;

    std::string getJobFilePath(const std::string& jobId) const;
    std::optional<std::string> readDocument(const std::string& path) const;
    void writeDocument(const std::string& jobId, const std::string& content);
    std::optional<domain::FileJob> loadLocked(const std::string& jobId);
    void quarantineDocument(const std::string& jobId, const std::string& reason);
    domain::FileJob writeTombstone(const std::string& jobId, const std::string& content, const std::string& reason);
};

} // namespace forker::infrastructure
