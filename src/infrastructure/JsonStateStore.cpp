/**
 * @file JsonStateStore.cpp
 * @brief Implementation of JsonStateStore.
 */

#include "infrastructure/JsonStateStore.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace forker::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using namespace forker::domain;

namespace {

long long ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

json DigestToJson(const std::optional<Digest>& d) {
    if (!d) return nullptr;
    json j = {
        {"algorithm", d->algorithm},
        {"hex", d->hex()}
    };
    if (d->quickCheckCrc32) j["crc32"] = *d->quickCheckCrc32;
    return j;
}

std::optional<Digest> DigestFromJson(const json& j) {
    if (j.is_null()) return std::nullopt;
    Digest d = Digest::FromHex(j.at("algorithm").get<std::string>(), j.at("hex").get<std::string>());
    if (j.contains("crc32")) d.quickCheckCrc32 = j["crc32"].get<std::uint32_t>();
    return d;
}

// Manual JSON mapping, field by field.
json TargetToJson(const Target& t) {
    const TargetRecord& r = t.getRecord();
    json j = {
        {"destination_root", r.destinationRoot},
        {"state", TargetStateToString(r.state)},
        {"staged_path", r.stagedPath},
        {"final_path", r.finalPath},
        {"digest", DigestToJson(r.digest)},
        {"attempts", r.attempts},
        {"last_error", r.lastError},
        {"last_transition_at", ToMillis(r.lastTransitionAt)}
    };
    j["next_attempt_at"] = r.nextAttemptAt ? json(ToMillis(*r.nextAttemptAt)) : json(nullptr);
    return j;
}

TargetRecord TargetFromJson(TargetRole role, const json& j) {
    TargetRecord r;
    r.role = role;
    r.destinationRoot = j.at("destination_root").get<std::string>();

    std::string stateStr = j.at("state").get<std::string>();
    auto state = TargetStateFromString(stateStr);
    if (!state) {
        throw CorruptStateError("Unknown target state '" + stateStr + "'");
    }
    r.state = *state;
    r.stagedPath = j.value("staged_path", "");
    r.finalPath = j.value("final_path", "");
    r.digest = DigestFromJson(j.value("digest", json(nullptr)));
    r.attempts = j.value("attempts", 0);
    r.lastError = j.value("last_error", "");
    r.lastTransitionAt = FromMillis(j.value("last_transition_at", 0LL));
    if (j.contains("next_attempt_at") && !j["next_attempt_at"].is_null()) {
        r.nextAttemptAt = FromMillis(j["next_attempt_at"].get<long long>());
    }
    return r;
}

json JobToJson(const FileJob& job) {
    const FileJobRecord& r = job.getRecord();
    json jobJson = {
        {"id", r.id},
        {"source_path", r.sourcePath},
        {"source_size", r.sourceSize},
        {"source_mtime_ns", r.sourceModifiedAtNs},
        {"source_digest", DigestToJson(r.sourceDigest)},
        {"discovered_at", ToMillis(r.discoveredAt)},
        {"cleanup_completed", r.cleanupCompleted},
        {"failure_surfaced", r.failureSurfaced},
        {"quarantined", r.quarantined},
        {"quarantine_reason", r.quarantineReason}
    };
    jobJson["cleanup_completed_at"] = r.cleanupCompletedAt ? json(ToMillis(*r.cleanupCompletedAt)) : json(nullptr);

    return {
        {"schema_version", JsonStateStore::kSchemaVersion},
        {"job", jobJson},
        {"derived_state", JobStateToString(job.getState())},
        {"targets", {
            {TargetRoleToString(TargetRole::Primary), TargetToJson(job.getTarget(TargetRole::Primary))},
            {TargetRoleToString(TargetRole::Research), TargetToJson(job.getTarget(TargetRole::Research))}
        }}
    };
}

FileJob JobFromJson(const json& doc) {
    int version = doc.value("schema_version", 0);
    if (version != JsonStateStore::kSchemaVersion) {
        throw CorruptStateError("Unsupported schema version " + std::to_string(version));
    }

    const json& j = doc.at("job");
    FileJobRecord r;
    r.id = j.at("id").get<std::string>();
    r.sourcePath = j.at("source_path").get<std::string>();
    r.sourceSize = j.value("source_size", std::uintmax_t{0});
    r.sourceModifiedAtNs = j.value("source_mtime_ns", std::int64_t{0});
    r.sourceDigest = DigestFromJson(j.value("source_digest", json(nullptr)));
    r.discoveredAt = FromMillis(j.at("discovered_at").get<long long>());
    r.cleanupCompleted = j.value("cleanup_completed", false);
    if (j.contains("cleanup_completed_at") && !j["cleanup_completed_at"].is_null()) {
        r.cleanupCompletedAt = FromMillis(j["cleanup_completed_at"].get<long long>());
    }
    r.failureSurfaced = j.value("failure_surfaced", false);
    r.quarantined = j.value("quarantined", false);
    r.quarantineReason = j.value("quarantine_reason", "");

    // derived_state is informational only; the state is recomputed from the targets.
    const json& targets = doc.at("targets");
    return FileJob::Rehydrate(std::move(r),
                              TargetFromJson(TargetRole::Primary, targets.at(TargetRoleToString(TargetRole::Primary))),
                              TargetFromJson(TargetRole::Research, targets.at(TargetRoleToString(TargetRole::Research))));
}

} // namespace

JsonStateStore::JsonStateStore(std::string stateRoot, std::shared_ptr<PersistenceService> persistence)
    : m_stateRoot(std::move(stateRoot)), m_persistence(std::move(persistence)) {
    std::error_code ec;
    fs::create_directories(fs::path(m_stateRoot) / "jobs", ec);
    if (ec) {
        throw StateStoreError("Cannot create state directory " + m_stateRoot + ": " + ec.message());
    }
}

/// Holds one job's mutex and drops the table entry when the last holder leaves.
class JsonStateStore::JobLock {
public:
    JobLock(JsonStateStore& store, const std::string& jobId) : m_store(store), m_jobId(jobId) {
        {
            std::lock_guard<std::mutex> lock(m_store.m_locksMutex);
            auto& entry = m_store.m_jobLocks[jobId];
            if (!entry) entry = std::make_shared<std::mutex>();
            m_mutex = entry;
        }
        m_mutex->lock();
    }

    ~JobLock() {
        m_mutex->unlock();
        std::lock_guard<std::mutex> lock(m_store.m_locksMutex);
        auto it = m_store.m_jobLocks.find(m_jobId);
        // One reference in the table, one here: nobody else is waiting.
        if (it != m_store.m_jobLocks.end() && it->second == m_mutex && m_mutex.use_count() == 2) {
            m_store.m_jobLocks.erase(it);
        }
    }

    JobLock(const JobLock&) = delete;
    JobLock& operator=(const JobLock&) = delete;

private:
    JsonStateStore& m_store;
    std::string m_jobId;
    std::shared_ptr<std::mutex> m_mutex;
};

std::string JsonStateStore::getJobFilePath(const std::string& jobId) const {
    return (fs::path(m_stateRoot) / "jobs" / (jobId + ".json")).string();
}

std::optional<std::string> JsonStateStore::readDocument(const std::string& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw StateStoreError("Cannot stat " + path + ": " + ec.message());
        return std::nullopt;
    }
    std::ifstream inFile(path, std::ios::binary);
    if (!inFile) {
        throw StateStoreError("Cannot open state record " + path);
    }
    std::stringstream buffer;
    buffer << inFile.rdbuf();
    if (inFile.bad()) {
        throw StateStoreError("Read failed for state record " + path);
    }
    return buffer.str();
}

void JsonStateStore::writeDocument(const std::string& jobId, const std::string& content) {
    try {
        m_persistence->writeAtomic(getJobFilePath(jobId), content);
    } catch (const std::runtime_error& e) {
        throw StateStoreError("Durable write of job " + jobId + " failed: " + e.what());
    }
}

void JsonStateStore::put(const FileJob& job) {
    JobLock lock(*this, job.getId());
    writeDocument(job.getId(), JobToJson(job).dump(2));
}

void JsonStateStore::put(const std::string& jobId, const Target& target) {
    JobLock lock(*this, jobId);

    auto current = loadLocked(jobId);
    if (!current) {
        throw StateStoreError("Cannot update target of unknown job " + jobId);
    }

    FileJobRecord jobRecord = current->getRecord();
    TargetRecord primary = current->getTarget(TargetRole::Primary).getRecord();
    TargetRecord research = current->getTarget(TargetRole::Research).getRecord();
    if (target.getRole() == TargetRole::Primary) {
        primary = target.getRecord();
    } else {
        research = target.getRecord();
    }

    FileJob updated = FileJob::Rehydrate(std::move(jobRecord), std::move(primary), std::move(research));
    writeDocument(jobId, JobToJson(updated).dump(2));
}

std::optional<FileJob> JsonStateStore::get(const std::string& jobId) {
    JobLock lock(*this, jobId);
    return loadLocked(jobId);
}

std::optional<FileJob> JsonStateStore::loadLocked(const std::string& jobId) {
    auto content = readDocument(getJobFilePath(jobId));
    if (!content) return std::nullopt;

    try {
        json doc = json::parse(*content);
        FileJob job = JobFromJson(doc);
        if (job.getId() != jobId) {
            throw CorruptStateError("Record id " + job.getId() + " does not match its file name");
        }
        return job;
    } catch (const json::exception& e) {
        quarantineDocument(jobId, e.what());
        return writeTombstone(jobId, *content, e.what());
    } catch (const CorruptStateError& e) {
        quarantineDocument(jobId, e.what());
        return writeTombstone(jobId, *content, e.what());
    } catch (const std::invalid_argument& e) {
        quarantineDocument(jobId, e.what());
        return writeTombstone(jobId, *content, e.what());
    }
}

FileJob JsonStateStore::writeTombstone(const std::string& jobId, const std::string& content, const std::string& reason) {
    // Salvage only fields of the expected type; anything else stays empty.
    json doc = json::parse(content, nullptr, false);
    const json empty = json::object();
    const json& j = (doc.is_object() && doc.contains("job") && doc["job"].is_object()) ? doc["job"] : empty;
    const json& targets = (doc.is_object() && doc.contains("targets") && doc["targets"].is_object()) ? doc["targets"] : empty;

    FileJobRecord r;
    r.id = jobId;
    if (j.contains("source_path") && j["source_path"].is_string()) {
        r.sourcePath = j["source_path"].get<std::string>();
    }
    if (j.contains("source_size") && j["source_size"].is_number_unsigned()) {
        r.sourceSize = j["source_size"].get<std::uintmax_t>();
    }
    if (j.contains("source_mtime_ns") && j["source_mtime_ns"].is_number_integer()) {
        r.sourceModifiedAtNs = j["source_mtime_ns"].get<std::int64_t>();
    }
    r.discoveredAt = std::chrono::system_clock::now();
    if (j.contains("discovered_at") && j["discovered_at"].is_number_integer()) {
        r.discoveredAt = FromMillis(j["discovered_at"].get<long long>());
    }
    r.quarantined = true;
    r.quarantineReason = "unreadable record: " + reason;

    auto rootOf = [&targets](TargetRole role) {
        TargetRecord t;
        t.role = role;
        std::string name = TargetRoleToString(role);
        if (targets.contains(name) && targets[name].is_object()) {
            const json& tj = targets[name];
            if (tj.contains("destination_root") && tj["destination_root"].is_string()) {
                t.destinationRoot = tj["destination_root"].get<std::string>();
            }
        }
        t.lastTransitionAt = std::chrono::system_clock::now();
        return t;
    };

    FileJob tombstone = FileJob::Rehydrate(std::move(r), rootOf(TargetRole::Primary), rootOf(TargetRole::Research));
    writeDocument(jobId, JobToJson(tombstone).dump(2));
    return tombstone;
}

void JsonStateStore::quarantineDocument(const std::string& jobId, const std::string& reason) {
    auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path target = fs::path(m_stateRoot) / "quarantine" / (jobId + ".json." + std::to_string(stamp));

    try {
        m_persistence->moveDurable(getJobFilePath(jobId), target.string());
    } catch (const std::runtime_error& e) {
        throw StateStoreError("Cannot quarantine unreadable record " + jobId + ": " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(m_locksMutex);
        ++m_quarantinedDocuments;
    }
    std::cerr << "[JsonStateStore] Quarantined unreadable record " << jobId
              << " (" << reason << "). Manual reconciliation required." << std::endl;
}

std::vector<FileJob> JsonStateStore::listAll() {
    std::vector<FileJob> jobs;
    fs::path dir = fs::path(m_stateRoot) / "jobs";

    std::vector<std::string> ids;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw StateStoreError("Cannot list " + dir.string() + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension() != ".json") continue; // skips in-flight *.tmp files
        ids.push_back(entry.path().stem().string());
    }
    std::sort(ids.begin(), ids.end());

    for (const auto& id : ids) {
        auto job = get(id);
        if (job) {
            jobs.push_back(std::move(*job));
        }
    }
    return jobs;
}

std::vector<FileJob> JsonStateStore::listIncomplete() {
    std::vector<FileJob> all = listAll();
    std::vector<FileJob> incomplete;
    for (auto& job : all) {
        if (job.needsWork()) {
            incomplete.push_back(std::move(job));
        }
    }
    return incomplete;
}

void JsonStateStore::archive(const std::string& jobId) {
    JobLock lock(*this, jobId);
    fs::path target = fs::path(m_stateRoot) / "archive" / (jobId + ".json");
    try {
        m_persistence->moveDurable(getJobFilePath(jobId), target.string());
    } catch (const std::runtime_error& e) {
        throw StateStoreError("Cannot archive job " + jobId + ": " + e.what());
    }
}

size_t JsonStateStore::quarantinedDocumentCount() const {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    return m_quarantinedDocuments;
}

size_t JsonStateStore::lockTableSize() const {
    std::lock_guard<std::mutex> lock(m_locksMutex);
    return m_jobLocks.size();
}

} // namespace forker::infrastructure
