/**
 * @file StateChangeLog.cpp
 * @brief Implementation of StateChangeLog.
 */

#include "infrastructure/StateChangeLog.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace forker::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

StateChangeLog::StateChangeLog(std::string stateRoot, std::shared_ptr<PersistenceService> persistence)
    : m_stateRoot(std::move(stateRoot)), m_persistence(std::move(persistence)) {}

std::string StateChangeLog::getLogFilePath(const std::string& jobId) const {
    // Structure: <root>/audit/<jobId>.ndjson
    return (fs::path(m_stateRoot) / "audit" / (jobId + ".ndjson")).string();
}

void StateChangeLog::append(const std::string& jobId, const std::vector<domain::StateTransition>& transitions) {
    if (transitions.empty()) return;

    std::stringstream lines;
    for (const auto& t : transitions) {
        json j;
        j["job_id"] = jobId;
        j["entity"] = t.entity;
        if (!t.targetName.empty()) j["target"] = t.targetName;
        j["old"] = t.oldState;
        j["new"] = t.newState;
        j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            t.timestamp.time_since_epoch()).count();
        if (!t.context.empty()) j["context"] = t.context;
        lines << j.dump() << "\n";
    }

    m_persistence->appendAsync(getLogFilePath(jobId), lines.str());
}

std::vector<StateChangeRecord> StateChangeLog::readAll(const std::string& jobId) {
    std::vector<StateChangeRecord> results;
    std::string filepath = getLogFilePath(jobId);

    if (!fs::exists(filepath)) return results;

    std::ifstream inFile(filepath);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(inFile, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            StateChangeRecord rec;
            rec.jobId = j.value("job_id", jobId);
            rec.entity = j.at("entity").get<std::string>();
            rec.targetName = j.value("target", "");
            rec.oldState = j.value("old", "");
            rec.newState = j.at("new").get<std::string>();
            rec.timestamp = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(j.value("ts", 0LL)));
            rec.context = j.value("context", "");
            results.push_back(std::move(rec));
        } catch (const json::exception& e) {
            std::cerr << "[StateChangeLog] Skipping malformed line " << lineNo
                      << " of job " << jobId << ": " << e.what() << std::endl;
        }
    }
    return results;
}

void StateChangeLog::flush() {
    m_persistence->flush();
}

} // namespace forker::infrastructure
