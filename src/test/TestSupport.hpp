/**
 * @file TestSupport.hpp
 * @brief Scratch directories and small file helpers shared by the test executables.
 */

#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "application/ForkerConfig.hpp"
#include "domain/DiscoveredFile.hpp"
#include "domain/ReplicationErrors.hpp"
#include "domain/repositories/IStateStore.hpp"
#include "infrastructure/LocalCopyEngine.hpp"

namespace forker::test {

/**
 * @class ScratchDir
 * @brief A fresh directory under the system temp dir, removed on destruction.
 */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() /
                 ("forker_" + name + "_" + std::to_string(::getpid()))) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

    std::filesystem::path sub(const std::string& name) const {
        std::filesystem::path p = m_path / name;
        std::filesystem::create_directories(p);
        return p;
    }

private:
    std::filesystem::path m_path;
};

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string Pattern(size_t size) {
    std::string s;
    s.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        s.push_back(static_cast<char>('a' + (i * 7) % 26));
    }
    return s;
}

/** @brief What the source scanner would report for @p path right now. */
inline domain::DiscoveredFile Discover(const std::filesystem::path& path) {
    struct stat st{};
    ::lstat(path.c_str(), &st);
    domain::DiscoveredFile f;
    f.path = path.string();
    f.sizeBytes = static_cast<std::uintmax_t>(st.st_size);
    f.modifiedAtNs = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    f.discoveredAt = std::chrono::system_clock::now();
    return f;
}

/**
 * @class SwitchableStateStore
 * @brief Forwards to a real store until failWrites is set, then every put throws StateStoreError.
 */
class SwitchableStateStore : public domain::IStateStore {
public:
    explicit SwitchableStateStore(std::shared_ptr<domain::IStateStore> inner) : m_inner(std::move(inner)) {}

    std::atomic<bool> failWrites{false};

    void put(const domain::FileJob& job) override {
        if (failWrites) throw domain::StateStoreError("disk full");
        m_inner->put(job);
    }
    void put(const std::string& jobId, const domain::Target& target) override {
        if (failWrites) throw domain::StateStoreError("disk full");
        m_inner->put(jobId, target);
    }
    std::optional<domain::FileJob> get(const std::string& jobId) override { return m_inner->get(jobId); }
    std::vector<domain::FileJob> listIncomplete() override { return m_inner->listIncomplete(); }
    std::vector<domain::FileJob> listAll() override { return m_inner->listAll(); }
    void archive(const std::string& jobId) override { m_inner->archive(jobId); }

private:
    std::shared_ptr<domain::IStateStore> m_inner;
};

/** @brief A valid configuration rooted in @p dir, with short timings for tests. */
inline application::ForkerConfig MakeConfig(const ScratchDir& dir) {
    application::ForkerConfig c;
    c.sourceDirectory = dir.sub("source").string();
    c.primaryDirectory = dir.sub("primary").string();
    c.researchDirectory = dir.sub("research").string();
    c.stateDirectory = dir.sub("state").string();
    c.workerCount = 2;
    c.tickInterval = std::chrono::milliseconds(20);
    c.stepTimeout = std::chrono::milliseconds(10000);
    c.shutdownGracePeriod = std::chrono::milliseconds(2000);
    c.minimumFileAge = std::chrono::milliseconds(0);
    c.retry.maxAttempts = 3;
    c.retry.baseDelay = std::chrono::milliseconds(1);
    c.retry.maxDelay = std::chrono::milliseconds(5);
    c.retry.jitterFactor = 0.0;
    c.validate();
    return c;
}

/**
 * @class HookedCopyEngine
 * @brief LocalCopyEngine with optional hooks before stage and publish, for fault injection.
 *
 * Also records the highest number of concurrent stage calls seen per source file.
 */
class HookedCopyEngine : public infrastructure::LocalCopyEngine {
public:
    std::function<void(const std::filesystem::path& source)> beforeStage;
    std::function<void(const std::filesystem::path& finalPath)> beforePublish;

    domain::StageResult stage(const std::filesystem::path& sourcePath,
                              const std::filesystem::path& destinationRoot,
                              const std::string& stagingName,
                              const domain::StepContext& ctx) override {
        std::string key = sourcePath.filename().string();
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            int& active = m_active[key];
            ++active;
            if (active > m_maxConcurrent[key]) m_maxConcurrent[key] = active;
        }
        struct Leave {
            HookedCopyEngine* self;
            std::string key;
            ~Leave() {
                std::lock_guard<std::mutex> lock(self->m_mutex);
                --self->m_active[key];
            }
        } leave{this, key};

        if (beforeStage) beforeStage(sourcePath);
        return LocalCopyEngine::stage(sourcePath, destinationRoot, stagingName, ctx);
    }

    domain::PublishOutcome publish(const std::filesystem::path& stagedPath,
                                   const std::filesystem::path& finalPath) override {
        publishCalls++;
        if (beforePublish) beforePublish(finalPath);
        return LocalCopyEngine::publish(stagedPath, finalPath);
    }

    int maxConcurrentStages(const std::string& sourceName) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_maxConcurrent[sourceName];
    }

    std::atomic<int> publishCalls{0};

private:
    std::mutex m_mutex;
    std::map<std::string, int> m_active;
    std::map<std::string, int> m_maxConcurrent;
};

/** @brief Regular files directly under @p dir, staging area excluded. */
inline size_t CountFiles(const std::filesystem::path& dir) {
    size_t n = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) ++n;
    }
    return n;
}

} // namespace forker::test
