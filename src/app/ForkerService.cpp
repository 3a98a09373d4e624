/**
 * @file ForkerService.cpp
 * @brief Implementation of the ForkerService class.
 */
#include "app/ForkerService.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/ReplicationErrors.hpp"
#include "infrastructure/JsonStateStore.hpp"
#include "infrastructure/LocalCopyEngine.hpp"
#include "infrastructure/OpenSslHashingEngine.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SourceDirectoryScanner.hpp"
#include "infrastructure/StateChangeLog.hpp"

namespace forker::app {

namespace {

std::atomic<bool> g_signalReceived{false};

void HandleSignal(int) {
    g_signalReceived = true;
}

constexpr std::chrono::milliseconds kPollInterval{200};
constexpr std::chrono::minutes kRetentionSweepInterval{60};
constexpr std::chrono::seconds kMetricsLogInterval{60};

bool RequireDirectory(const std::string& dir, const char* key) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) return true;
    std::cerr << "[ForkerService] " << key << " is not an accessible directory: " << dir << std::endl;
    return false;
}

} // namespace

ForkerService::ForkerService(application::ForkerConfig config) : m_config(std::move(config)) {}

ForkerService::~ForkerService() {
    Shutdown();
}

void ForkerService::InstallSignalHandlers() {
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
}

void ForkerService::RequestStop() {
    {
        std::lock_guard<std::mutex> lock(m_stopMutex);
        m_stopRequested = true;
    }
    m_stopCv.notify_all();
}

bool ForkerService::Init() {
    if (!RequireDirectory(m_config.sourceDirectory, "source_directory") ||
        !RequireDirectory(m_config.primaryDirectory, "primary_directory") ||
        !RequireDirectory(m_config.researchDirectory, "research_directory")) {
        return false;
    }

    try {
        auto& s = m_services;
        s.persistenceService = std::make_shared<infrastructure::PersistenceService>();
        s.auditLog = std::make_shared<infrastructure::StateChangeLog>(m_config.stateDirectory, s.persistenceService);
        s.stateStore = std::make_shared<infrastructure::JsonStateStore>(m_config.stateDirectory, s.persistenceService);
        s.hashingEngine = std::make_shared<infrastructure::OpenSslHashingEngine>(m_config.hashAlgorithm);
        s.copyEngine = std::make_shared<infrastructure::LocalCopyEngine>();
        s.scanner = std::make_shared<infrastructure::SourceDirectoryScanner>(m_config.sourceDirectory, m_config.minimumFileAge);
        s.metrics = std::make_shared<application::ReplicationMetrics>();
        s.stateMachine = std::make_shared<application::JobStateMachine>(
            m_config, s.stateStore, s.copyEngine, s.hashingEngine, s.auditLog, s.metrics);
        s.workerPool = std::make_shared<application::WorkerPool>(static_cast<size_t>(m_config.workerCount));

        auto scanner = s.scanner;
        s.dispatcher = std::make_shared<application::Dispatcher>(
            m_config, s.stateMachine, s.workerPool, s.metrics,
            [scanner]() { return scanner->scan(); });
        s.dispatcher->setFatalErrorHandler([this](const std::string&) {
            m_fatal = true;
            RequestStop();
        });

        s.shutdownCoordinator = std::make_unique<application::ShutdownCoordinator>(s.dispatcher, m_config.shutdownGracePeriod);
        auto persistence = s.persistenceService;
        s.shutdownCoordinator->addReleaseStep("audit writer", [persistence]() { persistence->stop(); });

        // Recovery: the state store, not the filesystem, says what is unfinished.
        std::vector<domain::FileJob> incomplete = s.stateStore->listIncomplete();
        std::vector<domain::FileJob> recovered;
        recovered.reserve(incomplete.size());
        for (auto& job : incomplete) {
            recovered.push_back(s.stateMachine->recover(std::move(job)));
        }
        // Every job, not only the recovered ones: quarantined jobs keep their staging files.
        size_t orphans = s.stateMachine->cleanupOrphans(s.stateStore->listAll());
        std::cout << "[ForkerService] Recovered " << recovered.size() << " incomplete job(s), removed "
                  << orphans << " orphaned staging file(s)" << std::endl;

        s.dispatcher->start(s.stateStore->listAll());
    } catch (const domain::StateStoreError& e) {
        std::cerr << "[ForkerService] State store unavailable at startup: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "[ForkerService] Initialization failed: " << e.what() << std::endl;
        return false;
    }

    m_initialized = true;
    return true;
}

int ForkerService::Run() {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::cout << "[ForkerService] Running with " << m_config.workerCount << " worker(s), "
              << m_config.hashAlgorithm << " verification" << std::endl;

    auto now = std::chrono::steady_clock::now();
    auto lastSweep = now - kRetentionSweepInterval;
    auto lastMetricsLog = now;

    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_stopMutex);
            if (m_stopCv.wait_for(lock, kPollInterval, [this] { return m_stopRequested || g_signalReceived.load(); })) {
                break;
            }
        }

        now = std::chrono::steady_clock::now();
        if (now - lastSweep >= kRetentionSweepInterval) {
            lastSweep = now;
            try {
                m_services.stateMachine->sweepRetention(std::chrono::system_clock::now());
            } catch (const domain::StateStoreError& e) {
                std::cerr << "[ForkerService] Retention sweep failed, stopping: " << e.what() << std::endl;
                m_fatal = true;
                break;
            }
        }

        if (now - lastMetricsLog >= kMetricsLogInterval) {
            lastMetricsLog = now;
            std::cout << "[ForkerService] Metrics: " << m_services.metrics->snapshot().dump() << std::endl;
            if (!m_services.metrics->isLive(m_config.livenessThreshold)) {
                std::cerr << "[ForkerService] WARNING: no dispatcher tick completed within "
                          << m_config.livenessThreshold.count() << " ms" << std::endl;
            }
        }
    }

    if (g_signalReceived) {
        std::cout << "[ForkerService] Stop signal received" << std::endl;
    }
    Shutdown();
    return m_fatal ? 1 : 0;
}

int ForkerService::ReleaseFromQuarantine(const std::string& jobId, const std::string& reason) {
    int rc = 1;
    try {
        auto& s = m_services;
        s.persistenceService = std::make_shared<infrastructure::PersistenceService>();
        s.auditLog = std::make_shared<infrastructure::StateChangeLog>(m_config.stateDirectory, s.persistenceService);
        s.stateStore = std::make_shared<infrastructure::JsonStateStore>(m_config.stateDirectory, s.persistenceService);
        s.hashingEngine = std::make_shared<infrastructure::OpenSslHashingEngine>(m_config.hashAlgorithm);
        s.copyEngine = std::make_shared<infrastructure::LocalCopyEngine>();
        s.metrics = std::make_shared<application::ReplicationMetrics>();
        s.stateMachine = std::make_shared<application::JobStateMachine>(
            m_config, s.stateStore, s.copyEngine, s.hashingEngine, s.auditLog, s.metrics);

        rc = s.stateMachine->releaseFromQuarantine(jobId, reason) ? 0 : 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ForkerService] Release refused: " << e.what() << std::endl;
    } catch (const domain::StateStoreError& e) {
        std::cerr << "[ForkerService] State store unavailable: " << e.what() << std::endl;
    }
    Shutdown();
    return rc;
}

void ForkerService::Shutdown() {
    if (m_services.shutdownCoordinator) {
        m_services.shutdownCoordinator->shutdown();
    } else if (m_services.persistenceService) {
        m_services.persistenceService->stop();
    }
}

} // namespace forker::app
