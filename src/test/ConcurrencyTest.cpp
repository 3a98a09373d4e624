#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include <condition_variable>
#include <mutex>
#include "application/Dispatcher.hpp"
#include "application/JobStateMachine.hpp"
#include "application/WorkerPool.hpp"
#include "infrastructure/JsonStateStore.hpp"
#include "infrastructure/OpenSslHashingEngine.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/StateChangeLog.hpp"
#include "TestSupport.hpp"

using namespace forker::domain;
using namespace forker::application;
using namespace forker::infrastructure;
namespace fs = std::filesystem;

// Holds one file's stage until released.
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait_for(lock, std::chrono::seconds(10), [this] { return m_open; });
    }
    void open() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }
    bool waitEntered(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, timeout, [this] { return m_entered; });
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered = false;
    bool m_open = false;
};

using forker::test::Discover;

std::optional<FileJob> FindBySource(JsonStateStore& store, const fs::path& source) {
    for (auto& job : store.listAll()) {
        if (job.getSourcePath() == source.string()) return job;
    }
    return std::nullopt;
}

bool IsDone(JsonStateStore& store, const fs::path& source) {
    auto job = FindBySource(store, source);
    return job && job->getState() == JobState::Verified && job->isCleanupCompleted();
}

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;

    // Setup
    forker::test::ScratchDir dir("concurrency");
    ForkerConfig config = forker::test::MakeConfig(dir);
    config.workerCount = 2;

    auto persistence = std::make_shared<PersistenceService>();
    auto store = std::make_shared<JsonStateStore>(config.stateDirectory, persistence);
    auto copy = std::make_shared<forker::test::HookedCopyEngine>();
    auto hashing = std::make_shared<OpenSslHashingEngine>("sha256");
    auto auditLog = std::make_shared<StateChangeLog>(config.stateDirectory, persistence);
    auto metrics = std::make_shared<ReplicationMetrics>();
    auto machine = std::make_shared<JobStateMachine>(config, store, copy, hashing, auditLog, metrics);
    auto pool = std::make_shared<WorkerPool>(static_cast<size_t>(config.workerCount));
    auto dispatcher = std::make_shared<Dispatcher>(config, machine, pool, metrics);

    Gate gate;
    copy->beforeStage = [&gate](const fs::path& source) {
        if (source.filename() == "j1.dcm") gate.wait();
    };

    fs::path src = config.sourceDirectory;
    forker::test::WriteFile(src / "j1.dcm", "first job");
    forker::test::WriteFile(src / "j2.dcm", "second job");
    dispatcher->notifyDiscovered(Discover(src / "j1.dcm"));
    dispatcher->notifyDiscovered(Discover(src / "j2.dcm"));

    // Tick 1 admits both and starts both.
    std::cout << "[Test] Tick 1: admitting J1 and J2..." << std::endl;
    dispatcher->runTickNow();
    assert(metrics->jobsAdmitted() == 2);
    assert(gate.waitEntered(std::chrono::seconds(5)));
    auto j1 = FindBySource(*store, src / "j1.dcm");
    assert(j1);
    assert(dispatcher->tokens().isHeld(j1->getId()));

    // Later ticks find J1's token taken: skipped, not queued. J3 still gets a worker.
    forker::test::WriteFile(src / "j3.dcm", "third job");
    dispatcher->notifyDiscovered(Discover(src / "j3.dcm"));
    int ticks = 0;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!(IsDone(*store, src / "j2.dcm") && IsDone(*store, src / "j3.dcm")) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        dispatcher->runTickNow();
        ++ticks;
    }
    assert(IsDone(*store, src / "j2.dcm"));
    assert(IsDone(*store, src / "j3.dcm"));
    assert(metrics->busySkips() >= 1);
    assert(dispatcher->tokens().isHeld(j1->getId()));
    std::cout << "[PASS] " << ticks << " ticks while J1 was busy: J1 skipped " << metrics->busySkips()
              << " time(s), J2 and J3 completed." << std::endl;

    // Release J1 and let it finish.
    gate.open();
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (dispatcher->openJobCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        dispatcher->runTickNow();
    }
    assert(IsDone(*store, src / "j1.dcm"));
    assert(copy->maxConcurrentStages("j1.dcm") == 1);
    assert(dispatcher->tokens().heldCount() == 0);
    std::cout << "[PASS] J1 completed with no overlapping step." << std::endl;

    // Stress: discovery events from many threads at once
    const int NUM_FILES = 24;
    std::vector<std::thread> threads;
    std::cout << "[Test] Spawning " << NUM_FILES << " threads reporting discoveries..." << std::endl;
    for (int i = 0; i < NUM_FILES; ++i) {
        threads.emplace_back([&, i]() {
            fs::path p = src / ("batch_" + std::to_string(i) + ".dcm");
            forker::test::WriteFile(p, forker::test::Pattern(1000 + i));
            dispatcher->notifyDiscovered(Discover(p));
            // Duplicate report of the same file.
            dispatcher->notifyDiscovered(Discover(p));
        });
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }

    dispatcher->runTickNow();
    deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (dispatcher->openJobCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        dispatcher->runTickNow();
    }

    assert(dispatcher->openJobCount() == 0);
    assert(metrics->jobsAdmitted() == 3 + NUM_FILES);
    assert(metrics->jobsVerified() == 3 + NUM_FILES);
    for (int i = 0; i < NUM_FILES; ++i) {
        std::string name = "batch_" + std::to_string(i) + ".dcm";
        assert(copy->maxConcurrentStages(name) == 1);
        assert(!fs::exists(src / name));
        assert(forker::test::ReadFile(fs::path(config.primaryDirectory) / name) == forker::test::Pattern(1000 + i));
        assert(forker::test::ReadFile(fs::path(config.researchDirectory) / name) == forker::test::Pattern(1000 + i));
    }
    assert(forker::test::CountFiles(config.primaryDirectory) == static_cast<size_t>(3 + NUM_FILES));
    assert(metrics->isLive(std::chrono::seconds(5)));
    std::cout << "[PASS] " << NUM_FILES << " concurrent discoveries replicated exactly once each." << std::endl;

    // Clean up
    dispatcher->stopAccepting();
    dispatcher->releaseResources();
    persistence->stop();
    std::cout << "[Test] Completed." << std::endl;

    return 0;
}
