#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <thread>

#include "app/ForkerService.hpp"
#include "application/Dispatcher.hpp"
#include "application/JobStateMachine.hpp"
#include "application/ShutdownCoordinator.hpp"
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

namespace {

struct Stack {
    ForkerConfig config;
    std::shared_ptr<PersistenceService> persistence = std::make_shared<PersistenceService>();
    std::shared_ptr<JsonStateStore> store;
    std::shared_ptr<forker::test::HookedCopyEngine> copy = std::make_shared<forker::test::HookedCopyEngine>();
    std::shared_ptr<ReplicationMetrics> metrics = std::make_shared<ReplicationMetrics>();
    std::shared_ptr<JobStateMachine> machine;
    std::shared_ptr<Dispatcher> dispatcher;
    std::unique_ptr<ShutdownCoordinator> coordinator;

    explicit Stack(ForkerConfig c) : config(std::move(c)) {
        store = std::make_shared<JsonStateStore>(config.stateDirectory, persistence);
        auto hashing = std::make_shared<OpenSslHashingEngine>("sha256");
        auto auditLog = std::make_shared<StateChangeLog>(config.stateDirectory, persistence);
        machine = std::make_shared<JobStateMachine>(config, store, copy, hashing, auditLog, metrics);
        auto pool = std::make_shared<WorkerPool>(static_cast<size_t>(config.workerCount));
        dispatcher = std::make_shared<Dispatcher>(config, machine, pool, metrics);
        coordinator = std::make_unique<ShutdownCoordinator>(dispatcher, config.shutdownGracePeriod);
        auto p = persistence;
        coordinator->addReleaseStep("audit writer", [p]() { p->stop(); });
    }

    std::string admitAndStart(const fs::path& source) {
        dispatcher->notifyDiscovered(forker::test::Discover(source));
        dispatcher->runTickNow();
        auto all = store->listAll();
        assert(all.size() == 1);
        return all[0].getId();
    }
};

bool WaitFor(const std::atomic<bool>& flag, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!flag && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return flag;
}

void GracefulDrain() {
    std::cout << "[Test] Graceful drain: running stage completes, no publish after shutdown..." << std::endl;
    forker::test::ScratchDir dir("shutdown_drain");
    ForkerConfig config = forker::test::MakeConfig(dir);
    fs::path source = fs::path(config.sourceDirectory) / "drain.dcm";
    forker::test::WriteFile(source, forker::test::Pattern(4096));
    std::string jobId;

    {
        Stack s(config);
        std::atomic<bool> entered{false};
        std::atomic<bool> release{false};
        s.copy->beforeStage = [&](const fs::path&) {
            entered = true;
            while (!release) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        };

        jobId = s.admitAndStart(source);
        assert(WaitFor(entered, std::chrono::seconds(5)));

        std::thread stopper([&s]() { s.coordinator->shutdown(); });
        assert(s.coordinator->waitForPhase(ShutdownPhase::Draining, std::chrono::seconds(5)));
        assert(s.coordinator->phase() == ShutdownPhase::Draining);
        assert(!s.dispatcher->isAccepting());

        // Ticks and discoveries are inert once draining.
        s.dispatcher->notifyDiscovered(DiscoveredFile{});
        s.dispatcher->runTickNow();

        release = true;
        stopper.join();
        assert(s.coordinator->phase() == ShutdownPhase::Stopped);

        auto job = s.store->get(jobId);
        assert(job->getTarget(TargetRole::Primary).getState() == TargetState::Staged);
        assert(job->getTarget(TargetRole::Research).getState() == TargetState::Pending);
        assert(s.copy->publishCalls == 0);
        assert(forker::test::CountFiles(config.primaryDirectory) == 0);
        assert(fs::exists(source));
        assert(s.metrics->jobsAdmitted() == 1);

        // Second call is a no-op.
        s.coordinator->shutdown();
    }
    std::cout << "[PASS] Stage finished into Staged, nothing published." << std::endl;

    // Restart resumes from the persisted Staged state.
    Stack restarted(config);
    std::vector<FileJob> recovered;
    for (auto& job : restarted.store->listIncomplete()) {
        recovered.push_back(restarted.machine->recover(std::move(job)));
    }
    assert(recovered.size() == 1);
    assert(restarted.machine->cleanupOrphans(recovered) == 0);
    StepOutcome out = restarted.machine->advance(jobId, StepContext::Unbounded());
    assert(out.state == JobState::Verified);
    assert(!fs::exists(source));
    restarted.coordinator->shutdown();
    std::cout << "[PASS] Restart completed the drained job." << std::endl;
}

void HardStop() {
    std::cout << "[Test] Hard stop after the grace period..." << std::endl;
    forker::test::ScratchDir dir("shutdown_hard");
    ForkerConfig config = forker::test::MakeConfig(dir);
    config.shutdownGracePeriod = std::chrono::milliseconds(300);
    fs::path source = fs::path(config.sourceDirectory) / "slow.dcm";
    forker::test::WriteFile(source, forker::test::Pattern(3 * 1024 * 1024));

    Stack s(config);
    std::atomic<bool> entered{false};
    s.copy->beforeStage = [&](const fs::path&) {
        entered = true;
        // Outlast the grace period; the copy loop then sees the hard stop at its first chunk.
        std::this_thread::sleep_for(std::chrono::milliseconds(450));
    };

    std::string jobId = s.admitAndStart(source);
    assert(WaitFor(entered, std::chrono::seconds(5)));

    auto started = std::chrono::steady_clock::now();
    s.coordinator->shutdown();
    auto elapsed = std::chrono::steady_clock::now() - started;
    assert(s.coordinator->phase() == ShutdownPhase::Stopped);
    assert(elapsed < std::chrono::seconds(3));

    auto job = s.store->get(jobId);
    const Target& primary = job->getTarget(TargetRole::Primary);
    assert(primary.getState() == TargetState::Pending);
    assert(primary.getAttempts() == 0);   // abandonment is not a failed attempt
    assert(primary.getLastError().find("hard stop") != std::string::npos);
    assert(!fs::exists(s.copy->stagingPathFor(config.primaryDirectory,
                                              JobStateMachine::StagingNameFor(*job, TargetRole::Primary))));
    assert(fs::exists(source));
    std::cout << "[PASS] In-flight copy abandoned, target back to Pending, no partial file." << std::endl;
}

void ServiceLifecycle() {
    std::cout << "[Test] Service lifecycle..." << std::endl;
    forker::test::ScratchDir dir("shutdown_service");
    ForkerConfig config = forker::test::MakeConfig(dir);
    fs::path source = fs::path(config.sourceDirectory) / "service.dcm";
    forker::test::WriteFile(source, "served");

    forker::app::ForkerService service(config);
    int rc = -1;
    std::thread runner([&]() { rc = service.Run(); });

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (fs::exists(source) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(!fs::exists(source));
    assert(forker::test::ReadFile(fs::path(config.primaryDirectory) / "service.dcm") == "served");
    assert(forker::test::ReadFile(fs::path(config.researchDirectory) / "service.dcm") == "served");

    service.RequestStop();
    runner.join();
    assert(rc == 0);
    assert(service.Services().shutdownCoordinator->phase() == ShutdownPhase::Stopped);
    assert(service.Services().metrics->jobsVerified() == 1);
    std::cout << "[PASS] Service replicated a dropped file and stopped cleanly." << std::endl;

    // Missing destination root: startup fails.
    fs::remove_all(config.researchDirectory);
    forker::app::ForkerService broken(config);
    assert(broken.Run() == 1);
    std::cout << "[PASS] Startup refuses an unavailable destination root." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Shutdown Test..." << std::endl;
    GracefulDrain();
    HardStop();
    ServiceLifecycle();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
