/**
 * @file ForkerServices.hpp
 * @brief Container for the service's components to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/Dispatcher.hpp"
#include "application/JobStateMachine.hpp"
#include "application/ReplicationMetrics.hpp"
#include "application/ShutdownCoordinator.hpp"
#include "application/WorkerPool.hpp"
#include "domain/repositories/IStateStore.hpp"
#include "domain/services/ICopyEngine.hpp"
#include "domain/services/IHashingEngine.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/SourceDirectoryScanner.hpp"
#include "infrastructure/StateChangeLog.hpp"

namespace forker::application {

struct ForkerServices {
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::StateChangeLog> auditLog;
    std::shared_ptr<domain::IStateStore> stateStore;
    std::shared_ptr<domain::IHashingEngine> hashingEngine;
    std::shared_ptr<domain::ICopyEngine> copyEngine;
    std::shared_ptr<infrastructure::SourceDirectoryScanner> scanner;
    std::shared_ptr<ReplicationMetrics> metrics;
    std::shared_ptr<JobStateMachine> stateMachine;
    std::shared_ptr<WorkerPool> workerPool;
    std::shared_ptr<Dispatcher> dispatcher;
    std::unique_ptr<ShutdownCoordinator> shutdownCoordinator;
};

} // namespace forker::application
