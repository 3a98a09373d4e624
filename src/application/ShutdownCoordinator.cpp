/**
 * @file ShutdownCoordinator.cpp
 * @brief Implementation of ShutdownCoordinator.
 */

#include "application/ShutdownCoordinator.hpp"
#include <iostream>

namespace forker::application {

ShutdownCoordinator::ShutdownCoordinator(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds gracePeriod)
    : m_dispatcher(std::move(dispatcher)), m_gracePeriod(gracePeriod) {}

void ShutdownCoordinator::addReleaseStep(std::string name, std::function<void()> step) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_releaseSteps.emplace_back(std::move(name), std::move(step));
}

ShutdownPhase ShutdownCoordinator::phase() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_phase;
}

void ShutdownCoordinator::setPhase(ShutdownPhase phase) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_phase = phase;
    }
    m_cv.notify_all();
    std::cout << "[ShutdownCoordinator] Phase: " << ShutdownPhaseToString(phase) << std::endl;
}

bool ShutdownCoordinator::waitForPhase(ShutdownPhase target, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this, target] {
        return static_cast<int>(m_phase) >= static_cast<int>(target);
    });
}

void ShutdownCoordinator::shutdown() {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_started) {
            m_cv.wait(lock, [this] { return m_phase == ShutdownPhase::Stopped; });
            return;
        }
        m_started = true;
    }

    // 1. No new publish, no new admission, no further ticks.
    m_dispatcher->requestShutdown();
    m_dispatcher->stopAccepting();
    setPhase(ShutdownPhase::Draining);

    // 2. Bounded wait for executing steps.
    if (!m_dispatcher->waitForInFlight(m_gracePeriod)) {
        std::cerr << "[ShutdownCoordinator] Grace period of " << m_gracePeriod.count()
                  << " ms expired, raising hard stop" << std::endl;
        m_dispatcher->raiseHardStop();
        if (!m_dispatcher->waitForInFlight(m_gracePeriod)) {
            std::cerr << "[ShutdownCoordinator] Steps still running after hard stop; joining" << std::endl;
        }
    }

    // 3. Workers first, then everything they write through.
    m_dispatcher->releaseResources();

    std::vector<std::pair<std::string, std::function<void()>>> steps;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        steps = m_releaseSteps;
    }
    for (const auto& [name, step] : steps) {
        try {
            step();
        } catch (const std::exception& e) {
            std::cerr << "[ShutdownCoordinator] Release step '" << name << "' failed: " << e.what() << std::endl;
        }
    }

    setPhase(ShutdownPhase::Stopped);
}

} // namespace forker::application
