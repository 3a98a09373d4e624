#include <cassert>
#include <iostream>
#include <string>

#include "application/ForkerConfig.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "TestSupport.hpp"

using forker::application::ConfigError;
using forker::application::ForkerConfig;
using forker::infrastructure::ConfigLoader;

namespace {

bool Rejects(const std::string& text) {
    try {
        ConfigLoader::LoadFromString(text);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

std::string WithDirs(const std::string& extra) {
    std::string s = R"({"source_directory": "/srv/forker/in",
                        "primary_directory": "/srv/forker/primary",
                        "research_directory": "/srv/forker/research",
                        "state_directory": "/srv/forker/state")";
    if (!extra.empty()) s += ", " + extra;
    return s + "}";
}

} // namespace

int main() {
    std::cout << "[Test] Starting Config Loader Test..." << std::endl;

    // Defaults
    ForkerConfig c = ConfigLoader::LoadFromString(WithDirs(""));
    assert(c.sourceDirectory == "/srv/forker/in");
    assert(c.hashAlgorithm == "sha256");
    assert(c.workerCount == 4);
    assert(c.tickInterval == std::chrono::milliseconds(1000));
    assert(c.retry.maxAttempts == 3);
    assert(c.retry.backoffMultiplier == 2.0);
    std::cout << "[PASS] Defaults applied." << std::endl;

    // Overrides
    c = ConfigLoader::LoadFromString(WithDirs(R"("hash_algorithm": "sha512", "worker_count": 8,
        "tick_interval_ms": 250, "step_timeout_ms": 60000, "minimum_file_age_ms": 0,
        "retention_hours": 24,
        "retry": {"max_attempts": 5, "base_delay_ms": 10, "backoff_multiplier": 3.0,
                  "max_delay_ms": 100, "jitter_factor": 0.1})"));
    assert(c.hashAlgorithm == "sha512");
    assert(c.workerCount == 8);
    assert(c.tickInterval == std::chrono::milliseconds(250));
    assert(c.stepTimeout == std::chrono::milliseconds(60000));
    assert(c.minimumFileAge == std::chrono::milliseconds(0));
    assert(c.retention == std::chrono::hours(24));
    assert(c.retry.maxAttempts == 5);
    assert(c.retry.baseDelay == std::chrono::milliseconds(10));
    assert(c.retry.maxDelay == std::chrono::milliseconds(100));
    std::cout << "[PASS] Overrides read." << std::endl;

    // Rejections
    assert(Rejects("not json"));
    assert(Rejects("[1, 2]"));
    assert(Rejects(R"({"primary_directory": "/a", "research_directory": "/b", "state_directory": "/c"})"));
    assert(Rejects(WithDirs(R"("hash_algorithm": "md5")")));
    assert(Rejects(WithDirs(R"("worker_count": 0)")));
    assert(Rejects(WithDirs(R"("worker_count": "four")")));
    assert(Rejects(WithDirs(R"("tick_interval_ms": 0)")));
    assert(Rejects(WithDirs(R"("retry": 3)")));
    assert(Rejects(WithDirs(R"("retry": {"max_attempts": 0})")));
    assert(Rejects(WithDirs(R"("retry": {"backoff_multiplier": 1.0})")));
    assert(Rejects(WithDirs(R"("retry": {"base_delay_ms": 500, "max_delay_ms": 100})")));
    assert(Rejects(WithDirs(R"("retry": {"jitter_factor": 1.5})")));
    std::cout << "[PASS] Invalid values fail startup." << std::endl;

    // Directory layout
    assert(Rejects(R"({"source_directory": "/srv/x", "primary_directory": "/srv/x",
                       "research_directory": "/srv/r", "state_directory": "/srv/s"})"));
    assert(Rejects(R"({"source_directory": "/srv/x", "primary_directory": "/srv/p",
                       "research_directory": "/srv/p/research", "state_directory": "/srv/s"})"));
    assert(Rejects(R"({"source_directory": "/srv/x/", "primary_directory": "/srv/x/../x",
                       "research_directory": "/srv/r", "state_directory": "/srv/s"})"));
    assert(!Rejects(R"({"source_directory": "/srv/x", "primary_directory": "/srv/xy",
                        "research_directory": "/srv/r", "state_directory": "/srv/s"})"));
    std::cout << "[PASS] Directories must be distinct and non-nested." << std::endl;

    // From file
    forker::test::ScratchDir dir("config");
    auto path = dir.path() / "settings.json";
    forker::test::WriteFile(path, WithDirs(R"("worker_count": 2)"));
    assert(ConfigLoader::Load(path.string()).workerCount == 2);
    bool missing = false;
    try {
        ConfigLoader::Load((dir.path() / "absent.json").string());
    } catch (const ConfigError&) {
        missing = true;
    }
    assert(missing);
    std::cout << "[PASS] Loading from disk." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
