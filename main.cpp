#include <iostream>
#include <string>

#include "app/ForkerService.hpp"
#include "application/ForkerConfig.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace forker;

namespace {

bool LoadConfig(const std::string& configPath, application::ForkerConfig& config) {
    try {
        config = infrastructure::ConfigLoader::Load(configPath);
    } catch (const application::ConfigError& e) {
        std::cerr << "[Forker] Invalid configuration (" << configPath << "): " << e.what() << std::endl;
        return false;
    }
    std::cout << "[Forker] Configuration loaded from " << configPath << std::endl;
    return true;
}

} // namespace

int main(int argc, char** argv) {
    std::string defaultConfig = infrastructure::PathUtils::GetDefaultConfigPath().string();

    // forker release-quarantine <jobId> <reason> [config]
    if (argc > 1 && std::string(argv[1]) == "release-quarantine") {
        if (argc < 4) {
            std::cerr << "Usage: " << argv[0] << " release-quarantine <jobId> <reason> [config]" << std::endl;
            return 2;
        }
        application::ForkerConfig config;
        if (!LoadConfig(argc > 4 ? argv[4] : defaultConfig, config)) return 2;
        app::ForkerService service(std::move(config));
        return service.ReleaseFromQuarantine(argv[2], argv[3]);
    }

    application::ForkerConfig config;
    if (!LoadConfig(argc > 1 ? argv[1] : defaultConfig, config)) return 2;

    app::ForkerService::InstallSignalHandlers();
    app::ForkerService service(std::move(config));
    return service.Run();
}
