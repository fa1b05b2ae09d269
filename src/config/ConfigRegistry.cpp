#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace gm::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::error_code ec;
    if (path == DEFAULT_CONFIG_PATH && !std::filesystem::exists(path, ec)) {
        init(Config{});
        return;
    }

    if (!std::filesystem::is_regular_file(path, ec))
        throw std::runtime_error("Config file not found: " + path.string());

    init(loadConfig(path));
}

void ConfigRegistry::init(const Config& config) {
    std::scoped_lock lock(mutex_);
    config_ = config;
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
