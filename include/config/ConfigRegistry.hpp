#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace gm::config {

class ConfigRegistry {
public:
    // Loads `path`; a missing file at the default location means built-in defaults.
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static void init(const Config& config);

    static const Config& get();
    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex mutex_;
};

}
