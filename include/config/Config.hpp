#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace gm::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/gitmount/config.yaml";

struct RepositoryConfig {
    std::string reference = "HEAD";
    bool verify_objects = false;
};

struct FuseConfig {
    bool allow_other = false;
    bool require_empty_mountpoint = true;
    double attr_timeout = 3600.0;  // content is immutable for the mount's lifetime
    double entry_timeout = 3600.0;
    unsigned int worker_threads = 0; // 0 = hardware concurrency
    unsigned int max_readahead_kb = 1024;
    bool debug = false;
};

struct CachingConfig {
    bool share_blob_buffers = true;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum gitmount = spdlog::level::info;  // Mount and unmount, startup failures
    spdlog::level::level_enum fuse     = spdlog::level::warn;  // Per-callback noise stays at debug
    spdlog::level::level_enum git      = spdlog::level::warn;  // Corrupt objects, unreadable packs
    spdlog::level::level_enum fs       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    RepositoryConfig repository;
    FuseConfig fuse;
    CachingConfig caching;
    LoggingConfig logging;
};

// Throws YAML::Exception on unreadable or malformed input.
Config loadConfig(const std::filesystem::path& path);

}
