#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace gm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<RepositoryConfig> {
    static Node encode(const RepositoryConfig& rhs) {
        Node node;
        node["reference"] = rhs.reference;
        node["verify_objects"] = rhs.verify_objects;
        return node;
    }

    static bool decode(const Node& node, RepositoryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.reference = node["reference"].as<std::string>("HEAD");
        rhs.verify_objects = node["verify_objects"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<FuseConfig> {
    static Node encode(const FuseConfig& rhs) {
        Node node;
        node["allow_other"] = rhs.allow_other;
        node["require_empty_mountpoint"] = rhs.require_empty_mountpoint;
        node["attr_timeout"] = rhs.attr_timeout;
        node["entry_timeout"] = rhs.entry_timeout;
        node["worker_threads"] = rhs.worker_threads;
        node["max_readahead_kb"] = rhs.max_readahead_kb;
        node["debug"] = rhs.debug;
        return node;
    }

    static bool decode(const Node& node, FuseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.allow_other = node["allow_other"].as<bool>(false);
        rhs.require_empty_mountpoint = node["require_empty_mountpoint"].as<bool>(true);
        rhs.attr_timeout = node["attr_timeout"].as<double>(3600.0);
        rhs.entry_timeout = node["entry_timeout"].as<double>(3600.0);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(0);
        rhs.max_readahead_kb = node["max_readahead_kb"].as<unsigned int>(1024);
        rhs.debug = node["debug"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<CachingConfig> {
    static Node encode(const CachingConfig& rhs) {
        Node node;
        node["share_blob_buffers"] = rhs.share_blob_buffers;
        return node;
    }

    static bool decode(const Node& node, CachingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.share_blob_buffers = node["share_blob_buffers"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["gitmount"] = to_std_string(spdlog::level::to_string_view(rhs.gitmount));
        node["fuse"]     = to_std_string(spdlog::level::to_string_view(rhs.fuse));
        node["git"]      = to_std_string(spdlog::level::to_string_view(rhs.git));
        node["fs"]       = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.gitmount = spdlog::level::from_str(node["gitmount"].as<std::string>("info"));
        rhs.fuse = spdlog::level::from_str(node["fuse"].as<std::string>("warn"));
        rhs.git = spdlog::level::from_str(node["git"].as<std::string>("warn"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystems"]        = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystems"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<std::filesystem::path> {
    static Node encode(const std::filesystem::path& rhs) {
        return Node(rhs.string());
    }

    static bool decode(const Node& node, std::filesystem::path& rhs) {
        if (!node.IsScalar()) return false;
        rhs = std::filesystem::path(node.as<std::string>());
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::filesystem::path>(std::filesystem::path{});
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

}
