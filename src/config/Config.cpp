#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>

namespace gm::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (!root.IsDefined() || root.IsNull()) return cfg;
    if (!root.IsMap()) throw YAML::ParserException(root.Mark(), "top level of " + path.string() + " must be a mapping");

    if (const auto node = root["repository"]) YAML::convert<RepositoryConfig>::decode(node, cfg.repository);
    if (const auto node = root["fuse"]) YAML::convert<FuseConfig>::decode(node, cfg.fuse);
    if (const auto node = root["caching"]) YAML::convert<CachingConfig>::decode(node, cfg.caching);
    if (const auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}
