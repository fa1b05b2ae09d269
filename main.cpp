#include "config/ConfigRegistry.hpp"
#include "fs/Session.hpp"
#include "fuse/Service.hpp"
#include "runtime/CommandLine.hpp"
#include "types/Error.hpp"
#include "log/Registry.hpp"

#include <filesystem>
#include <iostream>

using namespace gm::config;
using namespace gm::fs;
using namespace gm::fuse;
using namespace gm::runtime;
using namespace gm::types;
using namespace gm::log;

namespace {

constexpr int EXIT_MOUNT_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

void enableDebug(Config& config) {
    config.fuse.debug = true;
    config.logging.levels.console_log_level = spdlog::level::debug;
    auto& sub = config.logging.levels.subsystem_levels;
    sub.gitmount = sub.fuse = sub.git = sub.fs = spdlog::level::debug;
}

}

int main(const int argc, char** argv) {
    const char* program = argc > 0 ? argv[0] : "gitmount";

    CommandLine cmd;
    try {
        cmd = parseCommandLine(argc, argv);
    } catch (const Error& e) {
        std::cerr << "gitmount: " << e.what() << "\n\n" << usage(program);
        return EXIT_USAGE;
    }

    if (cmd.help) {
        std::cout << usage(program);
        return 0;
    }

    try {
        if (cmd.configPath) ConfigRegistry::init(*cmd.configPath);
        else ConfigRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "gitmount: invalid configuration: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    auto config = ConfigRegistry::get();
    if (cmd.reference) config.repository.reference = *cmd.reference;
    if (cmd.debug) enableDebug(config);
    ConfigRegistry::init(config);

    try {
        Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "gitmount: cannot initialize logging: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    try {
        Registry::gitmount()->info("[*] Mounting {} at '{}'", cmd.gitPath.string(), config.repository.reference);

        const auto session = Session::open(cmd.gitPath, config.repository.reference,
                                           config.repository.verify_objects, config.caching.share_blob_buffers);

        std::error_code ec;
        auto source = std::filesystem::absolute(cmd.gitPath, ec);
        if (ec) source = cmd.gitPath;

        Service service(*session, cmd.mountPath, source.lexically_normal().string(), config.fuse);
        service.run();
    } catch (const Error& e) {
        Registry::gitmount()->error("[-] {}", e.what());
        return EXIT_MOUNT_FAILURE;
    } catch (const std::exception& e) {
        Registry::gitmount()->error("[-] Unexpected failure: {}", e.what());
        return EXIT_MOUNT_FAILURE;
    }

    Registry::gitmount()->info("[✓] Clean unmount");
    return 0;
}
