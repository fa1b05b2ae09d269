#pragma once

#define FUSE_USE_VERSION 35

#include "config/Config.hpp"
#include "fuse/Dispatcher.hpp"

#include <filesystem>
#include <fuse_lowlevel.h>
#include <string>
#include <vector>

namespace gm::fuse {

// Mounts one Session and serves it until unmounted or signalled.
class Service {
public:
    Service(fs::Session& session, std::filesystem::path mountPoint, std::string source, config::FuseConfig config);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Blocks until the filesystem is unmounted. Setup failures throw MountFailure.
    void run();

    // Safe from any thread; makes run() return.
    void stop();

    // Must exist, be a directory, and (when required) be empty. Throws MountFailure.
    static void checkMountPoint(const std::filesystem::path& mountPoint, bool requireEmpty);

    // argv handed to fuse_session_new
    static std::vector<std::string> sessionArgs(const config::FuseConfig& config, const std::string& source);

    [[nodiscard]] fuse_session* session() const noexcept { return session_; }

private:
    fs::Session& mount_;
    std::filesystem::path mountPoint_;
    std::string source_;
    config::FuseConfig config_;
    Dispatcher dispatcher_;
    fuse_session* session_{nullptr};

    void teardown(bool mounted, bool handlers);
};

}
