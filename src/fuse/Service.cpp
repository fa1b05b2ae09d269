#include "fuse/Service.hpp"
#include "fuse/Bridge.hpp"
#include "fuse/RequestTask.hpp"
#include "concurrency/ThreadPool.hpp"
#include "types/Error.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>
#include <memory>

using namespace gm::fuse;
using namespace gm::concurrency;
using namespace gm::types;
using namespace gm::log;

namespace {

// libfuse splits -o values on ',' unless escaped
std::string escapeOption(const std::string& value) {
    std::string out;
    for (const char c : value) {
        if (c == ',' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

}

Service::Service(gm::fs::Session& session, std::filesystem::path mountPoint, std::string source, gm::config::FuseConfig config)
    : mount_(session),
      mountPoint_(std::move(mountPoint)),
      source_(std::move(source)),
      config_(config),
      dispatcher_(session, Dispatcher::Options{config.attr_timeout, config.entry_timeout}) {}

Service::~Service() {
    if (session_) teardown(false, false);
}

void Service::checkMountPoint(const std::filesystem::path& mountPoint, const bool requireEmpty) {
    std::error_code ec;
    if (!std::filesystem::exists(mountPoint, ec))
        throw Error(ErrorKind::MountFailure, fmt::format("mount point {} does not exist", mountPoint.string()));
    if (!std::filesystem::is_directory(mountPoint, ec))
        throw Error(ErrorKind::MountFailure, fmt::format("mount point {} is not a directory", mountPoint.string()));
    if (requireEmpty && !gm::util::isEmptyDirectory(mountPoint))
        throw Error(ErrorKind::MountFailure, fmt::format("mount point {} is not empty", mountPoint.string()));
}

std::vector<std::string> Service::sessionArgs(const gm::config::FuseConfig& config, const std::string& source) {
    std::string options = "ro,default_permissions,subtype=gitmount,fsname=gitmount:" + escapeOption(source);
    if (config.allow_other) options += ",allow_other";

    std::vector<std::string> args = {"gitmount", "-o", options};
    if (config.debug) args.emplace_back("-d");
    return args;
}

void Service::stop() {
    if (session_) fuse_session_exit(session_);
}

void Service::teardown(const bool mounted, const bool handlers) {
    if (mounted) fuse_session_unmount(session_);
    if (handlers) fuse_remove_signal_handlers(session_);
    fuse_session_destroy(session_);
    session_ = nullptr;
}

void Service::run() {
    checkMountPoint(mountPoint_, config_.require_empty_mountpoint);

    const auto argsStr = sessionArgs(config_, source_);
    std::vector<std::unique_ptr<char[]>> ownedCStrs;
    std::vector<char*> argsCStr;
    for (const auto& str : argsStr) {
        auto buf = std::make_unique<char[]>(str.size() + 1);
        std::memcpy(buf.get(), str.c_str(), str.size() + 1);
        argsCStr.push_back(buf.get());
        ownedCStrs.push_back(std::move(buf));
    }

    fuse_args args = FUSE_ARGS_INIT(static_cast<int>(argsCStr.size()), argsCStr.data());
    const fuse_lowlevel_ops ops = getOperations();

    mount_.beginMount();

    session_ = fuse_session_new(&args, &ops, sizeof(ops), &dispatcher_);
    fuse_opt_free_args(&args);
    if (!session_) {
        mount_.abortMount();
        throw Error(ErrorKind::MountFailure, "failed to create FUSE session");
    }

    if (fuse_set_signal_handlers(session_) != 0) {
        teardown(false, false);
        mount_.abortMount();
        throw Error(ErrorKind::MountFailure, "failed to set signal handlers");
    }

    if (fuse_session_mount(session_, mountPoint_.c_str()) != 0) {
        teardown(false, true);
        mount_.abortMount();
        throw Error(ErrorKind::MountFailure, fmt::format("failed to mount FUSE filesystem at {}", mountPoint_.string()));
    }

    mount_.markMounted();
    Registry::fuse()->info("[FUSE] Mounted {} ({}) at {}", source_, mount_.commit().reference, mountPoint_.string());

    {
        ThreadPool pool(config_.worker_threads);
        Registry::fuse()->debug("[FUSE] Serving with {} workers", pool.workerCount());

        while (!fuse_session_exited(session_)) {
            fuse_buf buf{};
            const int res = fuse_session_receive_buf(session_, &buf);
            if (res <= 0) {
                std::free(buf.mem);
                if (res == -EINTR) continue;
                if (res < 0) Registry::fuse()->error("[FUSE] Receive failed: {}", std::strerror(-res));
                break;
            }

            pool.submit(std::make_shared<RequestTask>(session_, buf));
        }

        Registry::fuse()->info("[FUSE] FUSE service loop exiting");
        // Requests already received are answered before the session stops serving
        pool.stop();
        mount_.beginUnmount();
    }

    teardown(true, true);
    mount_.markUnmounted();

    Registry::fuse()->info("[FUSE] Unmounted {}", mountPoint_.string());
}
