#include "fuse/Service.hpp"
#include "fuse/RequestTask.hpp"
#include "fs/Filesystem.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <utility>

namespace pfs::fuse {

Service::Service(fs::Filesystem& filesystem, std::filesystem::path mountPoint, config::FuseConfig cfg)
    : filesystem_(filesystem), mountPoint_(std::move(mountPoint)), cfg_(cfg), context_(filesystem) {
    context_.attrTimeout = cfg_.attr_timeout;
    context_.entryTimeout = cfg_.entry_timeout;
}

std::vector<std::string> Service::mountArgs() const {
    std::vector<std::string> args = {
        "permfs",
        "-f",
        "-o", "fsname=permfs:" + filesystem_.paths().root().string(),
        "-o", "subtype=permfs"
    };

    if (cfg_.allow_root) args.insert(args.end(), {"-o", "allow_root"});
    if (cfg_.allow_other) args.insert(args.end(), {"-o", "allow_other"});
    if (cfg_.default_permissions) args.insert(args.end(), {"-o", "default_permissions"});

    args.push_back(mountPoint_.string());
    return args;
}

bool Service::run() {
    const auto argsStr = mountArgs();

    std::vector<std::unique_ptr<char[]>> ownedCStrs;
    std::vector<char*> argsCStr;
    for (const auto& str : argsStr) {
        auto buf = std::make_unique<char[]>(str.size() + 1);
        std::memcpy(buf.get(), str.c_str(), str.size() + 1);
        argsCStr.push_back(buf.get());
        ownedCStrs.push_back(std::move(buf));
    }

    fuse_args args = FUSE_ARGS_INIT(static_cast<int>(argsCStr.size()), argsCStr.data());

    fuse_cmdline_opts opts{};
    if (fuse_parse_cmdline(&args, &opts) != 0) {
        log::Registry::fuse()->error("[Service] Failed to parse FUSE options");
        fuse_opt_free_args(&args);
        return false;
    }

    const fuse_lowlevel_ops ops = getOperations();

    session_ = fuse_session_new(&args, &ops, sizeof(ops), &context_);
    if (!session_) {
        log::Registry::fuse()->error("[Service] Failed to create FUSE session");
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        return false;
    }

    if (fuse_set_signal_handlers(session_) != 0) {
        log::Registry::fuse()->error("[Service] Failed to set signal handlers");
        fuse_session_destroy(session_);
        session_ = nullptr;
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        return false;
    }

    if (fuse_session_mount(session_, opts.mountpoint) != 0) {
        log::Registry::fuse()->error("[Service] Failed to mount FUSE filesystem at {}", opts.mountpoint);
        fuse_remove_signal_handlers(session_);
        fuse_session_destroy(session_);
        session_ = nullptr;
        free(opts.mountpoint);
        fuse_opt_free_args(&args);
        return false;
    }

    log::Registry::fuse()->info("[Service] Mounted {} at {} ({} worker thread(s))",
                                filesystem_.paths().root().string(), opts.mountpoint, cfg_.worker_threads);

    if (cfg_.worker_threads > 1) servePooled();
    else serveInline();

    log::Registry::fuse()->debug("[Service] Session loop exiting");

    fuse_session_unmount(session_);
    fuse_remove_signal_handlers(session_);

    // Runs the destroy callback, which persists the permission store
    fuse_session_destroy(session_);
    session_ = nullptr;

    free(opts.mountpoint);
    fuse_opt_free_args(&args);

    return !context_.persistFailed.load();
}

void Service::serveInline() {
    fuse_buf buf{};
    while (!fuse_session_exited(session_)) {
        const int res = fuse_session_receive_buf(session_, &buf);
        if (res == -EINTR) continue;
        if (res < 0) log::Registry::fuse()->error("[Service] Receive failed: {}", std::strerror(-res));
        if (res <= 0) break;

        fuse_session_process_buf(session_, &buf);
    }
    free(buf.mem);
}

void Service::servePooled() {
    concurrency::ThreadPool pool(cfg_.worker_threads);

    while (!fuse_session_exited(session_)) {
        fuse_buf buf{};
        const int res = fuse_session_receive_buf(session_, &buf);
        if (res == -EINTR) {
            free(buf.mem);
            continue;
        }
        if (res <= 0) {
            if (res < 0) log::Registry::fuse()->error("[Service] Receive failed: {}", std::strerror(-res));
            free(buf.mem);
            break;
        }

        pool.submit(std::make_shared<RequestTask>(session_, buf));
    }

    // In-flight requests finish before the session is torn down
    pool.stop();
}

}
