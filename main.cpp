#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "fs/Filesystem.hpp"
#include "fuse/Service.hpp"
#include "perms/CorruptMetadataError.hpp"
#include "perms/Store.hpp"
#include "util/paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

using namespace pfs;

namespace {

bool isDirectory(const char* what, const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return true;
    std::cerr << "permfs: " << what << " '" << path.string() << "' is not an existing directory";
    if (ec) std::cerr << " (" << ec.message() << ")";
    std::cerr << std::endl;
    return false;
}

}

int main(const int argc, char* argv[]) {
    if (argc != 3) {
        std::cerr << "Usage: " << (argc > 0 ? argv[0] : "permfs") << " SRC_FOLDER MOUNT_POINT" << std::endl;
        return EXIT_FAILURE;
    }

    const std::filesystem::path source = argv[1];
    const std::filesystem::path mountPoint = argv[2];
    if (!isDirectory("source folder", source) || !isDirectory("mount point", mountPoint)) return EXIT_FAILURE;

    try {
        config::ConfigRegistry::init(paths::getConfigPath());
        log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "permfs: failed to load configuration: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        fs::Filesystem filesystem(source);
        filesystem.init();

        log::Registry::permfs()->info("[*] Mounting {} at {} ({} permission overrides loaded)",
                                      filesystem.paths().root().string(), mountPoint.string(), filesystem.store().size());

        pfs::fuse::Service service(filesystem, mountPoint, config::ConfigRegistry::get().fuse);
        const bool ok = service.run();

        log::Registry::permfs()->info("FS unmounted");
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const perms::CorruptMetadataError& e) {
        log::Registry::permfs()->critical("[-] Refusing to mount: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        log::Registry::permfs()->error("[-] Failed to run permfs: {}", e.what());
        return EXIT_FAILURE;
    }
}
