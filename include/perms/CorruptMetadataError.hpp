#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace pfs::perms {

// The sidecar exists but cannot be trusted; the mount must not proceed.
class CorruptMetadataError : public std::runtime_error {
public:
    CorruptMetadataError(const std::filesystem::path& sidecar, const std::string& reason)
        : std::runtime_error("Corrupt permission metadata in " + sidecar.string() + ": " + reason),
          sidecar_(sidecar) {}

    [[nodiscard]] const std::filesystem::path& sidecar() const noexcept { return sidecar_; }

private:
    std::filesystem::path sidecar_;
};

}
