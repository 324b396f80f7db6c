#pragma once

#include "perms/Record.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pfs::perms {

inline constexpr const auto* SIDECAR_FILENAME = ".fs_perm_remapper.json";

// Real mode of a virtual path at persist time; std::nullopt when the path no longer exists.
using RealModeLookup = std::function<std::optional<mode_t>(const std::string& virtualPath)>;

/// Emulated ownership/mode overrides keyed by virtual path. One instance per mount;
/// every read-modify-write runs under the store mutex.
class Store {
public:
    Store() = default;

    /// Empty store when the sidecar is absent. Throws CorruptMetadataError when it exists
    /// but does not parse into path -> {uid, gid, mode}.
    static std::unique_ptr<Store> load(const std::filesystem::path& sidecar);

    /// Returns the record for the path, inserting {0, 0, realMode} first if there is none.
    /// Mutates the store on first observation of a path.
    Record lookupOrInit(const std::string& virtualPath, mode_t realMode);

    /// Updates uid/gid only; a new record takes its mode from realModeIfAbsent.
    void setChown(const std::string& virtualPath, uid_t uid, gid_t gid, mode_t realModeIfAbsent);

    /// Updates mode only; a new record takes the default owner.
    void setChmod(const std::string& virtualPath, mode_t mode, uid_t defaultUid = 0, gid_t defaultGid = 0);

    [[nodiscard]] std::optional<Record> find(const std::string& virtualPath) const;
    [[nodiscard]] std::size_t size() const;

    /// JSON object of every record that is not a trivial default. Keys are emitted sorted,
    /// so unchanged state serializes to identical bytes.
    [[nodiscard]] std::string serializePruned(const RealModeLookup& realModeLookup) const;

    /// Atomically replaces the sidecar with serializePruned(). When nothing survives pruning
    /// no sidecar is left behind. Throws std::system_error on I/O failure.
    void persist(const std::filesystem::path& sidecar, const RealModeLookup& realModeLookup) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> records_;

    [[nodiscard]] nlohmann::json prunedLocked(const RealModeLookup& realModeLookup) const;
};

}
