#include "perms/Store.hpp"
#include "perms/CorruptMetadataError.hpp"
#include "log/Registry.hpp"
#include "util/sysCall.hpp"

#include <cerrno>
#include <cstdint>
#include <fcntl.h>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <unistd.h>
#include <utility>
#include <nlohmann/json.hpp>

namespace {

template <typename T>
T unsignedField(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) throw std::invalid_argument(std::string("missing field '") + key + "'");

    const auto& v = j.at(key);
    if (!v.is_number_unsigned()) throw std::invalid_argument(std::string("field '") + key + "' is not a non-negative integer");

    const auto raw = v.get<std::uint64_t>();
    if (raw > std::numeric_limits<T>::max()) throw std::invalid_argument(std::string("field '") + key + "' is out of range");
    return static_cast<T>(raw);
}

int lastErrnoOr(const int fallback) { return errno != 0 ? errno : fallback; }

// Closes on scope exit unless release()d
class FdGuard {
public:
    explicit FdGuard(const int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    int release() { return std::exchange(fd_, -1); }

private:
    int fd_;
};

// Writes and fsyncs the whole buffer so a later rename() never exposes a short file.
void writeDurably(const std::filesystem::path& path, const std::string& bytes) {
    FdGuard fd(pfs::util::checkSys(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644), "open", path));

    std::size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = ::write(fd.get(), bytes.data() + written, bytes.size() - written);
        if (n < 0 && errno == EINTR) continue;
        written += static_cast<std::size_t>(pfs::util::checkSys(n, "write", path));
    }

    pfs::util::checkSys(::fsync(fd.get()), "fsync", path);
    pfs::util::checkSys(::close(fd.release()), "close", path);
}

void syncDirectory(const std::filesystem::path& dir) {
    const FdGuard fd(pfs::util::checkSys(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC), "open", dir));
    pfs::util::checkSys(::fsync(fd.get()), "fsync", dir);
}

// Keys that are not valid UTF-8 cannot be JSON strings; they are stored as "hex:" + the path bytes in hex.
// Virtual paths always start with '/', so the prefix never collides with a verbatim key.
constexpr std::string_view HEX_KEY_PREFIX = "hex:";

bool isUtf8(const std::string& s) {
    try {
        (void)nlohmann::json(s).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

std::string encodeKey(const std::string& path) {
    if (isUtf8(path)) return path;

    static constexpr char digits[] = "0123456789abcdef";
    std::string out(HEX_KEY_PREFIX);
    out.reserve(HEX_KEY_PREFIX.size() + path.size() * 2);
    for (const unsigned char c : path) {
        out.push_back(digits[c >> 4]);
        out.push_back(digits[c & 0x0f]);
    }
    return out;
}

int hexValue(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Inverse of encodeKey(). Throws std::invalid_argument for anything that is not a virtual path.
std::string decodeKey(const std::string& key) {
    if (!key.empty() && key.front() == '/') return key;
    if (!key.starts_with(HEX_KEY_PREFIX)) throw std::invalid_argument("key '" + key + "' is not an absolute virtual path");

    const std::string_view hex = std::string_view(key).substr(HEX_KEY_PREFIX.size());
    if (hex.size() % 2 != 0) throw std::invalid_argument("key '" + key + "' has an odd number of hex digits");

    std::string path;
    path.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hexValue(hex[i]);
        const int lo = hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) throw std::invalid_argument("key '" + key + "' is not valid hex");
        path.push_back(static_cast<char>((hi << 4) | lo));
    }

    if (path.empty() || path.front() != '/') throw std::invalid_argument("key '" + key + "' does not decode to an absolute virtual path");
    return path;
}

}

namespace pfs::perms {

void to_json(nlohmann::json& j, const Record& r) {
    j = {
        {"uid", r.uid},
        {"gid", r.gid},
        {"mode", r.mode}
    };
}

void from_json(const nlohmann::json& j, Record& r) {
    if (!j.is_object()) throw std::invalid_argument("record is not an object");
    r.uid = unsignedField<uid_t>(j, "uid");
    r.gid = unsignedField<gid_t>(j, "gid");
    r.mode = unsignedField<mode_t>(j, "mode");
}

std::unique_ptr<Store> Store::load(const std::filesystem::path& sidecar) {
    auto store = std::make_unique<Store>();

    std::error_code ec;
    if (!std::filesystem::exists(sidecar, ec)) {
        if (ec) throw std::system_error(ec, "Failed to stat " + sidecar.string());
        log::Registry::perms()->info("[Store] No sidecar at {}, starting with an empty permission set", sidecar.string());
        return store;
    }

    errno = 0;
    std::ifstream in(sidecar);
    if (!in.is_open()) throw std::system_error(lastErrnoOr(EIO), std::generic_category(), "Failed to open " + sidecar.string());

    nlohmann::json root;
    try {
        root = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw CorruptMetadataError(sidecar, e.what());
    }

    if (!root.is_object()) throw CorruptMetadataError(sidecar, "top level is not an object");

    for (const auto& [key, value] : root.items()) {
        try {
            store->records_.emplace(decodeKey(key), value.get<Record>());
        } catch (const std::invalid_argument& e) {
            throw CorruptMetadataError(sidecar, "entry '" + key + "': " + e.what());
        }
    }

    log::Registry::perms()->info("[Store] Loaded {} permission overrides from {}", store->records_.size(), sidecar.string());
    return store;
}

Record Store::lookupOrInit(const std::string& virtualPath, const mode_t realMode) {
    std::scoped_lock lock(mutex_);
    const auto [it, inserted] = records_.try_emplace(virtualPath, Record{0, 0, realMode});
    if (inserted) log::Registry::perms()->trace("[Store] Seeded default record for {} (mode {:o})", virtualPath, realMode);
    return it->second;
}

void Store::setChown(const std::string& virtualPath, const uid_t uid, const gid_t gid, const mode_t realModeIfAbsent) {
    std::scoped_lock lock(mutex_);
    if (const auto it = records_.find(virtualPath); it != records_.end()) {
        it->second.uid = uid;
        it->second.gid = gid;
        return;
    }
    records_.emplace(virtualPath, Record{uid, gid, realModeIfAbsent});
}

void Store::setChmod(const std::string& virtualPath, const mode_t mode, const uid_t defaultUid, const gid_t defaultGid) {
    std::scoped_lock lock(mutex_);
    if (const auto it = records_.find(virtualPath); it != records_.end()) {
        it->second.mode = mode;
        return;
    }
    records_.emplace(virtualPath, Record{defaultUid, defaultGid, mode});
}

std::optional<Record> Store::find(const std::string& virtualPath) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = records_.find(virtualPath); it != records_.end()) return it->second;
    return std::nullopt;
}

std::size_t Store::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

nlohmann::json Store::prunedLocked(const RealModeLookup& realModeLookup) const {
    auto out = nlohmann::json::object();
    for (const auto& [path, record] : records_) {
        const auto realMode = realModeLookup(path);
        if (realMode && record.isTrivialDefault(*realMode)) continue;
        out[encodeKey(path)] = record;
    }
    return out;
}

std::string Store::serializePruned(const RealModeLookup& realModeLookup) const {
    std::scoped_lock lock(mutex_);
    return prunedLocked(realModeLookup).dump();
}

void Store::persist(const std::filesystem::path& sidecar, const RealModeLookup& realModeLookup) const {
    nlohmann::json pruned;
    std::size_t total = 0;
    {
        std::scoped_lock lock(mutex_);
        pruned = prunedLocked(realModeLookup);
        total = records_.size();
    }

    if (pruned.empty()) {
        std::error_code ec;
        if (std::filesystem::remove(sidecar, ec))
            log::Registry::perms()->info("[Store] No overrides left, removed {}", sidecar.string());
        if (ec) throw std::system_error(ec, "Failed to remove stale sidecar " + sidecar.string());
        return;
    }

    auto tmp = sidecar;
    tmp += ".tmp";

    writeDurably(tmp, pruned.dump());
    std::filesystem::rename(tmp, sidecar);
    syncDirectory(sidecar.parent_path());

    log::Registry::perms()->info("[Store] Persisted {} of {} permission records to {}",
                                 pruned.size(), total, sidecar.string());
}

}
