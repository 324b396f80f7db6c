#pragma once

#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace pfs::perms {

struct Record {
    uid_t uid = 0;
    gid_t gid = 0;
    mode_t mode = 0;   // Full st_mode: file type bits + permission bits

    // Owner root and the real file's current mode: nothing is overridden.
    [[nodiscard]] bool isTrivialDefault(const mode_t realMode) const noexcept {
        return uid == 0 && gid == 0 && mode == realMode;
    }

    bool operator==(const Record&) const = default;
};

void to_json(nlohmann::json& j, const Record& r);
void from_json(const nlohmann::json& j, Record& r);

}
