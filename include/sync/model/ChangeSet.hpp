#pragma once

#include <string>
#include <vector>

namespace rcs::sync::model {

// Per-bank scan result. The three sets are disjoint; unchanged slots are not recorded.
struct ChangeSet {
    unsigned int bank = 0;
    std::vector<std::string> added;     // on the device, no backup counterpart
    std::vector<std::string> modified;  // both sides, contents differ
    std::vector<std::string> deleted;   // in the backup, gone from the device

    [[nodiscard]] bool hasChanges() const { return !added.empty() || !modified.empty() || !deleted.empty(); }
    [[nodiscard]] bool onlyAdditions() const { return !added.empty() && modified.empty() && deleted.empty(); }
    [[nodiscard]] size_t size() const { return added.size() + modified.size() + deleted.size(); }
};

}
