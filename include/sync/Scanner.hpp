#pragma once

#include "bank/SlotIndex.hpp"
#include "sync/Comparator.hpp"
#include "sync/model/ChangeSet.hpp"
#include "sync/model/Layout.hpp"

#include <map>

namespace rcs::sync {

struct ScanResult {
    bank::SlotIndex index;
    std::map<unsigned int, model::ChangeSet> banks;  // 1..8, empty change sets included

    // No slot-like entries on the device at all. Distinct from banks without changes.
    [[nodiscard]] bool noData() const { return index.empty(); }
};

class Scanner {
public:
    Scanner(model::Layout layout, Comparator comparator);

    // Lists the device once and scans every bank against that listing.
    [[nodiscard]] ScanResult scan() const;

    [[nodiscard]] bank::SlotIndex indexDevice() const;

    [[nodiscard]] model::ChangeSet scanBank(unsigned int bank, const bank::SlotIndex& index) const;

private:
    model::Layout layout_;
    Comparator comparator_;
};

}
