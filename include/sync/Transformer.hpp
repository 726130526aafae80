#pragma once

#include "sync/Comparator.hpp"
#include "sync/model/Action.hpp"
#include "sync/model/ChangeSet.hpp"
#include "sync/model/Layout.hpp"
#include "sync/model/Report.hpp"

#include <optional>
#include <string>

namespace rcs::bank {
class SlotIndex;
}

namespace rcs::sync {

// Owns every filesystem mutation of a sync run. Never prompts.
class Transformer {
public:
    Transformer(model::Layout layout, Comparator comparator);

    model::BankResult run(const model::ChangeSet& cs, const bank::SlotIndex& index, const model::Decision& decision) const;

    // Makes the backup match the device. Differences are re-checked here
    // rather than trusted from the ChangeSet.
    model::BankResult apply(const model::ChangeSet& cs, const bank::SlotIndex& index) const;

    // Snapshots bank_<N> under exports/, empties it, then applies.
    model::BankResult exportThenApply(const model::ChangeSet& cs, const bank::SlotIndex& index,
                                      const std::string& exportName) const;

    // Makes the device match the backup.
    model::BankResult revert(const model::ChangeSet& cs, const bank::SlotIndex& index) const;

    // Picks a snapshot name that does not exist yet.
    [[nodiscard]] std::string uniqueExportName(const std::string& requested) const;

private:
    model::Layout layout_;
    Comparator comparator_;

    void removeOrphans(unsigned int bank, model::BankResult& result) const;

    // Returns false when the snapshot could not be written; the bank must then be left alone.
    bool snapshot(unsigned int bank, const std::string& exportName, model::BankResult& result) const;
};

}
