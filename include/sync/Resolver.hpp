#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/ChangeSet.hpp"
#include "sync/model/Layout.hpp"

#include <string>
#include <string_view>

namespace rcs::bank {
class SlotIndex;
}

namespace rcs::shell {
struct IO;
}

namespace rcs::sync {

// Turns a bank's ChangeSet into an action. Pure additions are applied without
// asking; everything else is reviewed through the IO.
class Resolver {
public:
    Resolver(model::Layout layout, shell::IO& io);

    [[nodiscard]] model::Decision resolve(const model::ChangeSet& cs, const bank::SlotIndex& index) const;

    // delete:/copy:/replace:/keep: lines, one per slot of the bank.
    [[nodiscard]] std::string renderDiff(const model::ChangeSet& cs, const bank::SlotIndex& index, bool colors) const;

    // Empty input selects Export. Throws sync::Error(InvalidPromptInput).
    static model::Action parseChoice(std::string_view input);

    // A snapshot name must be a single plain path component.
    [[nodiscard]] static bool isValidExportName(std::string_view name);

private:
    model::Layout layout_;
    shell::IO& io_;

    [[nodiscard]] bool confirmRevert(unsigned int bank) const;
    [[nodiscard]] std::string promptExportName(unsigned int bank) const;
};

}
