#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bank/Slot.hpp"

namespace rcs::bank {

// slotName -> bank for every slot-like entry on the device, computed once per run.
class SlotIndex {
public:
    SlotIndex() = default;

    // Lists the directory entries of deviceRoot. Malformed names and slots
    // outside banks 1..8 are skipped.
    static SlotIndex fromDevice(const std::filesystem::path& deviceRoot);
    static SlotIndex fromNames(const std::vector<std::string>& names);

    // Returns false when name was skipped.
    bool add(const std::string& name);

    [[nodiscard]] bool empty() const { return banks_.empty(); }
    [[nodiscard]] size_t size() const { return banks_.size(); }
    [[nodiscard]] bool contains(const std::string& slotName) const { return banks_.contains(slotName); }
    [[nodiscard]] std::optional<unsigned int> bankOf(const std::string& slotName) const;

    // Slots of one bank, sorted by name. Empty for banks outside 1..8.
    [[nodiscard]] const std::vector<std::string>& slotsIn(unsigned int bank) const;

private:
    std::unordered_map<std::string, unsigned int> banks_;
    std::array<std::vector<std::string>, BANK_COUNT> byBank_{};
    std::vector<std::string> none_{};
};

}
