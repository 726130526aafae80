#include "bank/SlotIndex.hpp"
#include "fs/ops.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace rcs::bank;
using namespace rcs::log;

SlotIndex SlotIndex::fromDevice(const std::filesystem::path& deviceRoot) {
    return fromNames(fs::ops::listNames(deviceRoot, fs::ops::EntryType::Directory));
}

SlotIndex SlotIndex::fromNames(const std::vector<std::string>& names) {
    SlotIndex index;
    for (const auto& name : names) index.add(name);
    return index;
}

bool SlotIndex::add(const std::string& name) {
    if (banks_.contains(name)) return true;

    const auto slot = Slot::tryParse(name);
    if (!slot) {
        Registry::sync()->debug("Ignoring non-slot entry '{}'", name);
        return false;
    }

    const auto bank = slot->bank();
    if (!isValidBank(bank)) {
        Registry::sync()->warn("Slot {} maps to bank {}, outside 1..{}; ignoring", name, bank, BANK_COUNT);
        return false;
    }

    banks_.emplace(name, bank);
    auto& slots = byBank_[bank - 1];
    slots.insert(std::ranges::upper_bound(slots, name), name);
    return true;
}

std::optional<unsigned int> SlotIndex::bankOf(const std::string& slotName) const {
    if (const auto it = banks_.find(slotName); it != banks_.end()) return it->second;
    return std::nullopt;
}

const std::vector<std::string>& SlotIndex::slotsIn(const unsigned int bank) const {
    if (!isValidBank(bank)) return none_;
    return byBank_[bank - 1];
}
