#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rcs::bank {

constexpr unsigned int SLOTS_PER_BANK = 8;
constexpr unsigned int BANK_COUNT = 8;

// One recording location on the device, encoded on disk as NNN_K.
struct Slot {
    unsigned int number = 0;     // 1-based
    unsigned int alternate = 1;  // 1 or 2
    std::string name;            // as it appears on disk, e.g. "009_1"

    // Throws sync::Error(MalformedSlotName).
    static Slot parse(std::string_view name);
    static std::optional<Slot> tryParse(std::string_view name);

    [[nodiscard]] unsigned int bank() const { return (number - 1) / SLOTS_PER_BANK + 1; }
};

// Bank of a slot name. Leading zeros are ignored: "009_1" and "9_1" map to bank 2.
unsigned int bankOf(std::string_view slotName);

[[nodiscard]] inline bool isValidBank(const unsigned int bank) { return bank >= 1 && bank <= BANK_COUNT; }

// "bank_3"
std::string bankDirName(unsigned int bank);

}
