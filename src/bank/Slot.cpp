#include "bank/Slot.hpp"
#include "sync/Error.hpp"

#include <regex>

using namespace rcs::bank;
using namespace rcs::sync;

std::optional<Slot> Slot::tryParse(const std::string_view name) {
    static const std::regex pattern(R"(^([0-9]{1,9})_([12])$)");

    const std::string s(name);
    std::smatch m;
    if (!std::regex_match(s, m, pattern)) return std::nullopt;

    Slot slot;
    slot.number = static_cast<unsigned int>(std::stoul(m[1].str()));
    slot.alternate = static_cast<unsigned int>(std::stoul(m[2].str()));
    slot.name = s;

    if (slot.number == 0) return std::nullopt;
    return slot;
}

Slot Slot::parse(const std::string_view name) {
    auto slot = tryParse(name);
    if (!slot) throw Error(ErrorKind::MalformedSlotName, "Malformed slot name: '" + std::string(name) + "'");
    return *slot;
}

unsigned int rcs::bank::bankOf(const std::string_view slotName) { return Slot::parse(slotName).bank(); }

std::string rcs::bank::bankDirName(const unsigned int bank) { return "bank_" + std::to_string(bank); }
