#include "sync/Resolver.hpp"
#include "sync/Error.hpp"
#include "bank/SlotIndex.hpp"
#include "fs/ops.hpp"
#include "shell/IO.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>

using namespace rcs::sync;
using namespace rcs::sync::model;
using namespace rcs::bank;
using namespace rcs::log;

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::ranges::find(v, s) != v.end();
}

std::string line(const bool colors, const std::optional<fmt::terminal_color> color, const std::string_view verb, const std::string& file) {
    if (colors && color) return fmt::format(fmt::fg(*color), "{}: {}", verb, file) + "\n";
    return fmt::format("{}: {}\n", verb, file);
}

}

Resolver::Resolver(Layout layout, shell::IO& io)
    : layout_(std::move(layout)), io_(io) {}

Decision Resolver::resolve(const ChangeSet& cs, const SlotIndex& index) const {
    if (!cs.hasChanges()) return {Action::None};

    const auto bankName = bankDirName(cs.bank);

    if (cs.onlyAdditions()) {
        Registry::sync()->info("Processing new files for {}", bankName);
        return {Action::Apply};
    }

    io_.print(fmt::format("\nChanges detected in {}:\n", bankName));
    io_.print(renderDiff(cs, index, io_.colors()));

    const auto question = fmt::format(
        "\nChoose action for {}: [E]xport then apply (default), [A]pply, [R]evert, [S]kip: ", bankName);

    while (true) {
        Action choice;
        try {
            choice = parseChoice(io_.prompt(question, ""));
        } catch (const Error& e) {
            if (e.kind() != ErrorKind::InvalidPromptInput) throw;
            io_.print(std::string(e.what()) + "\n");
            continue;
        }

        switch (choice) {
            case Action::Skip:
                Registry::sync()->warn("Skipping changes for {}", bankName);
                return {Action::Skip};
            case Action::Apply:
                return {Action::Apply};
            case Action::Export:
                return {Action::Export, promptExportName(cs.bank)};
            case Action::Revert:
                if (confirmRevert(cs.bank)) return {Action::Revert};
                io_.print("Revert cancelled.\n");
                continue;
            case Action::None:
                break;
        }
    }
}

std::string Resolver::renderDiff(const ChangeSet& cs, const SlotIndex& index, const bool colors) const {
    std::string out;

    for (const auto& slot : cs.deleted)
        out += line(colors, fmt::terminal_color::red, "delete", layout_.trackFileName(slot));

    for (const auto& slot : index.slotsIn(cs.bank)) {
        const auto file = layout_.trackFileName(slot);
        if (contains(cs.added, slot)) out += line(colors, fmt::terminal_color::green, "copy", file);
        else if (contains(cs.modified, slot)) out += line(colors, fmt::terminal_color::yellow, "replace", file);
        else if (fs::ops::isFile(layout_.deviceFile(slot))) out += line(colors, std::nullopt, "keep", file);
    }

    return out;
}

Action Resolver::parseChoice(const std::string_view input) {
    const auto v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(input)));
    if (v.empty() || v == "e" || v == "export") return Action::Export;
    if (v == "a" || v == "apply") return Action::Apply;
    if (v == "r" || v == "revert") return Action::Revert;
    if (v == "s" || v == "skip") return Action::Skip;
    throw Error(ErrorKind::InvalidPromptInput, "Invalid choice '" + std::string(input) + "', expected e, a, r or s");
}

bool Resolver::isValidExportName(const std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return std::ranges::none_of(name, [](const char c) { return c == '/' || c == '\\' || c == '\0'; });
}

bool Resolver::confirmRevert(const unsigned int bank) const {
    const auto answer = io_.prompt(fmt::format(
        "Revert overwrites {} on the device with the backup copy. Type 'yes' to continue: ",
        bankDirName(bank)), "");
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(answer)) == "yes";
}

std::string Resolver::promptExportName(const unsigned int bank) const {
    const auto def = Layout::defaultExportName(bank);
    while (true) {
        auto name = boost::algorithm::trim_copy(io_.prompt(fmt::format("Export name [{}]: ", def), def));
        if (name.empty()) return def;
        if (isValidExportName(name)) return name;
        io_.print("Export names cannot contain path separators.\n");
    }
}
