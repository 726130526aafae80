#include "shell/IO.hpp"

#include <boost/algorithm/string.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace rcs::shell;

TerminalIO::TerminalIO() : tty_(isatty(STDOUT_FILENO) != 0) {}

void TerminalIO::print(const std::string_view msg) {
    std::cout << msg << std::flush;
}

std::string TerminalIO::readLine() {
    std::string line;
    if (!std::getline(std::cin, line)) throw std::runtime_error("Input closed while waiting for an answer");
    boost::algorithm::trim(line);
    return line;
}

bool TerminalIO::confirm(const std::string_view promptIn, const bool def_no) {
    while (true) {
        std::cout << promptIn << (def_no ? " (y/N) " : " (Y/n) ") << std::flush;
        const auto v = boost::algorithm::to_lower_copy(readLine());
        if (v == "y" || v == "yes") return true;
        if (v == "n" || v == "no") return false;
        if (v.empty()) return !def_no;
    }
}

std::string TerminalIO::prompt(const std::string_view promptIn, const std::string_view def) {
    std::cout << promptIn << std::flush;
    auto v = readLine();
    if (v.empty()) return std::string{def};
    return v;
}
