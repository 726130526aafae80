#pragma once

#include "shell/IO.hpp"

#include <deque>
#include <stdexcept>
#include <string>
#include <vector>

namespace rcs::test {

// Answers prompts from a fixed script. Running out of answers behaves like a closed stdin.
class ScriptedIO final : public shell::IO {
public:
    explicit ScriptedIO(std::deque<std::string> answers = {}) : answers_(std::move(answers)) {}

    void print(const std::string_view s) override { output += s; }

    bool confirm(const std::string_view p, const bool def_no) override {
        prompts.emplace_back(p);
        const auto v = next();
        if (v.empty()) return !def_no;
        return v == "y" || v == "yes";
    }

    std::string prompt(const std::string_view p, const std::string_view def) override {
        prompts.emplace_back(p);
        auto v = next();
        return v.empty() ? std::string(def) : v;
    }

    [[nodiscard]] size_t remaining() const { return answers_.size(); }

    std::string output;
    std::vector<std::string> prompts;

private:
    std::deque<std::string> answers_;

    std::string next() {
        if (answers_.empty()) throw std::runtime_error("ScriptedIO: no answer left");
        auto v = std::move(answers_.front());
        answers_.pop_front();
        return v;
    }
};

}
