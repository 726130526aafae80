#pragma once

#include <string>
#include <string_view>

namespace rcs::shell {

// Interactive decision source. The sync core only talks to the user through this.
struct IO {
    virtual ~IO() = default;
    virtual void print(std::string_view s) = 0;
    virtual bool confirm(std::string_view prompt, bool def_no) = 0;
    virtual std::string prompt(std::string_view prompt, std::string_view def) = 0;

    // Whether ANSI colors may be written through print().
    [[nodiscard]] virtual bool colors() const { return false; }
};

class TerminalIO final : public IO {
public:
    TerminalIO();

    void print(std::string_view msg) override;
    bool confirm(std::string_view promptIn, bool def_no) override;
    std::string prompt(std::string_view promptIn, std::string_view def) override;

    [[nodiscard]] bool colors() const override { return tty_; }

private:
    bool tty_;

    std::string readLine();
};

}
