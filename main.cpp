#include "shell/Router.hpp"
#include "shell/IO.hpp"

#include <iostream>

using namespace rcs::shell;

int main(int argc, char** argv) {
    try {
        TerminalIO io;
        const Router router(io);
        const auto result = router.execute({argv + 1, argv + argc});

        if (!result.stdout_text.empty()) std::cout << result.stdout_text << std::flush;
        if (!result.stderr_text.empty()) std::cerr << result.stderr_text << std::endl;
        return result.exit_code;
    } catch (const std::exception& e) {
        std::cerr << "[rcsync] Fatal: " << e.what() << std::endl;
        return 1;
    }
}
