#pragma once

#include <optional>
#include <string>

namespace rcs::sync::model {

enum class Action {
    None,
    Apply,
    Export,
    Revert,
    Skip,
};

struct Decision {
    Action action{Action::None};
    std::optional<std::string> exportName{};  // only meaningful for Export
};

std::string to_string(Action action);

}
