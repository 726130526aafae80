#include "sync/model/Action.hpp"

std::string rcs::sync::model::to_string(const Action action) {
    switch (action) {
        case Action::None: return "none";
        case Action::Apply: return "apply";
        case Action::Export: return "export";
        case Action::Revert: return "revert";
        case Action::Skip: return "skip";
    }
    return "unknown";
}
