#pragma once

#include "sync/Resolver.hpp"
#include "sync/Scanner.hpp"
#include "sync/Transformer.hpp"
#include "sync/model/Report.hpp"

namespace rcs::shell {
struct IO;
}

namespace rcs::sync {

// One sync run: each bank is scanned, decided and transformed before the next one starts.
class Controller {
public:
    Controller(const model::Layout& layout, shell::IO& io, uintmax_t prefixBytes);

    model::SyncReport run() const;

    static void logSummary(const model::SyncReport& report);

private:
    model::Layout layout_;
    Scanner scanner_;
    Resolver resolver_;
    Transformer transformer_;
};

}
