#pragma once

#include <cstddef>

namespace rcs::sync::model {

struct BankResult {
    size_t considered = 0;
    size_t copied = 0;
    size_t skipped = 0;
    size_t removed = 0;
    size_t errored = 0;
};

// Run-level counters, emitted once when the run ends.
struct SyncReport {
    bool noData = false;  // device root had no slot-like entries
    size_t total = 0;
    size_t copied = 0;
    size_t skipped = 0;
    size_t removed = 0;
    size_t errored = 0;
    size_t banksChanged = 0;
    size_t banksSkipped = 0;

    SyncReport& operator+=(const BankResult& r) {
        total += r.considered;
        copied += r.copied;
        skipped += r.skipped;
        removed += r.removed;
        errored += r.errored;
        return *this;
    }
};

struct RestoreResult {
    unsigned int bank = 0;
    size_t restored = 0;
    size_t errored = 0;
    bool cancelled = false;
};

}
