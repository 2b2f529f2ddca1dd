#pragma once

#include <cstdint>
#include <string>

namespace hmmdc {

// Inclusive range of 1-based sequence indices in the daemon's
// sequence database.
struct SeqdbRange {
    uint64_t start = 0;
    uint64_t end = 0;
};

inline bool validate_range(const SeqdbRange& r, std::string& error_msg) {
    if (r.start == 0) {
        error_msg = "seqdb range start must be >= 1";
        return false;
    }
    if (r.start > r.end) {
        error_msg = "seqdb range " + std::to_string(r.start) + ".." +
                    std::to_string(r.end) + " has start > end";
        return false;
    }
    return true;
}

} // namespace hmmdc
