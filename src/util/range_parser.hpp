#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "result/seqdb_range.hpp"

namespace hmmdc {

// Parse a -seqdb_ranges value "a..b,c..d".
// Each item must be two unsigned integers joined by "..", with 1 <= a <= b.
// An empty string yields an empty list.
// Returns false and sets error_msg on malformed input.
inline bool parse_seqdb_ranges(const std::string& value,
                               std::vector<SeqdbRange>& out,
                               std::string& error_msg) {
    out.clear();
    if (value.empty()) return true;

    auto parse_bound = [](const std::string& s, uint64_t& v) {
        if (s.empty() || s.size() > 19) return false;
        v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
            v = v * 10 + static_cast<uint64_t>(c - '0');
        }
        return true;
    };

    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        std::string item = value.substr(pos, comma - pos);

        size_t dots = item.find("..");
        if (dots == std::string::npos || item.find("..", dots + 2) != std::string::npos) {
            error_msg = "seqdb range '" + item + "' is not of the form a..b";
            return false;
        }
        SeqdbRange r;
        if (!parse_bound(item.substr(0, dots), r.start) ||
            !parse_bound(item.substr(dots + 2), r.end)) {
            error_msg = "seqdb range '" + item + "' has a non-integer bound";
            return false;
        }
        std::string why;
        if (!validate_range(r, why)) {
            error_msg = why;
            return false;
        }
        out.push_back(r);
        pos = comma + 1;
    }
    return true;
}

} // namespace hmmdc
