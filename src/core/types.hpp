#pragma once

#include <cstdint>

namespace hmmdc {

// Which kind of database a request targets.
// kSearch: query against the sequence database (--seqdb).
// kScan:   sequence against the profile database (--hmmdb).
enum class SearchMode : uint8_t {
    kSearch = 0,
    kScan   = 1,
};

enum class Alphabet : uint8_t {
    kUnknown = 0,
    kAmino   = 1,
    kDna     = 2,
    kRna     = 3,
};

// How an effective database size (Z or domZ) was determined
enum class ZSetBy : uint8_t {
    kNTargets = 0,  // counted from the searched targets
    kOption   = 1,  // given explicitly by the caller
    kFileInfo = 2,  // taken from database metadata
};

enum class SortBy : uint8_t {
    kKey    = 0,  // descending sort key (score or significance)
    kSeqidx = 1,  // ascending target index, then subsequence start
};

const char* alphabet_name(Alphabet a);
const char* search_mode_name(SearchMode m);
const char* zsetby_name(ZSetBy z);

} // namespace hmmdc
