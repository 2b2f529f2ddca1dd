#include "core/types.hpp"

namespace hmmdc {

const char* alphabet_name(Alphabet a) {
    switch (a) {
        case Alphabet::kAmino: return "amino";
        case Alphabet::kDna:   return "dna";
        case Alphabet::kRna:   return "rna";
        default:               return "unknown";
    }
}

const char* search_mode_name(SearchMode m) {
    return (m == SearchMode::kScan) ? "scan" : "search";
}

const char* zsetby_name(ZSetBy z) {
    switch (z) {
        case ZSetBy::kOption:   return "option";
        case ZSetBy::kFileInfo: return "fileinfo";
        default:                return "ntargets";
    }
}

} // namespace hmmdc
