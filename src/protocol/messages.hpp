#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace hmmdc {

// Status codes reported in the status header. 0 is success; the others
// are the daemon's failure codes. Values above kEInaccurate are not
// part of the protocol.
enum class StatusCode : uint32_t {
    kOk             = 0,
    kFail           = 1,
    kEol            = 2,
    kEof            = 3,
    kEod            = 4,
    kEMem           = 5,
    kENotFound      = 6,
    kEFormat        = 7,
    kEAmbiguous     = 8,
    kEDivZero       = 9,
    kEIncompat      = 10,
    kEInval         = 11,
    kESys           = 12,
    kECorrupt       = 13,
    kEInconceivable = 14,
    kESyntax        = 15,
    kERange         = 16,
    kEDup           = 17,
    kENoHalt        = 18,
    kENoResult      = 19,
    kENoData        = 20,
    kEType          = 21,
    kEOverwrite     = 22,
    kENoSpace       = 23,
    kEUnimplemented = 24,
    kENoFormat      = 25,
    kENoAlphabet    = 26,
    kEWrite         = 27,
    kEInaccurate    = 28,
};

bool is_known_status(uint32_t code);

// Symbolic name of a status code ("OK", "EINVAL", ...); "UNKNOWN" if
// the code is outside the enumeration.
const char* status_name(uint32_t code);

// Status header (server -> client), first record of every response.
struct SearchStatus {
    uint32_t status = 0;
    uint64_t msg_size = 0;  // payload size on success, message size on error
};

// Statistics block (server -> client), head of a success payload.
struct SearchStats {
    double elapsed = 0.0;
    double user = 0.0;
    double sys = 0.0;
    double Z = 0.0;
    double domZ = 0.0;
    ZSetBy Z_setby = ZSetBy::kNTargets;
    ZSetBy domZ_setby = ZSetBy::kNTargets;
    uint64_t nmodels = 0;
    uint64_t nnodes = 0;
    uint64_t nseqs = 0;
    uint64_t nres = 0;
    uint64_t n_past_msv = 0;
    uint64_t n_past_bias = 0;
    uint64_t n_past_vit = 0;
    uint64_t n_past_fwd = 0;
    uint64_t nhits = 0;
    uint64_t nreported = 0;
    uint64_t nincluded = 0;
    std::vector<uint64_t> hit_offsets;  // nhits entries
};

} // namespace hmmdc
