#pragma once

#include <cstddef>
#include <cstdint>

namespace hmmdc {

// Binary layout of the daemon protocol, version 1.
//
// Every record starts with a fixed-size block whose fields are listed
// below as (name, offset, type). All integers are big-endian; f32/f64
// carry the big-endian image of the IEEE-754 bit pattern. Variable
// parts (NUL-terminated strings, nested records, offset tables) follow
// the fixed block and are described next to each table.

enum class WireType : uint8_t { kU8, kU32, kI32, kU64, kI64, kF32, kF64 };

inline constexpr uint32_t wire_width(WireType t) {
    switch (t) {
        case WireType::kU8:  return 1;
        case WireType::kU32:
        case WireType::kI32:
        case WireType::kF32: return 4;
        default:             return 8;
    }
}

struct WireField {
    const char* name;
    uint32_t    offset;
    WireType    type;
};

// True if the fields tile [0, total) in order with no gaps or overlaps.
template <size_t N>
inline constexpr bool wire_fields_contiguous(const WireField (&fields)[N], size_t total) {
    uint32_t expect = 0;
    for (size_t i = 0; i < N; i++) {
        if (fields[i].offset != expect) return false;
        expect += wire_width(fields[i].type);
    }
    return expect == total;
}

// --- Status header ---

namespace status_field {
enum : size_t { kStatus, kMsgSize };
}

inline constexpr WireField STATUS_FIELDS[] = {
    {"status",   0, WireType::kU32},
    {"msg_size", 4, WireType::kU64},
};
inline constexpr size_t STATUS_HEADER_SIZE = 12;
static_assert(wire_fields_contiguous(STATUS_FIELDS, STATUS_HEADER_SIZE),
              "status header layout");

// --- Statistics block ---
// Followed by nhits x u64 hit offsets, each measured from the first
// byte of the hit-records region.

namespace stats_field {
enum : size_t {
    kElapsed, kUser, kSys, kZ, kDomZ, kZSetBy, kDomZSetBy,
    kNModels, kNNodes, kNSeqs, kNRes,
    kNPastMsv, kNPastBias, kNPastVit, kNPastFwd,
    kNHits, kNReported, kNIncluded,
};
}

inline constexpr WireField STATS_FIELDS[] = {
    {"elapsed",     0,   WireType::kF64},
    {"user",        8,   WireType::kF64},
    {"sys",         16,  WireType::kF64},
    {"Z",           24,  WireType::kF64},
    {"domZ",        32,  WireType::kF64},
    {"Z_setby",     40,  WireType::kU8},
    {"domZ_setby",  41,  WireType::kU8},
    {"nmodels",     42,  WireType::kU64},
    {"nnodes",      50,  WireType::kU64},
    {"nseqs",       58,  WireType::kU64},
    {"nres",        66,  WireType::kU64},
    {"n_past_msv",  74,  WireType::kU64},
    {"n_past_bias", 82,  WireType::kU64},
    {"n_past_vit",  90,  WireType::kU64},
    {"n_past_fwd",  98,  WireType::kU64},
    {"nhits",       106, WireType::kU64},
    {"nreported",   114, WireType::kU64},
    {"nincluded",   122, WireType::kU64},
};
inline constexpr size_t STATS_BASE_SIZE = 130;
static_assert(wire_fields_contiguous(STATS_FIELDS, STATS_BASE_SIZE),
              "statistics block layout");

// --- Hit record ---
// Followed by the strings selected by the string mask (bit order,
// NUL-terminated), then ndom domain records. record_size covers the
// whole hit including its domains.

namespace hit_field {
enum : size_t {
    kRecordSize, kWindowLength, kSortkey, kScore, kPreScore, kSumScore,
    kLnP, kPreLnP, kSumLnP, kNExpected, kNRegions, kNClustered,
    kNOverlaps, kNEnvelopes, kFlags, kNReported, kNIncluded,
    kBestDomain, kSeqidx, kSubseqStart, kNDom, kStringMask,
};
}

inline constexpr WireField HIT_FIELDS[] = {
    {"record_size",   0,   WireType::kU32},
    {"window_length", 4,   WireType::kU32},
    {"sortkey",       8,   WireType::kF64},
    {"score",         16,  WireType::kF32},
    {"pre_score",     20,  WireType::kF32},
    {"sum_score",     24,  WireType::kF32},
    {"lnP",           28,  WireType::kF64},
    {"pre_lnP",       36,  WireType::kF64},
    {"sum_lnP",       44,  WireType::kF64},
    {"nexpected",     52,  WireType::kF32},
    {"nregions",      56,  WireType::kU32},
    {"nclustered",    60,  WireType::kU32},
    {"noverlaps",     64,  WireType::kU32},
    {"nenvelopes",    68,  WireType::kU32},
    {"flags",         72,  WireType::kU32},
    {"nreported",     76,  WireType::kU32},
    {"nincluded",     80,  WireType::kU32},
    {"best_domain",   84,  WireType::kU32},
    {"seqidx",        88,  WireType::kU64},
    {"subseq_start",  96,  WireType::kU64},
    {"ndom",          104, WireType::kU32},
    {"string_mask",   108, WireType::kU8},
};
inline constexpr size_t HIT_FIXED_SIZE = 109;
static_assert(wire_fields_contiguous(HIT_FIELDS, HIT_FIXED_SIZE),
              "hit record layout");

enum HitStringBit : uint8_t {
    kHitHasName = 0x01,
    kHitHasAcc  = 0x02,
    kHitHasDesc = 0x04,
};

// --- Domain record ---
// Followed by n_scores_per_pos x f32, then one alignment record.
// record_size covers the alignment.

namespace domain_field {
enum : size_t {
    kRecordSize, kIEnv, kJEnv, kIAli, kJAli,
    kEnvsc, kDomCorrection, kDomBias, kOasc, kBitscore, kLnP,
    kIsReported, kIsIncluded, kNScoresPerPos,
};
}

inline constexpr WireField DOMAIN_FIELDS[] = {
    {"record_size",      0,  WireType::kU32},
    {"ienv",             4,  WireType::kI64},
    {"jenv",             12, WireType::kI64},
    {"iali",             20, WireType::kI64},
    {"jali",             28, WireType::kI64},
    {"envsc",            36, WireType::kF32},
    {"domcorrection",    40, WireType::kF32},
    {"dombias",          44, WireType::kF32},
    {"oasc",             48, WireType::kF32},
    {"bitscore",         52, WireType::kF32},
    {"lnP",              56, WireType::kF64},
    {"is_reported",      64, WireType::kU32},
    {"is_included",      68, WireType::kU32},
    {"n_scores_per_pos", 72, WireType::kU32},
};
inline constexpr size_t DOMAIN_FIXED_SIZE = 76;
static_assert(wire_fields_contiguous(DOMAIN_FIELDS, DOMAIN_FIXED_SIZE),
              "domain record layout");

// --- Alignment record ---
// Followed by NUL-terminated strings in this order (optional ones only
// when their mask bit is set): rfline, mmline, csline, model, mline,
// aseq, ppline, hmmname, hmmacc, hmmdesc, sqname, sqacc, sqdesc.

namespace alignment_field {
enum : size_t {
    kRecordSize, kN, kHmmFrom, kHmmTo, kM, kSqFrom, kSqTo, kL, kLineMask,
};
}

inline constexpr WireField ALIGNMENT_FIELDS[] = {
    {"record_size", 0,  WireType::kU32},
    {"N",           4,  WireType::kU32},
    {"hmmfrom",     8,  WireType::kI32},
    {"hmmto",       12, WireType::kI32},
    {"M",           16, WireType::kI32},
    {"sqfrom",      20, WireType::kI64},
    {"sqto",        28, WireType::kI64},
    {"L",           36, WireType::kI64},
    {"line_mask",   44, WireType::kU8},
};
inline constexpr size_t ALIGNMENT_FIXED_SIZE = 45;
static_assert(wire_fields_contiguous(ALIGNMENT_FIELDS, ALIGNMENT_FIXED_SIZE),
              "alignment record layout");

enum AlignmentLineBit : uint8_t {
    kAliHasRf      = 0x01,
    kAliHasMm      = 0x02,
    kAliHasCs      = 0x04,
    kAliHasPp      = 0x08,
    kAliHasHmmAcc  = 0x10,
    kAliHasHmmDesc = 0x20,
    kAliHasSqAcc   = 0x40,
    kAliHasSqDesc  = 0x80,
};

} // namespace hmmdc
