#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hmmdc {

// Hit flag bits as transmitted by the daemon
enum HitFlag : uint32_t {
    kHitIncluded  = 0x01,
    kHitReported  = 0x02,
    kHitNew       = 0x04,
    kHitDropped   = 0x08,
    kHitDuplicate = 0x10,
};

// Realized pairwise alignment of one domain.
// Coordinates are 1-based and inclusive, as sent by the daemon.
struct Alignment {
    uint32_t length = 0;     // N, number of alignment columns
    int32_t  hmm_from = 0;
    int32_t  hmm_to = 0;
    int32_t  hmm_length = 0; // M
    int64_t  target_from = 0;
    int64_t  target_to = 0;
    int64_t  target_length = 0; // L

    std::string hmm_name;
    std::string hmm_accession;
    std::string hmm_description;
    std::string target_name;
    std::string target_accession;
    std::string target_description;

    std::string hmm_sequence;      // model consensus line
    std::string identity_sequence; // match line between model and target
    std::string target_sequence;   // aligned target residues
    std::string rf_line;           // optional annotation lines (empty if absent)
    std::string mm_line;
    std::string cs_line;
    std::string pp_line;           // posterior probabilities
};

struct Domain {
    int64_t env_from = 0;
    int64_t env_to = 0;
    int64_t ali_from = 0;
    int64_t ali_to = 0;
    float   envelope_score = 0.0f;
    float   correction = 0.0f;    // null2 score correction
    float   bias = 0.0f;          // composition bias correction
    float   oasc = 0.0f;          // optimal accuracy score
    float   score = 0.0f;         // bit score
    double  lnP = 0.0;
    bool    reported = false;
    bool    included = false;
    std::vector<float> scores_per_pos;
    Alignment alignment;

    // Index of the owning hit in its TopHits; maintained by TopHits.
    uint32_t hit_index = 0;
};

struct Hit {
    uint64_t seqidx = 0;        // numeric target identifier
    uint64_t subseq_start = 0;
    uint32_t window_length = 0;
    std::string name;           // empty when the daemon sends none
    std::string accession;
    std::string description;

    double sortkey = 0.0;
    float  score = 0.0f;
    float  pre_score = 0.0f;
    float  sum_score = 0.0f;
    double lnP = 0.0;
    double pre_lnP = 0.0;
    double sum_lnP = 0.0;

    float    nexpected = 0.0f;
    uint32_t nregions = 0;
    uint32_t nclustered = 0;
    uint32_t noverlaps = 0;
    uint32_t nenvelopes = 0;

    uint32_t flags = 0;
    uint32_t nreported = 0;     // reported domains
    uint32_t nincluded = 0;     // included domains
    uint32_t best_domain = 0;

    std::vector<Domain> domains;

    // Bias correction applied to the score.
    float bias() const { return pre_score - score; }

    bool is_reported() const { return (flags & kHitReported) != 0; }
    bool is_included() const { return (flags & kHitIncluded) != 0; }
    bool is_dropped() const { return (flags & kHitDropped) != 0; }
    bool is_duplicate() const { return (flags & kHitDuplicate) != 0; }

    // Display name: the transmitted name, or the numeric identifier.
    std::string display_name() const {
        return name.empty() ? std::to_string(seqidx) : name;
    }
};

} // namespace hmmdc
