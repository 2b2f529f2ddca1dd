#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hmmdc {

enum class BitCutoffs : uint8_t {
    kNone      = 0,
    kGathering = 1,  // --cut_ga
    kTrusted   = 2,  // --cut_tc
    kNoise     = 3,  // --cut_nc
};

// Keyword options as given by a caller, e.g. {"E", "1e-5"}.
using PipelineOptions = std::vector<std::pair<std::string, std::string>>;

// Search parameters sent to the daemon and used for local thresholding.
// Unset optional thresholds mean the corresponding e-value threshold
// applies instead.
struct PipelineConfig {
    double E = 10.0;                 // reporting e-value (targets)
    std::optional<double> T;         // reporting bit score (targets)
    double domE = 10.0;              // reporting conditional e-value (domains)
    std::optional<double> domT;
    double incE = 0.01;              // inclusion e-value (targets)
    std::optional<double> incT;
    double incdomE = 0.01;           // inclusion conditional e-value (domains)
    std::optional<double> incdomT;
    double F1 = 0.02;                // MSV filter threshold
    double F2 = 1e-3;                // Viterbi filter threshold
    double F3 = 1e-5;                // Forward filter threshold
    bool max = false;                // disable all filters
    bool bias_filter = true;
    bool null2 = true;
    int64_t seed = 42;               // 0 = time-based
    std::optional<double> Z;
    std::optional<double> domZ;
    BitCutoffs bit_cutoffs = BitCutoffs::kNone;

    bool by_E() const { return !T.has_value(); }
    bool dom_by_E() const { return !domT.has_value(); }
    bool inc_by_E() const { return !incT.has_value(); }
    bool incdom_by_E() const { return !incdomT.has_value(); }

    bool target_reportable(double score, double evalue) const {
        return by_E() ? evalue <= E : score >= *T;
    }
    bool target_includable(double score, double evalue) const {
        return inc_by_E() ? evalue <= incE : score >= *incT;
    }
    bool domain_reportable(double score, double c_evalue) const {
        return dom_by_E() ? c_evalue <= domE : score >= *domT;
    }
    bool domain_includable(double score, double c_evalue) const {
        return incdom_by_E() ? c_evalue <= incdomE : score >= *incdomT;
    }
};

// Option keys recognized by build_pipeline_config(), in rendering order.
const std::vector<std::string>& pipeline_option_keys();

// Build a configuration from keyword options on top of the defaults.
// Unknown keys, unparsable values and out-of-range values are rejected:
// returns false and sets error_msg.
bool build_pipeline_config(const PipelineOptions& options,
                           PipelineConfig& out, std::string& error_msg);

// Render the daemon option string: the flags whose values differ from
// the defaults, space-separated, in pipeline_option_keys() order.
// The default configuration renders to "".
std::string render_options(const PipelineConfig& config);

// True if both configurations report and include by the same rules.
bool same_thresholds(const PipelineConfig& a, const PipelineConfig& b);

} // namespace hmmdc
