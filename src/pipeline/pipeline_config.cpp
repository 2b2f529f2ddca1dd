#include "pipeline/pipeline_config.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace hmmdc {

const std::vector<std::string>& pipeline_option_keys() {
    static const std::vector<std::string> keys = {
        "E", "T", "domE", "domT", "incE", "incT", "incdomE", "incdomT",
        "F1", "F2", "F3", "max", "bias_filter", "null2", "seed",
        "Z", "domZ", "bit_cutoffs",
    };
    return keys;
}

static bool parse_double(const std::string& key, const std::string& value,
                         double& out, std::string& error_msg) {
    char* end = nullptr;
    errno = 0;
    out = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0' || errno == ERANGE || !std::isfinite(out)) {
        error_msg = "option " + key + ": '" + value + "' is not a number";
        return false;
    }
    return true;
}

static bool parse_positive(const std::string& key, const std::string& value,
                           double& out, std::string& error_msg) {
    if (!parse_double(key, value, out, error_msg)) return false;
    if (out <= 0.0) {
        error_msg = "option " + key + " must be > 0";
        return false;
    }
    return true;
}

static bool parse_fraction(const std::string& key, const std::string& value,
                           double& out, std::string& error_msg) {
    if (!parse_positive(key, value, out, error_msg)) return false;
    if (out > 1.0) {
        error_msg = "option " + key + " must be in (0, 1]";
        return false;
    }
    return true;
}

static bool parse_bool(const std::string& key, const std::string& value,
                       bool& out, std::string& error_msg) {
    if (value == "1" || value == "true" || value == "yes") {
        out = true;
    } else if (value == "0" || value == "false" || value == "no") {
        out = false;
    } else {
        error_msg = "option " + key + ": '" + value + "' is not a boolean";
        return false;
    }
    return true;
}

static bool parse_seed(const std::string& value, int64_t& out, std::string& error_msg) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE || v < 0) {
        error_msg = "option seed: '" + value + "' is not a non-negative integer";
        return false;
    }
    out = static_cast<int64_t>(v);
    return true;
}

static bool parse_cutoffs(const std::string& value, BitCutoffs& out, std::string& error_msg) {
    if (value == "gathering") {
        out = BitCutoffs::kGathering;
    } else if (value == "trusted") {
        out = BitCutoffs::kTrusted;
    } else if (value == "noise") {
        out = BitCutoffs::kNoise;
    } else {
        error_msg = "option bit_cutoffs: '" + value +
                    "' is not one of gathering, trusted, noise";
        return false;
    }
    return true;
}

static bool apply_option(const std::string& key, const std::string& value,
                         PipelineConfig& c, std::string& error_msg) {
    double d = 0.0;
    if (key == "E") return parse_positive(key, value, c.E, error_msg);
    if (key == "domE") return parse_positive(key, value, c.domE, error_msg);
    if (key == "incE") return parse_positive(key, value, c.incE, error_msg);
    if (key == "incdomE") return parse_positive(key, value, c.incdomE, error_msg);
    if (key == "F1") return parse_fraction(key, value, c.F1, error_msg);
    if (key == "F2") return parse_fraction(key, value, c.F2, error_msg);
    if (key == "F3") return parse_fraction(key, value, c.F3, error_msg);
    if (key == "max") return parse_bool(key, value, c.max, error_msg);
    if (key == "bias_filter") return parse_bool(key, value, c.bias_filter, error_msg);
    if (key == "null2") return parse_bool(key, value, c.null2, error_msg);
    if (key == "seed") return parse_seed(value, c.seed, error_msg);
    if (key == "bit_cutoffs") return parse_cutoffs(value, c.bit_cutoffs, error_msg);

    std::optional<double>* slot = nullptr;
    bool positive = false;
    if (key == "T") slot = &c.T;
    else if (key == "domT") slot = &c.domT;
    else if (key == "incT") slot = &c.incT;
    else if (key == "incdomT") slot = &c.incdomT;
    else if (key == "Z") { slot = &c.Z; positive = true; }
    else if (key == "domZ") { slot = &c.domZ; positive = true; }

    if (slot == nullptr) {
        error_msg = "unknown pipeline option '" + key + "'";
        return false;
    }
    bool ok = positive ? parse_positive(key, value, d, error_msg)
                       : parse_double(key, value, d, error_msg);
    if (!ok) return false;
    *slot = d;
    return true;
}

bool build_pipeline_config(const PipelineOptions& options,
                           PipelineConfig& out, std::string& error_msg) {
    PipelineConfig c;
    for (const auto& [key, value] : options) {
        if (!apply_option(key, value, c, error_msg)) return false;
    }
    if (c.bit_cutoffs != BitCutoffs::kNone &&
        (c.T || c.domT || c.incT || c.incdomT)) {
        error_msg = "bit_cutoffs cannot be combined with explicit score thresholds";
        return false;
    }
    out = c;
    return true;
}

// Shortest text that parses back to the same double.
static std::string fmt_num(double v) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v);
    return std::string(buf, res.ptr);
}

std::string render_options(const PipelineConfig& c) {
    const PipelineConfig d;
    std::vector<std::string> parts;

    auto num = [&](const char* flag, double v, double def) {
        if (v != def) parts.push_back(std::string(flag) + " " + fmt_num(v));
    };
    auto opt = [&](const char* flag, const std::optional<double>& v) {
        if (v) parts.push_back(std::string(flag) + " " + fmt_num(*v));
    };

    num("-E", c.E, d.E);
    opt("-T", c.T);
    num("--domE", c.domE, d.domE);
    opt("--domT", c.domT);
    num("--incE", c.incE, d.incE);
    opt("--incT", c.incT);
    num("--incdomE", c.incdomE, d.incdomE);
    opt("--incdomT", c.incdomT);
    num("--F1", c.F1, d.F1);
    num("--F2", c.F2, d.F2);
    num("--F3", c.F3, d.F3);
    if (c.max) parts.push_back("--max");
    if (!c.bias_filter) parts.push_back("--nobias");
    if (!c.null2) parts.push_back("--nonull2");
    if (c.seed != d.seed) parts.push_back("--seed " + std::to_string(c.seed));
    opt("-Z", c.Z);
    opt("--domZ", c.domZ);
    switch (c.bit_cutoffs) {
        case BitCutoffs::kGathering: parts.push_back("--cut_ga"); break;
        case BitCutoffs::kTrusted:   parts.push_back("--cut_tc"); break;
        case BitCutoffs::kNoise:     parts.push_back("--cut_nc"); break;
        case BitCutoffs::kNone:      break;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += ' ';
        out += parts[i];
    }
    return out;
}

bool same_thresholds(const PipelineConfig& a, const PipelineConfig& b) {
    return a.E == b.E && a.T == b.T &&
           a.domE == b.domE && a.domT == b.domT &&
           a.incE == b.incE && a.incT == b.incT &&
           a.incdomE == b.incdomE && a.incdomT == b.incdomT &&
           a.bit_cutoffs == b.bit_cutoffs;
}

} // namespace hmmdc
