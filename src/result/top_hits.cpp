#include "result/top_hits.hpp"

#include <algorithm>
#include <cmath>

namespace hmmdc {

static bool key_before(const Hit& a, const Hit& b) {
    return a.sortkey > b.sortkey;
}

static bool seqidx_before(const Hit& a, const Hit& b) {
    if (a.seqidx != b.seqidx) return a.seqidx < b.seqidx;
    return a.subseq_start < b.subseq_start;
}

TopHits::TopHits(SearchMode mode, const PipelineConfig& config, Alphabet alphabet)
    : mode_(mode), config_(config), alphabet_(alphabet) {}

void TopHits::set_stats(const SearchStats& stats) {
    stats_ = stats;
    stats_.hit_offsets.clear();
    stats_.hit_offsets.shrink_to_fit();
    nreported_ = stats.nreported;
    nincluded_ = stats.nincluded;
}

void TopHits::append(Hit hit) {
    uint32_t index = static_cast<uint32_t>(hits_.size());
    for (auto& d : hit.domains) {
        d.hit_index = index;
    }
    hits_.push_back(std::move(hit));
    sorted_by_key_ = false;
    sorted_by_seqidx_ = false;
}

void TopHits::mark_sorted(SortBy by) {
    sorted_by_key_ = (by == SortBy::kKey);
    sorted_by_seqidx_ = (by == SortBy::kSeqidx);
}

double TopHits::pvalue(const Hit& h) const {
    return std::exp(h.lnP);
}

double TopHits::evalue(const Hit& h) const {
    return std::exp(h.lnP) * stats_.Z;
}

double TopHits::c_evalue(const Domain& d) const {
    return std::exp(d.lnP) * stats_.domZ;
}

double TopHits::i_evalue(const Domain& d) const {
    return std::exp(d.lnP) * stats_.Z;
}

void TopHits::reindex() {
    for (size_t i = 0; i < hits_.size(); i++) {
        for (auto& d : hits_[i].domains) {
            d.hit_index = static_cast<uint32_t>(i);
        }
    }
}

void TopHits::sort(SortBy by) {
    if (is_sorted(by)) return;
    if (by == SortBy::kKey) {
        std::stable_sort(hits_.begin(), hits_.end(), key_before);
    } else {
        std::stable_sort(hits_.begin(), hits_.end(), seqidx_before);
    }
    reindex();
    mark_sorted(by);
}

void TopHits::threshold() {
    // Model-specific cutoffs live in the daemon's profiles; the flags it
    // sent are the verdict, only the counts are rebuilt.
    if (config_.bit_cutoffs != BitCutoffs::kNone) {
        for (auto& h : hits_) {
            h.nreported = 0;
            h.nincluded = 0;
            for (const auto& d : h.domains) {
                if (d.reported) h.nreported++;
                if (d.included) h.nincluded++;
            }
        }
        recount();
        thresholded_ = true;
        return;
    }

    for (auto& h : hits_) {
        h.flags &= ~static_cast<uint32_t>(kHitReported | kHitIncluded);
        h.nreported = 0;
        h.nincluded = 0;
        for (auto& d : h.domains) {
            d.reported = false;
            d.included = false;
        }
        if (h.is_dropped()) continue;

        double ev = evalue(h);
        // Only a reported hit can be included.
        if (!config_.target_reportable(h.score, ev)) continue;
        h.flags |= kHitReported;
        if (config_.target_includable(h.score, ev)) h.flags |= kHitIncluded;

        // An included domain additionally needs an included hit.
        for (auto& d : h.domains) {
            double cev = c_evalue(d);
            if (config_.domain_reportable(d.score, cev)) {
                d.reported = true;
                h.nreported++;
            }
            if (h.is_included() && config_.domain_includable(d.score, cev)) {
                d.included = true;
                h.nincluded++;
            }
        }
    }
    recount();
    thresholded_ = true;
}

void TopHits::recount() {
    nreported_ = 0;
    nincluded_ = 0;
    for (const auto& h : hits_) {
        if (h.is_reported()) nreported_++;
        if (h.is_included()) nincluded_++;
    }
    stats_.nreported = nreported_;
    stats_.nincluded = nincluded_;
}

std::vector<size_t> TopHits::reported() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < hits_.size(); i++) {
        if (hits_[i].is_reported()) out.push_back(i);
    }
    return out;
}

std::vector<size_t> TopHits::included() const {
    std::vector<size_t> out;
    for (size_t i = 0; i < hits_.size(); i++) {
        if (hits_[i].is_included()) out.push_back(i);
    }
    return out;
}

bool TopHits::merge(const TopHits& other, std::string& error_msg) {
    if (&other == this) {
        TopHits copy = other;
        return merge(copy, error_msg);
    }
    if (other.mode_ != mode_) {
        error_msg = std::string("cannot merge ") + search_mode_name(other.mode_) +
                    " results into " + search_mode_name(mode_) + " results";
        return false;
    }
    if (!same_thresholds(config_, other.config_)) {
        error_msg = "cannot merge results produced with different thresholds";
        return false;
    }

    bool keep_key_order = sorted_by_key_ && other.sorted_by_key_;
    bool rethreshold = thresholded_ || other.thresholded_;

    size_t mid = hits_.size();
    hits_.insert(hits_.end(), other.hits_.begin(), other.hits_.end());
    if (keep_key_order) {
        std::inplace_merge(hits_.begin(), hits_.begin() + static_cast<std::ptrdiff_t>(mid),
                           hits_.end(), key_before);
    }
    reindex();

    const SearchStats& o = other.stats_;
    stats_.elapsed = std::max(stats_.elapsed, o.elapsed);
    stats_.user += o.user;
    stats_.sys += o.sys;
    if (stats_.Z_setby == ZSetBy::kNTargets && o.Z_setby == ZSetBy::kNTargets) {
        stats_.Z += o.Z;
    }
    if (stats_.domZ_setby == ZSetBy::kNTargets && o.domZ_setby == ZSetBy::kNTargets) {
        stats_.domZ += o.domZ;
    }
    stats_.nmodels += o.nmodels;
    stats_.nnodes += o.nnodes;
    stats_.nseqs += o.nseqs;
    stats_.nres += o.nres;
    stats_.n_past_msv += o.n_past_msv;
    stats_.n_past_bias += o.n_past_bias;
    stats_.n_past_vit += o.n_past_vit;
    stats_.n_past_fwd += o.n_past_fwd;
    stats_.nhits = hits_.size();

    sorted_by_key_ = keep_key_order;
    sorted_by_seqidx_ = false;

    if (rethreshold) {
        threshold();
    } else {
        nreported_ += other.nreported_;
        nincluded_ += other.nincluded_;
        stats_.nreported = nreported_;
        stats_.nincluded = nincluded_;
    }
    return true;
}

void TopHits::clear() {
    hits_.clear();
    hits_.shrink_to_fit();
    stats_ = SearchStats();
    nreported_ = 0;
    nincluded_ = 0;
    sorted_by_key_ = false;
    sorted_by_seqidx_ = false;
    thresholded_ = false;
}

} // namespace hmmdc
