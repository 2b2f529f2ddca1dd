#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "pipeline/pipeline_config.hpp"
#include "protocol/messages.hpp"
#include "result/hit.hpp"

namespace hmmdc {

// Result collection of one or more searches: owns its hits (and through
// them every domain and alignment), plus the configuration and daemon
// statistics the hits were produced under.
//
// Sort state is cached: a collection is sorted by key, sorted by target
// index, or unsorted, and is_sorted() never rescans.
class TopHits {
public:
    TopHits() = default;
    TopHits(SearchMode mode, const PipelineConfig& config,
            Alphabet alphabet = Alphabet::kUnknown);

    // --- Metadata ---

    SearchMode mode() const { return mode_; }
    const PipelineConfig& config() const { return config_; }
    Alphabet alphabet() const { return alphabet_; }
    const std::string& query_name() const { return query_name_; }
    void set_query_name(std::string name) { query_name_ = std::move(name); }

    // Daemon statistics; hit_offsets is not retained.
    const SearchStats& stats() const { return stats_; }
    void set_stats(const SearchStats& stats);

    double Z() const { return stats_.Z; }
    double domZ() const { return stats_.domZ; }

    // --- Hits ---

    size_t size() const { return hits_.size(); }
    bool empty() const { return hits_.empty(); }
    const Hit& operator[](size_t i) const { return hits_[i]; }
    const std::vector<Hit>& hits() const { return hits_; }
    std::vector<Hit>::const_iterator begin() const { return hits_.begin(); }
    std::vector<Hit>::const_iterator end() const { return hits_.end(); }

    void reserve(size_t n) { hits_.reserve(n); }

    // Append one hit. Clears both sort flags.
    void append(Hit hit);

    // Record that the hits are already in `by` order (as sent by the
    // daemon). Clears the other flag.
    void mark_sorted(SortBy by);

    const Hit& hit_of(const Domain& d) const { return hits_[d.hit_index]; }

    // --- Significance ---

    double pvalue(const Hit& h) const;
    double evalue(const Hit& h) const;      // exp(lnP) * Z
    double c_evalue(const Domain& d) const; // exp(lnP) * domZ
    double i_evalue(const Domain& d) const; // exp(lnP) * Z

    // --- Ordering ---

    // Stable sort. kKey: descending sort key. kSeqidx: ascending
    // (seqidx, subseq_start).
    void sort(SortBy by = SortBy::kKey);
    bool is_sorted(SortBy by = SortBy::kKey) const {
        return by == SortBy::kKey ? sorted_by_key_ : sorted_by_seqidx_;
    }

    // --- Thresholding ---

    // Mark hits and domains reported/included according to config().
    // Nothing is removed.
    void threshold();
    bool thresholded() const { return thresholded_; }

    uint64_t nreported() const { return nreported_; }
    uint64_t nincluded() const { return nincluded_; }

    // Indices of reported / included hits, in collection order.
    std::vector<size_t> reported() const;
    std::vector<size_t> included() const;

    // --- Combination ---

    // Move the hits of other into this collection. Both must come from
    // the same mode and thresholds. Statistics are summed. If both were
    // sorted by key the result is merged in key order and stays sorted by
    // key; otherwise the result is unsorted.
    // Returns false and sets error_msg if the collections are incompatible;
    // this collection is then unchanged.
    bool merge(const TopHits& other, std::string& error_msg);

    // Release all hits and statistics. Mode and configuration are kept.
    void clear();

private:
    void reindex();
    void recount();

    SearchMode mode_ = SearchMode::kSearch;
    PipelineConfig config_;
    Alphabet alphabet_ = Alphabet::kUnknown;
    std::string query_name_;
    SearchStats stats_;
    std::vector<Hit> hits_;
    uint64_t nreported_ = 0;
    uint64_t nincluded_ = 0;
    bool sorted_by_key_ = false;
    bool sorted_by_seqidx_ = false;
    bool thresholded_ = false;
};

} // namespace hmmdc
