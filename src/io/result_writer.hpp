#pragma once

#include <ostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "result/top_hits.hpp"

namespace hmmdc {

enum class OutputFormat { kTab, kDomtab, kJson };

// Parse an output format string ("tab", "domtab", "json").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg);

// Per-target table, one line per reported hit. Columns:
//   target accession query full_E full_score full_bias best_E best_score
//   best_bias exp reg clu ov env dom rep inc description
void write_results_tab(std::ostream& out, const std::vector<TopHits>& results);

// Per-domain table, one line per reported domain of a reported hit.
void write_results_domtab(std::ostream& out, const std::vector<TopHits>& results);

// JSON value of one result collection.
Json::Value results_to_json(const TopHits& th);

// {"results": [...]} with one element per collection.
void write_results_json(std::ostream& out, const std::vector<TopHits>& results);

// Write results in the specified format.
void write_results(std::ostream& out, const std::vector<TopHits>& results,
                   OutputFormat fmt);

// Write to output_path, or to stdout when it is empty.
// Returns false if the file cannot be opened.
bool write_all_results(const std::string& output_path,
                       const std::vector<TopHits>& results,
                       OutputFormat fmt, std::string& error_msg);

} // namespace hmmdc
