#pragma once

#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "query/query.hpp"

namespace hmmdc {

enum class QueryFormat { kFasta, kAfa, kHmm };

// Parse a query format string ("fasta", "afa", "hmm").
// Returns true on success. On failure, out is unchanged and error_msg is set.
bool parse_query_format(const std::string& str, QueryFormat& out,
                        std::string& error_msg);

// Split profile HMM text into one string per model. Each model ends
// with a "//" line, which is kept. Text after the last "//" that holds
// anything but whitespace is returned as a final, unterminated model.
std::vector<std::string> split_hmm_texts(std::istream& in);

// Load the queries of a file; path can be "-" for stdin.
//   kFasta: one SequenceQuery per record
//   kAfa:   the whole file as one AlignmentQuery, named after the file
//   kHmm:   one ProfileQuery per model
// alphabet is given to sequence and alignment queries.
// Returns false and sets error_msg on read errors or an empty file.
bool load_queries(const std::string& path, QueryFormat fmt, Alphabet alphabet,
                  std::vector<std::unique_ptr<Query>>& queries,
                  std::string& error_msg);

} // namespace hmmdc
