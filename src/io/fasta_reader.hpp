#pragma once

#include <istream>
#include <string>
#include <vector>

namespace hmmdc {

struct FastaRecord {
    std::string id;          // first word after '>'
    std::string description; // rest of the header line, trimmed
    std::string sequence;    // concatenated sequence lines (uppercase)
};

// Read all records from an input stream. Gap characters in aligned
// FASTA are kept as they are.
std::vector<FastaRecord> read_fasta_stream(std::istream& in);

// Read all records from a FASTA file; path can be "-" for stdin.
// Returns false and sets error_msg if the file cannot be opened or
// sequence data appears before the first header.
bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                std::string& error_msg);

} // namespace hmmdc
