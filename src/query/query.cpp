#include "query/query.hpp"

#include <cctype>
#include <sstream>

#include "core/config.hpp"

namespace hmmdc {

static void append_wrapped(std::string& out, const std::string& s) {
    for (size_t i = 0; i < s.size(); i += FASTA_LINE_WIDTH) {
        out.append(s, i, FASTA_LINE_WIDTH);
        out.push_back('\n');
    }
}

static bool valid_residues(const std::string& s, bool allow_gaps) {
    for (char c : s) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalpha(u) || c == '*') continue;
        if (allow_gaps && (c == '-' || c == '.')) continue;
        return false;
    }
    return true;
}

static bool valid_name(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// --- SequenceQuery ---

SequenceQuery::SequenceQuery(std::string name, std::string residues,
                             Alphabet alphabet, std::string description)
    : name_(std::move(name)), residues_(std::move(residues)),
      alphabet_(alphabet), description_(std::move(description)) {}

bool SequenceQuery::validate(std::string& error_msg) const {
    if (!valid_name(name_)) {
        error_msg = "sequence query needs a name without whitespace";
        return false;
    }
    if (residues_.empty()) {
        error_msg = "sequence query '" + name_ + "' is empty";
        return false;
    }
    if (!valid_residues(residues_, false)) {
        error_msg = "sequence query '" + name_ + "' contains non-residue characters";
        return false;
    }
    return true;
}

void SequenceQuery::serialize(std::string& out) const {
    out += '>';
    out += name_;
    if (!description_.empty()) {
        out += ' ';
        out += description_;
    }
    out += '\n';
    append_wrapped(out, residues_);
}

// --- AlignmentQuery ---

AlignmentQuery::AlignmentQuery(std::string name, std::vector<Row> rows, Alphabet alphabet)
    : name_(std::move(name)), rows_(std::move(rows)), alphabet_(alphabet) {}

bool AlignmentQuery::validate(std::string& error_msg) const {
    if (rows_.empty()) {
        error_msg = "alignment query '" + name_ + "' has no sequences";
        return false;
    }
    size_t width = rows_[0].aligned.size();
    if (width == 0) {
        error_msg = "alignment query '" + name_ + "' has zero columns";
        return false;
    }
    for (const auto& row : rows_) {
        if (!valid_name(row.name)) {
            error_msg = "alignment query '" + name_ + "' has an unnamed row";
            return false;
        }
        if (row.aligned.size() != width) {
            error_msg = "alignment query '" + name_ + "': row '" + row.name +
                        "' has " + std::to_string(row.aligned.size()) +
                        " columns, expected " + std::to_string(width);
            return false;
        }
        if (!valid_residues(row.aligned, true)) {
            error_msg = "alignment query '" + name_ + "': row '" + row.name +
                        "' contains invalid characters";
            return false;
        }
    }
    return true;
}

void AlignmentQuery::serialize(std::string& out) const {
    for (const auto& row : rows_) {
        out += '>';
        out += row.name;
        out += '\n';
        append_wrapped(out, row.aligned);
    }
}

// --- ProfileQuery ---

ProfileQuery::ProfileQuery(std::string text) : text_(std::move(text)) {
    std::istringstream in(text_);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string tag, value;
        ls >> tag >> value;
        if (tag == "NAME" && name_.empty()) {
            name_ = value;
        } else if (tag == "ALPH" && alphabet_ == Alphabet::kUnknown) {
            if (value == "amino") alphabet_ = Alphabet::kAmino;
            else if (value == "DNA" || value == "dna") alphabet_ = Alphabet::kDna;
            else if (value == "RNA" || value == "rna") alphabet_ = Alphabet::kRna;
        } else if (tag == "HMM") {
            break;
        }
    }
}

bool ProfileQuery::validate(std::string& error_msg) const {
    if (text_.find_first_not_of(" \t\r\n") == std::string::npos) {
        error_msg = "profile query is empty";
        return false;
    }
    if (text_.compare(0, 5, "HMMER") != 0) {
        error_msg = "profile query does not start with a HMMER header";
        return false;
    }
    return true;
}

void ProfileQuery::serialize(std::string& out) const {
    // Copy line by line, dropping the profile's own "//" terminator so the
    // request carries exactly one.
    std::istringstream in(text_);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == REQUEST_TERMINATOR) break;
        out += line;
        out += '\n';
    }
}

} // namespace hmmdc
