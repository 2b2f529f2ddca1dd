#include "io/query_reader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

#include "io/fasta_reader.hpp"

namespace hmmdc {

bool parse_query_format(const std::string& str, QueryFormat& out,
                        std::string& error_msg) {
    if (str == "fasta") {
        out = QueryFormat::kFasta;
    } else if (str == "afa") {
        out = QueryFormat::kAfa;
    } else if (str == "hmm") {
        out = QueryFormat::kHmm;
    } else {
        error_msg = "unknown query format '" + str + "' (expected fasta, afa or hmm)";
        return false;
    }
    return true;
}

static bool is_blank(const std::string& s) {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> split_hmm_texts(std::istream& in) {
    std::vector<std::string> texts;
    std::string line;
    std::string cur;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (cur.empty() && line.empty())
            continue;
        cur += line;
        cur += '\n';
        if (line == "//") {
            texts.push_back(std::move(cur));
            cur.clear();
        }
    }
    if (!is_blank(cur)) texts.push_back(std::move(cur));
    return texts;
}

static std::string base_name(const std::string& path) {
    if (path == "-") return "stdin";
    size_t slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) name.resize(dot);
    return name;
}

static bool load_hmm(const std::string& path, std::vector<std::string>& texts,
                     std::string& error_msg) {
    if (path == "-") {
        texts = split_hmm_texts(std::cin);
        return true;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }
    texts = split_hmm_texts(file);
    return true;
}

bool load_queries(const std::string& path, QueryFormat fmt, Alphabet alphabet,
                  std::vector<std::unique_ptr<Query>>& queries,
                  std::string& error_msg) {
    queries.clear();

    if (fmt == QueryFormat::kHmm) {
        std::vector<std::string> texts;
        if (!load_hmm(path, texts, error_msg)) return false;
        for (auto& t : texts) {
            queries.push_back(std::make_unique<ProfileQuery>(std::move(t)));
        }
    } else {
        std::vector<FastaRecord> records;
        if (!read_fasta(path, records, error_msg)) return false;
        if (fmt == QueryFormat::kFasta) {
            for (auto& rec : records) {
                queries.push_back(std::make_unique<SequenceQuery>(
                    std::move(rec.id), std::move(rec.sequence), alphabet,
                    std::move(rec.description)));
            }
        } else if (!records.empty()) {
            std::vector<AlignmentQuery::Row> rows;
            rows.reserve(records.size());
            for (auto& rec : records) {
                rows.push_back({std::move(rec.id), std::move(rec.sequence)});
            }
            queries.push_back(std::make_unique<AlignmentQuery>(
                base_name(path), std::move(rows), alphabet));
        }
    }

    if (queries.empty()) {
        error_msg = "no queries in " + (path == "-" ? std::string("stdin") : path);
        return false;
    }
    return true;
}

} // namespace hmmdc
