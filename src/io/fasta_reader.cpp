#include "io/fasta_reader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>

namespace hmmdc {

static void finish_record(std::vector<FastaRecord>& records, bool& in_record,
                          FastaRecord& cur) {
    if (in_record) {
        for (auto& c : cur.sequence)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        records.push_back(std::move(cur));
    }
    cur = FastaRecord();
    in_record = false;
}

// Returns false on sequence data before the first header.
static bool parse_fasta(std::istream& in, std::vector<FastaRecord>& records) {
    std::string line;
    FastaRecord cur;
    bool in_record = false;

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line.empty())
            continue;

        if (line[0] == '>') {
            finish_record(records, in_record, cur);
            in_record = true;
            size_t start = 1;
            while (start < line.size() && std::isspace(static_cast<unsigned char>(line[start])))
                start++;
            size_t end = start;
            while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end])))
                end++;
            cur.id = line.substr(start, end - start);

            size_t desc = end;
            while (desc < line.size() && std::isspace(static_cast<unsigned char>(line[desc])))
                desc++;
            size_t desc_end = line.size();
            while (desc_end > desc && std::isspace(static_cast<unsigned char>(line[desc_end - 1])))
                desc_end--;
            cur.description = line.substr(desc, desc_end - desc);
        } else if (line[0] == ';') {
            continue;
        } else {
            if (!in_record) return false;
            for (char c : line) {
                if (!std::isspace(static_cast<unsigned char>(c))) cur.sequence += c;
            }
        }
    }

    finish_record(records, in_record, cur);
    return true;
}

std::vector<FastaRecord> read_fasta_stream(std::istream& in) {
    std::vector<FastaRecord> records;
    if (!parse_fasta(in, records)) records.clear();
    return records;
}

bool read_fasta(const std::string& path, std::vector<FastaRecord>& records,
                std::string& error_msg) {
    records.clear();
    bool ok;
    if (path == "-") {
        ok = parse_fasta(std::cin, records);
    } else {
        std::ifstream file(path);
        if (!file.is_open()) {
            error_msg = "cannot open " + path;
            return false;
        }
        ok = parse_fasta(file, records);
    }
    if (!ok) {
        error_msg = (path == "-" ? std::string("stdin") : path) +
                    ": sequence data before the first '>' header";
        records.clear();
        return false;
    }
    return true;
}

} // namespace hmmdc
