#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace hmmdc {

enum class QueryKind : uint8_t {
    kSequence  = 0,
    kAlignment = 1,
    kProfile   = 2,
};

// A search query as sent to the daemon. The body format belongs to
// the query; the protocol layer treats it as opaque bytes.
class Query {
public:
    virtual ~Query() = default;

    virtual QueryKind kind() const = 0;
    virtual const std::string& name() const = 0;

    // kUnknown when the query does not declare its alphabet.
    virtual Alphabet alphabet() const = 0;

    // Check the content can be sent. Returns false and sets error_msg.
    virtual bool validate(std::string& error_msg) const = 0;

    // Append the request body. Always ends with '\n' and never contains
    // a line consisting of the request terminator.
    virtual void serialize(std::string& out) const = 0;
};

// Single sequence, sent as FASTA.
class SequenceQuery : public Query {
public:
    SequenceQuery(std::string name, std::string residues,
                  Alphabet alphabet = Alphabet::kUnknown,
                  std::string description = {});

    QueryKind kind() const override { return QueryKind::kSequence; }
    const std::string& name() const override { return name_; }
    Alphabet alphabet() const override { return alphabet_; }
    bool validate(std::string& error_msg) const override;
    void serialize(std::string& out) const override;

    const std::string& residues() const { return residues_; }
    const std::string& description() const { return description_; }

private:
    std::string name_;
    std::string residues_;
    Alphabet alphabet_;
    std::string description_;
};

// Multiple alignment, sent as aligned FASTA (gap characters kept).
class AlignmentQuery : public Query {
public:
    struct Row {
        std::string name;
        std::string aligned;
    };

    AlignmentQuery(std::string name, std::vector<Row> rows,
                   Alphabet alphabet = Alphabet::kUnknown);

    QueryKind kind() const override { return QueryKind::kAlignment; }
    const std::string& name() const override { return name_; }
    Alphabet alphabet() const override { return alphabet_; }
    bool validate(std::string& error_msg) const override;
    void serialize(std::string& out) const override;

    const std::vector<Row>& rows() const { return rows_; }

private:
    std::string name_;
    std::vector<Row> rows_;
    Alphabet alphabet_;
};

// Profile HMM in its text form. Name and alphabet are read from the
// NAME and ALPH lines of the text.
class ProfileQuery : public Query {
public:
    explicit ProfileQuery(std::string text);

    QueryKind kind() const override { return QueryKind::kProfile; }
    const std::string& name() const override { return name_; }
    Alphabet alphabet() const override { return alphabet_; }
    bool validate(std::string& error_msg) const override;
    void serialize(std::string& out) const override;

    const std::string& text() const { return text_; }

private:
    std::string text_;
    std::string name_;
    Alphabet alphabet_ = Alphabet::kUnknown;
};

} // namespace hmmdc
