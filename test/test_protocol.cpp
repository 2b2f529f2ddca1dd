#include "test_util.hpp"
#include "fake_daemon.hpp"

#include "protocol/byte_io.hpp"
#include "protocol/messages.hpp"
#include "protocol/serializer.hpp"
#include "protocol/wire_schema.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using namespace hmmdc;
using fake_daemon::sample_hit;
using fake_daemon::sample_stats;

static void test_request_line_with_ranges() {
    std::fprintf(stderr, "-- test_request_line_with_ranges\n");
    std::vector<SeqdbRange> ranges = {{10, 20}, {30, 40}};
    CHECK_STR_EQ(encode_request_line(SearchMode::kSearch, 3, &ranges, ""),
                 "@--seqdb 3 --seqdb_ranges 10..20,30..40\n");
}

static void test_request_line_variants() {
    std::fprintf(stderr, "-- test_request_line_variants\n");
    CHECK_STR_EQ(encode_request_line(SearchMode::kSearch, 1, nullptr, ""),
                 "@--seqdb 1\n");
    CHECK_STR_EQ(encode_request_line(SearchMode::kSearch, 2, nullptr, "-E 0.001 --nobias"),
                 "@--seqdb 2 -E 0.001 --nobias\n");
    CHECK_STR_EQ(encode_request_line(SearchMode::kScan, 1, nullptr, ""),
                 "@--hmmdb 1\n");

    // Ranges belong to the sequence database path only
    std::vector<SeqdbRange> ranges = {{1, 5}};
    CHECK_STR_EQ(encode_request_line(SearchMode::kScan, 4, &ranges, "--cut_ga"),
                 "@--hmmdb 4 --cut_ga\n");
    CHECK_STR_EQ(encode_request_line(SearchMode::kSearch, 4, &ranges, "--max"),
                 "@--seqdb 4 --seqdb_ranges 1..5 --max\n");
}

static void test_schema_sizes() {
    std::fprintf(stderr, "-- test_schema_sizes\n");
    CHECK_EQ(STATUS_HEADER_SIZE, 12u);
    CHECK_EQ(STATS_BASE_SIZE, 130u);
    CHECK_EQ(HIT_FIXED_SIZE, 109u);
    CHECK_EQ(DOMAIN_FIXED_SIZE, 76u);
    CHECK_EQ(ALIGNMENT_FIXED_SIZE, 45u);
    CHECK(wire_fields_contiguous(HIT_FIELDS, HIT_FIXED_SIZE));
}

static void test_status_header_big_endian() {
    std::fprintf(stderr, "-- test_status_header_big_endian\n");
    std::vector<uint8_t> buf;
    encode_status_header({7, 0x0102030405ULL}, buf);
    CHECK_EQ(buf.size(), 12u);
    const uint8_t expect[12] = {0, 0, 0, 7, 0, 0, 0, 0x01, 0x02, 0x03, 0x04, 0x05};
    CHECK(std::memcmp(buf.data(), expect, 12) == 0);

    SearchStatus st;
    std::string err;
    CHECK(decode_status_header(buf.data(), buf.size(), st, err));
    CHECK_EQ(st.status, 7u);
    CHECK_EQ(st.msg_size, 0x0102030405ULL);
}

static void test_status_header_rejects() {
    std::fprintf(stderr, "-- test_status_header_rejects\n");
    SearchStatus st;
    std::string err;

    std::vector<uint8_t> buf;
    encode_status_header({29, 0}, buf);
    CHECK(!decode_status_header(buf.data(), buf.size(), st, err));
    CHECK(!err.empty());

    buf.clear();
    encode_status_header({28, 0}, buf);
    CHECK(decode_status_header(buf.data(), buf.size(), st, err));

    err.clear();
    CHECK(!decode_status_header(buf.data(), 11, st, err));
    CHECK(!err.empty());
}

static void test_status_names() {
    std::fprintf(stderr, "-- test_status_names\n");
    CHECK(is_known_status(0));
    CHECK(is_known_status(28));
    CHECK(!is_known_status(29));
    CHECK(std::strlen(status_name(static_cast<uint32_t>(StatusCode::kENotFound))) > 0);
    CHECK(std::strcmp(status_name(0), status_name(6)) != 0);
}

static void test_stats_decode_empty() {
    std::fprintf(stderr, "-- test_stats_decode_empty\n");
    SearchStats in = sample_stats(500);
    in.Z_setby = ZSetBy::kOption;
    std::vector<uint8_t> payload = encode_search_payload(in, {});
    CHECK_EQ(payload.size(), STATS_BASE_SIZE);

    ByteReader r(payload.data(), payload.size());
    SearchStats out;
    std::string err;
    CHECK(decode_search_stats(r, out, err));
    CHECK_EQ(r.pos(), STATS_BASE_SIZE);
    CHECK_EQ(out.nhits, 0u);
    CHECK_EQ(out.nseqs, 500u);
    CHECK_EQ(out.n_past_fwd, 5u);
    CHECK(out.Z == 500.0);
    CHECK(out.Z_setby == ZSetBy::kOption);
    CHECK(out.domZ_setby == ZSetBy::kNTargets);
    CHECK(out.elapsed == 0.5);
}

static void test_payload_hit_count_and_offsets() {
    std::fprintf(stderr, "-- test_payload_hit_count_and_offsets\n");
    std::vector<Hit> hits = {sample_hit(7, 50.0f, -20.0, 2),
                             sample_hit(3, 40.0f, -15.0, 0),
                             sample_hit(9, 30.0f, -10.0, 1)};
    hits[1].accession = "P12345";
    hits[1].description = "putative kinase";
    std::vector<uint8_t> payload = encode_search_payload(sample_stats(), hits);

    ByteReader r(payload.data(), payload.size());
    SearchStats stats;
    std::string err;
    CHECK(decode_search_stats(r, stats, err));
    CHECK_EQ(stats.nhits, 3u);
    CHECK_EQ(stats.hit_offsets.size(), 3u);
    CHECK_EQ(stats.hit_offsets[0], 0u);

    size_t region = r.pos();
    for (size_t i = 0; i < 3; i++) {
        CHECK_EQ(r.pos() - region, stats.hit_offsets[i]);
        Hit h;
        CHECK(decode_hit(r, h, err));
        CHECK_EQ(h.seqidx, hits[i].seqidx);
        CHECK_EQ(h.domains.size(), hits[i].domains.size());
    }
    CHECK_EQ(r.remaining(), 0u);
}

static void test_hit_fields() {
    std::fprintf(stderr, "-- test_hit_fields\n");
    Hit in = sample_hit(42, 61.5f, -30.25, 2);
    in.subseq_start = 17;
    in.window_length = 900;
    in.accession = "Q9XYZ1";
    in.flags |= kHitDuplicate;
    in.best_domain = 1;
    in.domains[1].alignment.rf_line = "xxxxx.xxxx";
    in.domains[1].alignment.target_accession = "ACC1";
    in.domains[0].alignment.pp_line.clear();

    std::vector<uint8_t> buf;
    encode_hit(in, buf);
    CHECK(buf.size() > HIT_FIXED_SIZE);

    ByteReader r(buf.data(), buf.size());
    Hit out;
    std::string err;
    CHECK(decode_hit(r, out, err));
    CHECK_EQ(r.pos(), buf.size());

    CHECK_EQ(out.seqidx, 42u);
    CHECK_EQ(out.subseq_start, 17u);
    CHECK_EQ(out.window_length, 900u);
    CHECK_STR_EQ(out.name, "seq42");
    CHECK_STR_EQ(out.accession, "Q9XYZ1");
    CHECK(out.description.empty());
    CHECK(out.score == 61.5f);
    CHECK(out.pre_score == 62.0f);
    CHECK(out.bias() == 0.5f);
    CHECK(out.lnP == -30.25);
    CHECK(out.sortkey == 61.5);
    CHECK(out.is_reported());
    CHECK(out.is_included());
    CHECK(out.is_duplicate());
    CHECK(!out.is_dropped());
    CHECK_EQ(out.best_domain, 1u);
    CHECK_EQ(out.domains.size(), 2u);

    const Domain& d0 = out.domains[0];
    CHECK_EQ(d0.env_from, 1);
    CHECK_EQ(d0.env_to, 12);
    CHECK(d0.score == 61.5f);
    CHECK(d0.reported);
    CHECK_EQ(d0.scores_per_pos.size(), 3u);
    CHECK(d0.scores_per_pos[2] == 1.5f);
    CHECK_EQ(d0.alignment.length, 10u);
    CHECK_STR_EQ(d0.alignment.target_sequence, "ACDEFWHIKL");
    CHECK_STR_EQ(d0.alignment.identity_sequence, "ACDEF+HIKL");
    CHECK(d0.alignment.pp_line.empty());
    CHECK(d0.alignment.rf_line.empty());
    CHECK_EQ(d0.alignment.target_length, 300);

    const Domain& d1 = out.domains[1];
    CHECK_EQ(d1.env_from, 21);
    CHECK(d1.score == 60.5f);
    CHECK_STR_EQ(d1.alignment.rf_line, "xxxxx.xxxx");
    CHECK_STR_EQ(d1.alignment.pp_line, "9999988999");
    CHECK_STR_EQ(d1.alignment.target_accession, "ACC1");
    CHECK_STR_EQ(d1.alignment.hmm_name, "PF00001");
    CHECK_STR_EQ(d1.alignment.target_name, "seq42");
}

static void test_hit_without_name() {
    std::fprintf(stderr, "-- test_hit_without_name\n");
    Hit in = sample_hit(5, 10.0f, -2.0, 0);
    in.name.clear();
    std::vector<uint8_t> buf;
    encode_hit(in, buf);
    CHECK_EQ(buf.size(), HIT_FIXED_SIZE);

    ByteReader r(buf.data(), buf.size());
    Hit out;
    std::string err;
    CHECK(decode_hit(r, out, err));
    CHECK(out.name.empty());
    CHECK_STR_EQ(out.display_name(), "5");
}

static void test_truncated_hit() {
    std::fprintf(stderr, "-- test_truncated_hit\n");
    std::vector<uint8_t> buf;
    encode_hit(sample_hit(1, 20.0f, -5.0, 2), buf);

    // Every proper prefix must fail cleanly
    bool all_failed = true;
    for (size_t n = 0; n < buf.size(); n++) {
        ByteReader r(buf.data(), n);
        Hit out;
        std::string err;
        if (decode_hit(r, out, err) || err.empty()) all_failed = false;
    }
    CHECK(all_failed);
}

static void test_truncated_stats() {
    std::fprintf(stderr, "-- test_truncated_stats\n");
    std::vector<uint8_t> payload =
        encode_search_payload(sample_stats(), {sample_hit(1, 20.0f, -5.0)});
    ByteReader r(payload.data(), STATS_BASE_SIZE + 4);
    SearchStats out;
    std::string err;
    CHECK(!decode_search_stats(r, out, err));
    CHECK(!err.empty());
}

static void test_huge_hit_count_rejected() {
    std::fprintf(stderr, "-- test_huge_hit_count_rejected\n");
    std::vector<uint8_t> payload = encode_search_payload(sample_stats(), {});
    size_t at = STATS_FIELDS[stats_field::kNHits].offset;
    store_be(payload.data() + at, 0x00FFFFFFFFFFFFFFULL, 8);

    ByteReader r(payload.data(), payload.size());
    SearchStats out;
    std::string err;
    CHECK(!decode_search_stats(r, out, err));
    CHECK(out.hit_offsets.empty());
}

static void test_record_size_mismatch() {
    std::fprintf(stderr, "-- test_record_size_mismatch\n");
    std::vector<uint8_t> buf;
    encode_hit(sample_hit(1, 20.0f, -5.0, 1), buf);
    size_t at = HIT_FIELDS[hit_field::kRecordSize].offset;
    uint32_t size = static_cast<uint32_t>(load_be(buf.data() + at, 4));
    store_be(buf.data() + at, size + 1, 4);

    ByteReader r(buf.data(), buf.size());
    Hit out;
    std::string err;
    CHECK(!decode_hit(r, out, err));
    CHECK(err.find("record_size") != std::string::npos);
}

static void test_best_domain_out_of_range() {
    std::fprintf(stderr, "-- test_best_domain_out_of_range\n");
    Hit in = sample_hit(1, 20.0f, -5.0, 2);
    in.best_domain = 2;
    std::vector<uint8_t> buf;
    encode_hit(in, buf);

    ByteReader r(buf.data(), buf.size());
    Hit out;
    std::string err;
    CHECK(!decode_hit(r, out, err));
}

static void test_ragged_alignment_rejected() {
    std::fprintf(stderr, "-- test_ragged_alignment_rejected\n");
    Hit in = sample_hit(1, 20.0f, -5.0, 1);
    in.domains[0].alignment.identity_sequence = "ACDEF";
    std::vector<uint8_t> buf;
    encode_hit(in, buf);

    ByteReader r(buf.data(), buf.size());
    Hit out;
    std::string err;
    CHECK(!decode_hit(r, out, err));
    CHECK(err.find("N=10") != std::string::npos);
}

static void test_float_bit_patterns() {
    std::fprintf(stderr, "-- test_float_bit_patterns\n");
    std::vector<uint8_t> buf;
    put_f32(buf, 1.0f);
    const uint8_t expect[4] = {0x3F, 0x80, 0x00, 0x00};
    CHECK_EQ(buf.size(), 4u);
    CHECK(std::memcmp(buf.data(), expect, 4) == 0);

    ByteReader r(buf.data(), buf.size());
    float v = 0.0f;
    CHECK(r.get_f32(v));
    CHECK(v == 1.0f);
    CHECK(!r.get_f32(v));
}

int main() {
    test_request_line_with_ranges();
    test_request_line_variants();
    test_schema_sizes();
    test_status_header_big_endian();
    test_status_header_rejects();
    test_status_names();
    test_stats_decode_empty();
    test_payload_hit_count_and_offsets();
    test_hit_fields();
    test_hit_without_name();
    test_truncated_hit();
    test_truncated_stats();
    test_huge_hit_count_rejected();
    test_record_size_mismatch();
    test_best_domain_out_of_range();
    test_ragged_alignment_rejected();
    test_float_bit_patterns();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
