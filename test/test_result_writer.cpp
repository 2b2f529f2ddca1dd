#include "test_util.hpp"
#include "fake_daemon.hpp"

#include "io/result_writer.hpp"

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

#include <json/json.h>
#include <unistd.h>

using namespace hmmdc;
using fake_daemon::sample_hit;
using fake_daemon::sample_stats;

// One reported hit with two domains (the second not reported) and one
// hit below the reporting threshold.
static TopHits make_results() {
    TopHits th(SearchMode::kSearch, PipelineConfig(), Alphabet::kAmino);
    th.set_query_name("q1");
    th.set_stats(sample_stats(1000));

    Hit h = sample_hit(7, 50.0f, std::log(1e-8), 2);
    h.domains[1].reported = false;
    h.domains[1].included = false;
    h.nreported = 1;
    h.nincluded = 1;
    th.append(std::move(h));

    Hit low = sample_hit(8, 2.0f, std::log(0.9));
    low.flags = 0;
    th.append(std::move(low));
    th.mark_sorted(SortBy::kKey);
    return th;
}

static std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static void test_tab() {
    std::fprintf(stderr, "-- test_tab\n");
    std::vector<TopHits> results;
    results.push_back(make_results());
    std::ostringstream out;
    write_results_tab(out, results);

    auto lines = lines_of(out.str());
    CHECK_EQ(lines.size(), 2u);
    CHECK(lines[0].rfind("# target\taccession\tquery\t", 0) == 0);
    CHECK(lines[1].rfind("seq7\t-\tq1\t1e-05\t50.0\t0.5\t1e-05\t50.0\t", 0) == 0);
    std::string tail = "\t1.0\t1\t0\t0\t2\t2\t1\t1\t-";
    CHECK(lines[1].size() > tail.size() &&
          lines[1].compare(lines[1].size() - tail.size(), tail.size(), tail) == 0);
}

static void test_tab_unnamed_target() {
    std::fprintf(stderr, "-- test_tab_unnamed_target\n");
    TopHits th(SearchMode::kScan, PipelineConfig());
    th.set_stats(sample_stats(10));
    Hit h = sample_hit(42, 30.0f, std::log(1e-6), 0);
    h.name.clear();
    h.accession = "PF00042.1";
    h.description = "some family";
    th.append(std::move(h));

    std::vector<TopHits> results;
    results.push_back(std::move(th));
    std::ostringstream out;
    write_results_tab(out, results);
    auto lines = lines_of(out.str());
    CHECK_EQ(lines.size(), 2u);
    // No query name, no best domain
    CHECK(lines[1].rfind("42\tPF00042.1\t-\t1e-05\t30.0\t0.5\t-\t-\t-\t", 0) == 0);
    CHECK(lines[1].find("\tsome family") != std::string::npos);
}

static void test_domtab() {
    std::fprintf(stderr, "-- test_domtab\n");
    std::vector<TopHits> results;
    results.push_back(make_results());
    std::ostringstream out;
    write_results_domtab(out, results);

    auto lines = lines_of(out.str());
    CHECK_EQ(lines.size(), 2u);
    CHECK(lines[1].rfind("seq7\t-\t300\tq1\t50\t1e-05\t50.0\t0.5\t1\t1\t3e-08\t1e-05\t50.0\t", 0) == 0);
    std::string tail = "\t1\t10\t2\t11\t1\t12\t0.75\t-";
    CHECK(lines[1].size() > tail.size() &&
          lines[1].compare(lines[1].size() - tail.size(), tail.size(), tail) == 0);
}

static void test_json() {
    std::fprintf(stderr, "-- test_json\n");
    std::vector<TopHits> results;
    results.push_back(make_results());
    results.push_back(TopHits(SearchMode::kScan, PipelineConfig()));
    std::ostringstream out;
    write_results_json(out, results);

    Json::CharReaderBuilder rb;
    Json::Value root;
    std::string errs;
    std::istringstream in(out.str());
    CHECK(Json::parseFromStream(rb, in, &root, &errs));
    CHECK(root["results"].isArray());
    CHECK_EQ(root["results"].size(), 2u);

    const Json::Value& r = root["results"][0];
    CHECK_STR_EQ(r["query"].asString(), "q1");
    CHECK_STR_EQ(r["mode"].asString(), "search");
    CHECK_STR_EQ(r["alphabet"].asString(), "amino");
    CHECK_STR_EQ(r["stats"]["Z_setby"].asString(), "ntargets");
    CHECK_EQ(r["stats"]["nhits"].asUInt64(), 2u);
    CHECK_EQ(r["stats"]["nseqs"].asUInt64(), 1000u);

    CHECK_EQ(r["hits"].size(), 1u);
    const Json::Value& h = r["hits"][0];
    CHECK_STR_EQ(h["target"].asString(), "seq7");
    CHECK_EQ(h["seqidx"].asUInt64(), 7u);
    CHECK(!h.isMember("accession"));
    CHECK_NEAR(h["evalue"].asDouble(), 1e-5, 1e-9);
    CHECK(h["included"].asBool());
    CHECK_EQ(h["domains"].size(), 1u);

    const Json::Value& d = h["domains"][0];
    CHECK_EQ(d["env_from"].asInt64(), 1);
    CHECK_NEAR(d["c_evalue"].asDouble(), 3e-8, 1e-9);
    CHECK_STR_EQ(d["alignment"]["pp"].asString(), "9999988999");
    CHECK_STR_EQ(d["alignment"]["target_sequence"].asString(), "ACDEFWHIKL");
    CHECK(!d["alignment"].isMember("cs"));

    const Json::Value& empty = root["results"][1];
    CHECK_STR_EQ(empty["mode"].asString(), "scan");
    CHECK(empty["hits"].isArray());
    CHECK_EQ(empty["hits"].size(), 0u);
}

static void test_write_all_results_file() {
    std::fprintf(stderr, "-- test_write_all_results_file\n");
    std::vector<TopHits> results;
    results.push_back(make_results());
    std::string path = "/tmp/hmmdc_test_results_" + std::to_string(::getpid()) + ".tsv";
    std::string err;
    CHECK(write_all_results(path, results, OutputFormat::kDomtab, err));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    std::ostringstream expected;
    write_results_domtab(expected, results);
    CHECK_STR_EQ(ss.str(), expected.str());
    std::remove(path.c_str());

    CHECK(!write_all_results("/nonexistent_dir_hmmdc/out.tsv", results,
                             OutputFormat::kTab, err));
    CHECK(err.find("cannot open") != std::string::npos);
}

static void test_parse_output_format() {
    std::fprintf(stderr, "-- test_parse_output_format\n");
    OutputFormat f = OutputFormat::kTab;
    std::string err;
    CHECK(parse_output_format("json", f, err));
    CHECK(f == OutputFormat::kJson);
    CHECK(!parse_output_format("sam", f, err));
    CHECK(f == OutputFormat::kJson);
}

int main() {
    test_tab();
    test_tab_unnamed_target();
    test_domtab();
    test_json();
    test_write_all_results_file();
    test_parse_output_format();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
