#include "test_util.hpp"

#include "pipeline/pipeline_config.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace hmmdc;

static void test_defaults_render_empty() {
    std::fprintf(stderr, "-- test_defaults_render_empty\n");
    PipelineConfig c;
    CHECK_STR_EQ(render_options(c), "");

    PipelineConfig built;
    std::string err;
    CHECK(build_pipeline_config({}, built, err));
    CHECK_STR_EQ(render_options(built), "");
    CHECK(built.E == 10.0);
    CHECK(built.incE == 0.01);
    CHECK(built.by_E());
    CHECK_EQ(built.seed, 42);
    CHECK(built.bias_filter);
    CHECK(!built.Z.has_value());
}

static void test_render_in_table_order() {
    std::fprintf(stderr, "-- test_render_in_table_order\n");
    PipelineConfig c;
    std::string err;
    CHECK(build_pipeline_config({{"Z", "45638612"},
                                 {"bias_filter", "no"},
                                 {"T", "-5"},
                                 {"F1", "0.05"},
                                 {"seed", "0"},
                                 {"max", "1"}},
                                c, err));
    CHECK_STR_EQ(render_options(c), "-T -5 --F1 0.05 --max --nobias --seed 0 -Z 45638612");
    CHECK(!c.by_E());
    CHECK(c.inc_by_E());
}

static void test_render_keeps_all_digits() {
    std::fprintf(stderr, "-- test_render_keeps_all_digits\n");
    PipelineConfig c;
    std::string err;
    CHECK(build_pipeline_config({{"E", "0.000012345678"}, {"domZ", "123456789.25"}}, c, err));
    std::string line = render_options(c);
    CHECK_STR_EQ(line, "-E 1.2345678e-05 --domZ 123456789.25");

    // The daemon parses the rendered text back to the same value
    const std::string prefix = "-E ";
    std::string ev = line.substr(prefix.size(), line.find(' ', prefix.size()) - prefix.size());
    CHECK(std::strtod(ev.c_str(), nullptr) == c.E);
}

static void test_later_option_wins() {
    std::fprintf(stderr, "-- test_later_option_wins\n");
    PipelineConfig c;
    std::string err;
    CHECK(build_pipeline_config({{"E", "1"}, {"E", "0.5"}}, c, err));
    CHECK(c.E == 0.5);
    CHECK_STR_EQ(render_options(c), "-E 0.5");
}

static void test_rejects() {
    std::fprintf(stderr, "-- test_rejects\n");
    PipelineConfig c;
    c.E = 3.0;
    std::string err;

    CHECK(!build_pipeline_config({{"evalue", "1"}}, c, err));
    CHECK(err.find("evalue") != std::string::npos);
    CHECK(c.E == 3.0);  // unchanged on failure

    CHECK(!build_pipeline_config({{"E", "0"}}, c, err));
    CHECK(!build_pipeline_config({{"E", "-1"}}, c, err));
    CHECK(!build_pipeline_config({{"E", "1e"}}, c, err));
    CHECK(!build_pipeline_config({{"E", ""}}, c, err));
    CHECK(!build_pipeline_config({{"E", "nan"}}, c, err));
    CHECK(!build_pipeline_config({{"F2", "1.5"}}, c, err));
    CHECK(!build_pipeline_config({{"Z", "0"}}, c, err));
    CHECK(!build_pipeline_config({{"seed", "-3"}}, c, err));
    CHECK(!build_pipeline_config({{"seed", "4.5"}}, c, err));
    CHECK(!build_pipeline_config({{"null2", "maybe"}}, c, err));
    CHECK(!build_pipeline_config({{"bit_cutoffs", "strict"}}, c, err));
    CHECK(!build_pipeline_config({{"bit_cutoffs", "trusted"}, {"domT", "20"}}, c, err));
    CHECK(c.E == 3.0);
}

static void test_bit_cutoffs() {
    std::fprintf(stderr, "-- test_bit_cutoffs\n");
    PipelineConfig c;
    std::string err;
    CHECK(build_pipeline_config({{"bit_cutoffs", "noise"}}, c, err));
    CHECK(c.bit_cutoffs == BitCutoffs::kNoise);
    CHECK_STR_EQ(render_options(c), "--cut_nc");
}

static void test_predicates() {
    std::fprintf(stderr, "-- test_predicates\n");
    PipelineConfig c;
    CHECK(c.target_reportable(0.0, 10.0));
    CHECK(!c.target_reportable(100.0, 10.5));
    CHECK(c.target_includable(0.0, 0.01));
    CHECK(!c.target_includable(100.0, 0.02));

    c.domT = 12.5;
    c.incdomT = 20.0;
    CHECK(c.domain_reportable(12.5, 1e6));
    CHECK(!c.domain_reportable(12.4, 0.0));
    CHECK(c.domain_includable(20.0, 1e6));
    CHECK(!c.domain_includable(19.9, 0.0));
}

static void test_same_thresholds() {
    std::fprintf(stderr, "-- test_same_thresholds\n");
    PipelineConfig a, b;
    CHECK(same_thresholds(a, b));

    // Filter and seed settings do not affect reporting
    b.F1 = 0.5;
    b.seed = 7;
    b.null2 = false;
    CHECK(same_thresholds(a, b));

    b.incT = 30.0;
    CHECK(!same_thresholds(a, b));
}

static void test_option_keys() {
    std::fprintf(stderr, "-- test_option_keys\n");
    const auto& keys = pipeline_option_keys();
    CHECK_EQ(keys.size(), 18u);
    CHECK_STR_EQ(keys.front(), "E");
    CHECK_STR_EQ(keys.back(), "bit_cutoffs");
}

int main() {
    test_defaults_render_empty();
    test_render_in_table_order();
    test_render_keeps_all_digits();
    test_later_option_wins();
    test_rejects();
    test_bit_cutoffs();
    test_predicates();
    test_same_thresholds();
    test_option_keys();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
