#include "hmmdclient/socket_client.hpp"
#include "core/version.hpp"
#include "util/common_init.hpp"
#include "io/query_reader.hpp"
#include "io/result_writer.hpp"
#include "pipeline/pipeline_config.hpp"
#include "util/cli_parser.hpp"
#include "util/range_parser.hpp"
#include "util/socket_utils.hpp"
#include "util/logger.hpp"

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace hmmdc;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Connection (default: -tcp 127.0.0.1:51371):\n"
        "  -socket <path>           UNIX domain socket path\n"
        "  -tcp <host>:<port>       TCP daemon address\n"
        "\n"
        "Required:\n"
        "  -query <path>            Query file (- for stdin)\n"
        "\n"
        "Search:\n"
        "  -qformat <fasta|afa|hmm> Query format (default: fasta)\n"
        "  -cmd <search|scan>       search: query vs sequence db, scan: sequence vs profile db\n"
        "                           (default: search)\n"
        "  -db <int>                Database index on the daemon (default: 1)\n"
        "  -seqdb_ranges <a..b,...> Restrict a sequence db search to these target ranges\n"
        "  -split_ranges            Search each range in its own session and merge\n"
        "\n"
        "Pipeline (default: daemon defaults):\n"
        "  -E <x>        -T <x>        reporting thresholds (targets)\n"
        "  -domE <x>     -domT <x>     reporting thresholds (domains)\n"
        "  -incE <x>     -incT <x>     inclusion thresholds (targets)\n"
        "  -incdomE <x>  -incdomT <x>  inclusion thresholds (domains)\n"
        "  -F1 <x>  -F2 <x>  -F3 <x>   filter P-value thresholds\n"
        "  -max                        disable all filters\n"
        "  -nobias                     disable the composition bias filter\n"
        "  -nonull2                    disable the null2 score correction\n"
        "  -seed <int>                 random seed (0 = time-based)\n"
        "  -Z <x>  -domZ <x>           effective database sizes\n"
        "  -cut_ga | -cut_tc | -cut_nc model bit score cutoffs\n"
        "\n"
        "Output:\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -outfmt <tab|domtab|json> Output format (default: tab)\n"
        "  -threads <int>           Concurrent sessions (default: all cores)\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version\n",
        prog);
}

// CLI flags carrying a value, and the pipeline option each one sets.
static const char* const kValueFlags[][2] = {
    {"-E", "E"},         {"-T", "T"},
    {"-domE", "domE"},   {"-domT", "domT"},
    {"-incE", "incE"},   {"-incT", "incT"},
    {"-incdomE", "incdomE"}, {"-incdomT", "incdomT"},
    {"-F1", "F1"},       {"-F2", "F2"},  {"-F3", "F3"},
    {"-seed", "seed"},   {"-Z", "Z"},    {"-domZ", "domZ"},
};

static bool collect_pipeline_options(const CliParser& cli, PipelineOptions& options,
                                     std::string& error_msg) {
    for (const auto& f : kValueFlags) {
        if (cli.has(f[0])) options.emplace_back(f[1], cli.get_string(f[0]));
    }
    if (cli.has("-max")) options.emplace_back("max", "true");
    if (cli.has("-nobias")) options.emplace_back("bias_filter", "false");
    if (cli.has("-nonull2")) options.emplace_back("null2", "false");

    int ncut = 0;
    if (cli.has("-cut_ga")) { options.emplace_back("bit_cutoffs", "gathering"); ncut++; }
    if (cli.has("-cut_tc")) { options.emplace_back("bit_cutoffs", "trusted"); ncut++; }
    if (cli.has("-cut_nc")) { options.emplace_back("bit_cutoffs", "noise"); ncut++; }
    if (ncut > 1) {
        error_msg = "-cut_ga, -cut_tc and -cut_nc are mutually exclusive";
        return false;
    }

    PipelineConfig check;
    return build_pipeline_config(options, check, error_msg);
}

// One session: one query against one set of ranges.
struct SearchTask {
    size_t query_idx;
    SeqdbRanges ranges;
};

static bool run_query(Client& client, SearchMode mode, const Query& query, uint32_t db,
                      const SeqdbRanges& ranges, const PipelineOptions& options,
                      TopHits& out, ClientError& err) {
    if (mode == SearchMode::kScan) {
        return client.scan_sequence(static_cast<const SequenceQuery&>(query), db,
                                    options, out, err);
    }
    switch (query.kind()) {
        case QueryKind::kSequence:
            return client.search_sequence(static_cast<const SequenceQuery&>(query),
                                          db, ranges, options, out, err);
        case QueryKind::kAlignment:
            return client.search_alignment(static_cast<const AlignmentQuery&>(query),
                                           db, ranges, options, out, err);
        case QueryKind::kProfile:
            return client.search_model(static_cast<const ProfileQuery&>(query),
                                       db, ranges, options, out, err);
    }
    err.set(ClientErrorKind::kValidation, "unknown query kind");
    return false;
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "hmmdclient")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-query")) {
        std::fprintf(stderr, "Error: -query is required\n");
        print_usage(argv[0]);
        return 1;
    }

    if (cli.has("-socket") && cli.has("-tcp")) {
        std::fprintf(stderr, "Error: -socket and -tcp are mutually exclusive\n");
        return 1;
    }

    Logger logger = make_logger(cli);
    std::string err;

    Endpoint endpoint;
    if (cli.has("-socket")) {
        endpoint.socket_path = cli.get_string("-socket");
    } else if (cli.has("-tcp")) {
        if (!parse_host_port(cli.get_string("-tcp"), endpoint.host, endpoint.port)) {
            std::fprintf(stderr, "Error: invalid -tcp address '%s' (expected host:port)\n",
                         cli.get_string("-tcp").c_str());
            return 1;
        }
    }

    QueryFormat qformat;
    if (!parse_query_format(cli.get_string("-qformat", "fasta"), qformat, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    OutputFormat outfmt;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    SearchMode mode;
    std::string cmd = cli.get_string("-cmd", "search");
    if (cmd == "search") {
        mode = SearchMode::kSearch;
    } else if (cmd == "scan") {
        mode = SearchMode::kScan;
    } else {
        std::fprintf(stderr, "Error: unknown -cmd '%s' (expected search or scan)\n",
                     cmd.c_str());
        return 1;
    }

    if (mode == SearchMode::kScan && qformat != QueryFormat::kFasta) {
        std::fprintf(stderr, "Error: -cmd scan takes sequence queries (-qformat fasta)\n");
        return 1;
    }

    int db = cli.get_int("-db", static_cast<int>(DEFAULT_DB_INDEX));
    if (db < 1) {
        std::fprintf(stderr, "Error: -db must be a positive integer\n");
        return 1;
    }

    SeqdbRanges ranges;
    if (cli.has("-seqdb_ranges")) {
        if (mode == SearchMode::kScan) {
            std::fprintf(stderr, "Error: -seqdb_ranges applies to -cmd search only\n");
            return 1;
        }
        std::vector<SeqdbRange> parsed;
        if (!parse_seqdb_ranges(cli.get_string("-seqdb_ranges"), parsed, err)) {
            std::fprintf(stderr, "Error: -seqdb_ranges: %s\n", err.c_str());
            return 1;
        }
        ranges = std::move(parsed);
    }
    bool split_ranges = cli.has("-split_ranges");
    if (split_ranges && !ranges.has_value()) {
        std::fprintf(stderr, "Error: -split_ranges requires -seqdb_ranges\n");
        return 1;
    }

    PipelineOptions options;
    if (!collect_pipeline_options(cli, options, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    std::vector<std::unique_ptr<Query>> queries;
    if (!load_queries(cli.get_string("-query"), qformat, Alphabet::kUnknown, queries, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }
    logger.info("Read %zu quer%s", queries.size(), queries.size() == 1 ? "y" : "ies");

    // Tasks in query order; ranges of one query stay adjacent.
    std::vector<SearchTask> tasks;
    for (size_t qi = 0; qi < queries.size(); qi++) {
        if (split_ranges) {
            for (const auto& r : *ranges) {
                tasks.push_back({qi, std::vector<SeqdbRange>{r}});
            }
        } else {
            tasks.push_back({qi, ranges});
        }
    }

    std::vector<TopHits> task_results(tasks.size());
    std::vector<ClientError> task_errors(tasks.size());

    int num_threads = resolve_threads(cli);
    logger.debug("Running %zu session(s) on %d thread(s) against %s",
                 tasks.size(), num_threads, endpoint.describe().c_str());

    tbb::task_arena arena(num_threads);
    arena.execute([&] {
        tbb::parallel_for(
            tbb::blocked_range<size_t>(0, tasks.size(), 1),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    const SearchTask& t = tasks[i];
                    ScopedSession session(endpoint, logger);
                    if (!session.ok()) {
                        task_errors[i] = session.error();
                        continue;
                    }
                    const Query& q = *queries[t.query_idx];
                    if (!run_query(session.client(), mode, q, static_cast<uint32_t>(db),
                                   t.ranges, options, task_results[i], task_errors[i])) {
                        logger.debug("Session for %s failed", q.name().c_str());
                    }
                }
            });
    });

    bool failed = false;
    for (size_t i = 0; i < tasks.size(); i++) {
        if (!task_errors[i].ok()) {
            std::fprintf(stderr, "Error: %s: %s\n",
                         queries[tasks[i].query_idx]->name().c_str(),
                         task_errors[i].describe().c_str());
            failed = true;
        }
    }
    if (failed) return 1;

    // Combine per query, in input order.
    std::vector<TopHits> results;
    results.reserve(queries.size());
    for (size_t i = 0; i < tasks.size(); i++) {
        if (i == 0 || tasks[i].query_idx != tasks[i - 1].query_idx) {
            results.push_back(std::move(task_results[i]));
            continue;
        }
        if (!results.back().merge(task_results[i], err)) {
            std::fprintf(stderr, "Error: %s: %s\n",
                         queries[tasks[i].query_idx]->name().c_str(), err.c_str());
            return 1;
        }
    }
    if (split_ranges) {
        for (auto& th : results) {
            th.sort(SortBy::kKey);
            th.threshold();
        }
    }

    if (!write_all_results(cli.get_string("-o"), results, outfmt, err)) {
        std::fprintf(stderr, "Error: %s\n", err.c_str());
        return 1;
    }

    size_t nreported = 0;
    for (const auto& th : results) nreported += th.nreported();
    logger.info("Done. %zu hit(s) reported.", nreported);
    return 0;
}
