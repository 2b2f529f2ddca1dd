#include "io/result_writer.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>

namespace hmmdc {

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "domtab") {
        out = OutputFormat::kDomtab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else {
        error_msg = "unknown output format '" + str + "' (expected tab, domtab or json)";
        return false;
    }
    return true;
}

static std::string or_dash(const std::string& s) {
    return s.empty() ? std::string("-") : s;
}

static std::string fmt_evalue(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2g", v);
    return buf;
}

static std::string fmt_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", v);
    return buf;
}

static std::string fmt_fixed(double v, int prec) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", prec, v);
    return buf;
}

void write_results_tab(std::ostream& out, const std::vector<TopHits>& results) {
    out << "# target\taccession\tquery\tfull_E\tfull_score\tfull_bias\t"
           "best_E\tbest_score\tbest_bias\texp\treg\tclu\tov\tenv\tdom\trep\tinc\t"
           "description\n";
    for (const auto& th : results) {
        for (size_t i : th.reported()) {
            const Hit& h = th[i];
            out << h.display_name() << '\t'
                << or_dash(h.accession) << '\t'
                << or_dash(th.query_name()) << '\t'
                << fmt_evalue(th.evalue(h)) << '\t'
                << fmt_score(h.score) << '\t'
                << fmt_score(h.bias()) << '\t';
            if (h.best_domain < h.domains.size()) {
                const Domain& d = h.domains[h.best_domain];
                out << fmt_evalue(th.i_evalue(d)) << '\t'
                    << fmt_score(d.score) << '\t'
                    << fmt_score(d.bias) << '\t';
            } else {
                out << "-\t-\t-\t";
            }
            out << fmt_fixed(h.nexpected, 1) << '\t'
                << h.nregions << '\t'
                << h.nclustered << '\t'
                << h.noverlaps << '\t'
                << h.nenvelopes << '\t'
                << h.domains.size() << '\t'
                << h.nreported << '\t'
                << h.nincluded << '\t'
                << or_dash(h.description) << '\n';
        }
    }
}

void write_results_domtab(std::ostream& out, const std::vector<TopHits>& results) {
    out << "# target\taccession\ttlen\tquery\tqlen\tfull_E\tfull_score\tfull_bias\t"
           "dom\tndom\tc_E\ti_E\tscore\tbias\thmm_from\thmm_to\tali_from\tali_to\t"
           "env_from\tenv_to\tacc\tdescription\n";
    for (const auto& th : results) {
        for (size_t i : th.reported()) {
            const Hit& h = th[i];
            size_t ndom = h.nreported;
            size_t k = 0;
            for (const auto& d : h.domains) {
                if (!d.reported) continue;
                k++;
                const Alignment& a = d.alignment;
                int64_t env_len = static_cast<int64_t>(d.env_to) - d.env_from + 1;
                double acc = env_len > 0 ? d.oasc / static_cast<double>(env_len) : 0.0;
                out << h.display_name() << '\t'
                    << or_dash(h.accession) << '\t'
                    << a.target_length << '\t'
                    << or_dash(th.query_name()) << '\t'
                    << a.hmm_length << '\t'
                    << fmt_evalue(th.evalue(h)) << '\t'
                    << fmt_score(h.score) << '\t'
                    << fmt_score(h.bias()) << '\t'
                    << k << '\t'
                    << ndom << '\t'
                    << fmt_evalue(th.c_evalue(d)) << '\t'
                    << fmt_evalue(th.i_evalue(d)) << '\t'
                    << fmt_score(d.score) << '\t'
                    << fmt_score(d.bias) << '\t'
                    << a.hmm_from << '\t'
                    << a.hmm_to << '\t'
                    << d.ali_from << '\t'
                    << d.ali_to << '\t'
                    << d.env_from << '\t'
                    << d.env_to << '\t'
                    << fmt_fixed(acc, 2) << '\t'
                    << or_dash(h.description) << '\n';
            }
        }
    }
}

static Json::Value alignment_to_json(const Alignment& a) {
    Json::Value obj;
    obj["hmm_from"] = a.hmm_from;
    obj["hmm_to"] = a.hmm_to;
    obj["hmm_length"] = a.hmm_length;
    obj["hmm_name"] = a.hmm_name;
    obj["target_from"] = static_cast<Json::Int64>(a.target_from);
    obj["target_to"] = static_cast<Json::Int64>(a.target_to);
    obj["target_length"] = static_cast<Json::Int64>(a.target_length);
    obj["target_name"] = a.target_name;
    obj["hmm_sequence"] = a.hmm_sequence;
    obj["identity_sequence"] = a.identity_sequence;
    obj["target_sequence"] = a.target_sequence;
    if (!a.pp_line.empty()) obj["pp"] = a.pp_line;
    if (!a.cs_line.empty()) obj["cs"] = a.cs_line;
    if (!a.rf_line.empty()) obj["rf"] = a.rf_line;
    return obj;
}

Json::Value results_to_json(const TopHits& th) {
    Json::Value result;
    result["query"] = th.query_name();
    result["mode"] = search_mode_name(th.mode());
    result["alphabet"] = alphabet_name(th.alphabet());

    const SearchStats& st = th.stats();
    Json::Value stats;
    stats["Z"] = st.Z;
    stats["Z_setby"] = zsetby_name(st.Z_setby);
    stats["domZ"] = st.domZ;
    stats["domZ_setby"] = zsetby_name(st.domZ_setby);
    stats["nmodels"] = static_cast<Json::UInt64>(st.nmodels);
    stats["nseqs"] = static_cast<Json::UInt64>(st.nseqs);
    stats["nres"] = static_cast<Json::UInt64>(st.nres);
    stats["n_past_msv"] = static_cast<Json::UInt64>(st.n_past_msv);
    stats["n_past_bias"] = static_cast<Json::UInt64>(st.n_past_bias);
    stats["n_past_vit"] = static_cast<Json::UInt64>(st.n_past_vit);
    stats["n_past_fwd"] = static_cast<Json::UInt64>(st.n_past_fwd);
    stats["nhits"] = static_cast<Json::UInt64>(th.size());
    stats["nreported"] = static_cast<Json::UInt64>(th.nreported());
    stats["nincluded"] = static_cast<Json::UInt64>(th.nincluded());
    stats["elapsed"] = st.elapsed;
    result["stats"] = stats;

    Json::Value hits_arr(Json::arrayValue);
    for (size_t i : th.reported()) {
        const Hit& h = th[i];
        Json::Value hobj;
        hobj["target"] = h.display_name();
        hobj["seqidx"] = static_cast<Json::UInt64>(h.seqidx);
        if (!h.accession.empty()) hobj["accession"] = h.accession;
        if (!h.description.empty()) hobj["description"] = h.description;
        hobj["evalue"] = th.evalue(h);
        hobj["score"] = h.score;
        hobj["bias"] = h.bias();
        hobj["included"] = h.is_included();

        Json::Value doms(Json::arrayValue);
        for (const auto& d : h.domains) {
            if (!d.reported) continue;
            Json::Value dobj;
            dobj["env_from"] = static_cast<Json::Int64>(d.env_from);
            dobj["env_to"] = static_cast<Json::Int64>(d.env_to);
            dobj["ali_from"] = static_cast<Json::Int64>(d.ali_from);
            dobj["ali_to"] = static_cast<Json::Int64>(d.ali_to);
            dobj["score"] = d.score;
            dobj["bias"] = d.bias;
            dobj["c_evalue"] = th.c_evalue(d);
            dobj["i_evalue"] = th.i_evalue(d);
            dobj["included"] = d.included;
            dobj["alignment"] = alignment_to_json(d.alignment);
            doms.append(dobj);
        }
        hobj["domains"] = doms;
        hits_arr.append(hobj);
    }
    result["hits"] = hits_arr;
    return result;
}

void write_results_json(std::ostream& out, const std::vector<TopHits>& results) {
    Json::Value root;
    Json::Value arr(Json::arrayValue);
    for (const auto& th : results) {
        arr.append(results_to_json(th));
    }
    root["results"] = arr;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &out);
    out << '\n';
}

void write_results(std::ostream& out, const std::vector<TopHits>& results,
                   OutputFormat fmt) {
    switch (fmt) {
        case OutputFormat::kTab:
            write_results_tab(out, results);
            break;
        case OutputFormat::kDomtab:
            write_results_domtab(out, results);
            break;
        case OutputFormat::kJson:
            write_results_json(out, results);
            break;
    }
}

bool write_all_results(const std::string& output_path,
                       const std::vector<TopHits>& results,
                       OutputFormat fmt, std::string& error_msg) {
    if (output_path.empty() || output_path == "-") {
        write_results(std::cout, results, fmt);
        std::cout.flush();
        if (!std::cout) {
            error_msg = "failed writing to stdout";
            return false;
        }
        return true;
    }
    std::ofstream out(output_path);
    if (!out.is_open()) {
        error_msg = "cannot open output file " + output_path;
        return false;
    }
    write_results(out, results, fmt);
    out.flush();
    if (!out) {
        error_msg = "failed writing " + output_path;
        return false;
    }
    return true;
}

} // namespace hmmdc
