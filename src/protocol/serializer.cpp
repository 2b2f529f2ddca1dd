#include "protocol/serializer.hpp"

#include "protocol/wire_schema.hpp"

namespace hmmdc {

static bool fail(std::string& error_msg, const std::string& what, size_t pos) {
    error_msg = what + " at payload offset " + std::to_string(pos);
    return false;
}

// --- Status header ---

bool decode_status_header(const uint8_t* data, size_t size,
                          SearchStatus& out, std::string& error_msg) {
    ByteReader r(data, size);
    FixedBlock b;
    if (!r.get_block(STATUS_HEADER_SIZE, b)) {
        error_msg = "status header truncated (" + std::to_string(size) + " of " +
                    std::to_string(STATUS_HEADER_SIZE) + " bytes)";
        return false;
    }
    uint32_t status = b.u32(STATUS_FIELDS[status_field::kStatus]);
    if (!is_known_status(status)) {
        error_msg = "unknown status code " + std::to_string(status);
        return false;
    }
    out.status = status;
    out.msg_size = b.u64(STATUS_FIELDS[status_field::kMsgSize]);
    return true;
}

void encode_status_header(const SearchStatus& status, std::vector<uint8_t>& buf) {
    FixedBlockWriter w(buf, STATUS_HEADER_SIZE);
    w.put(STATUS_FIELDS[status_field::kStatus], status.status);
    w.put(STATUS_FIELDS[status_field::kMsgSize], status.msg_size);
}

// --- Statistics block ---

static bool to_zsetby(uint8_t v, ZSetBy& out) {
    if (v > static_cast<uint8_t>(ZSetBy::kFileInfo)) return false;
    out = static_cast<ZSetBy>(v);
    return true;
}

bool decode_search_stats(ByteReader& r, SearchStats& out, std::string& error_msg) {
    size_t start = r.pos();
    FixedBlock b;
    if (!r.get_block(STATS_BASE_SIZE, b)) {
        return fail(error_msg, "statistics block truncated", start);
    }

    const auto* f = STATS_FIELDS;
    out.elapsed = b.f64(f[stats_field::kElapsed]);
    out.user = b.f64(f[stats_field::kUser]);
    out.sys = b.f64(f[stats_field::kSys]);
    out.Z = b.f64(f[stats_field::kZ]);
    out.domZ = b.f64(f[stats_field::kDomZ]);
    if (!to_zsetby(b.u8(f[stats_field::kZSetBy]), out.Z_setby) ||
        !to_zsetby(b.u8(f[stats_field::kDomZSetBy]), out.domZ_setby)) {
        return fail(error_msg, "invalid Z provenance", start);
    }
    out.nmodels = b.u64(f[stats_field::kNModels]);
    out.nnodes = b.u64(f[stats_field::kNNodes]);
    out.nseqs = b.u64(f[stats_field::kNSeqs]);
    out.nres = b.u64(f[stats_field::kNRes]);
    out.n_past_msv = b.u64(f[stats_field::kNPastMsv]);
    out.n_past_bias = b.u64(f[stats_field::kNPastBias]);
    out.n_past_vit = b.u64(f[stats_field::kNPastVit]);
    out.n_past_fwd = b.u64(f[stats_field::kNPastFwd]);
    out.nhits = b.u64(f[stats_field::kNHits]);
    out.nreported = b.u64(f[stats_field::kNReported]);
    out.nincluded = b.u64(f[stats_field::kNIncluded]);

    // Check the table fits before sizing anything from the declared count
    if (out.nhits > r.remaining() / 8) {
        return fail(error_msg, "hit offset table of " + std::to_string(out.nhits) +
                    " entries exceeds payload", r.pos());
    }
    out.hit_offsets.resize(out.nhits);
    for (uint64_t i = 0; i < out.nhits; i++) {
        if (!r.get_u64(out.hit_offsets[i])) {
            return fail(error_msg, "hit offset table truncated", r.pos());
        }
    }
    return true;
}

void encode_search_stats(const SearchStats& stats, std::vector<uint8_t>& buf) {
    FixedBlockWriter w(buf, STATS_BASE_SIZE);
    const auto* f = STATS_FIELDS;
    w.put_f64(f[stats_field::kElapsed], stats.elapsed);
    w.put_f64(f[stats_field::kUser], stats.user);
    w.put_f64(f[stats_field::kSys], stats.sys);
    w.put_f64(f[stats_field::kZ], stats.Z);
    w.put_f64(f[stats_field::kDomZ], stats.domZ);
    w.put(f[stats_field::kZSetBy], static_cast<uint8_t>(stats.Z_setby));
    w.put(f[stats_field::kDomZSetBy], static_cast<uint8_t>(stats.domZ_setby));
    w.put(f[stats_field::kNModels], stats.nmodels);
    w.put(f[stats_field::kNNodes], stats.nnodes);
    w.put(f[stats_field::kNSeqs], stats.nseqs);
    w.put(f[stats_field::kNRes], stats.nres);
    w.put(f[stats_field::kNPastMsv], stats.n_past_msv);
    w.put(f[stats_field::kNPastBias], stats.n_past_bias);
    w.put(f[stats_field::kNPastVit], stats.n_past_vit);
    w.put(f[stats_field::kNPastFwd], stats.n_past_fwd);
    w.put(f[stats_field::kNHits], stats.nhits);
    w.put(f[stats_field::kNReported], stats.nreported);
    w.put(f[stats_field::kNIncluded], stats.nincluded);
    for (uint64_t off : stats.hit_offsets) {
        put_u64(buf, off);
    }
}

// --- Alignment record ---

static bool decode_alignment(ByteReader& r, Alignment& a, std::string& error_msg) {
    size_t start = r.pos();
    FixedBlock b;
    if (!r.get_block(ALIGNMENT_FIXED_SIZE, b)) {
        return fail(error_msg, "alignment record truncated", start);
    }

    const auto* f = ALIGNMENT_FIELDS;
    uint32_t record_size = b.u32(f[alignment_field::kRecordSize]);
    a.length = b.u32(f[alignment_field::kN]);
    a.hmm_from = b.i32(f[alignment_field::kHmmFrom]);
    a.hmm_to = b.i32(f[alignment_field::kHmmTo]);
    a.hmm_length = b.i32(f[alignment_field::kM]);
    a.target_from = b.i64(f[alignment_field::kSqFrom]);
    a.target_to = b.i64(f[alignment_field::kSqTo]);
    a.target_length = b.i64(f[alignment_field::kL]);
    uint8_t mask = b.u8(f[alignment_field::kLineMask]);

    // Optional lines stay empty when their bit is clear
    struct Line {
        uint8_t bit;          // 0 = always present
        std::string* dst;
        bool aligned;         // must be exactly N characters
    };
    const Line lines[] = {
        {kAliHasRf,      &a.rf_line,            true},
        {kAliHasMm,      &a.mm_line,            true},
        {kAliHasCs,      &a.cs_line,            true},
        {0,              &a.hmm_sequence,       true},
        {0,              &a.identity_sequence,  true},
        {0,              &a.target_sequence,    true},
        {kAliHasPp,      &a.pp_line,            true},
        {0,              &a.hmm_name,           false},
        {kAliHasHmmAcc,  &a.hmm_accession,      false},
        {kAliHasHmmDesc, &a.hmm_description,    false},
        {0,              &a.target_name,        false},
        {kAliHasSqAcc,   &a.target_accession,   false},
        {kAliHasSqDesc,  &a.target_description, false},
    };
    for (const auto& line : lines) {
        line.dst->clear();
        if (line.bit != 0 && (mask & line.bit) == 0) continue;
        if (!r.get_cstr(*line.dst)) {
            return fail(error_msg, "unterminated alignment string", r.pos());
        }
        if (line.aligned && line.dst->size() != a.length) {
            return fail(error_msg, "alignment line length " +
                        std::to_string(line.dst->size()) + " != N=" +
                        std::to_string(a.length), r.pos());
        }
    }

    if (r.pos() - start != record_size) {
        return fail(error_msg, "alignment record_size " + std::to_string(record_size) +
                    " != consumed " + std::to_string(r.pos() - start), start);
    }
    return true;
}

static void encode_alignment(const Alignment& a, std::vector<uint8_t>& buf) {
    uint8_t mask = 0;
    if (!a.rf_line.empty()) mask |= kAliHasRf;
    if (!a.mm_line.empty()) mask |= kAliHasMm;
    if (!a.cs_line.empty()) mask |= kAliHasCs;
    if (!a.pp_line.empty()) mask |= kAliHasPp;
    if (!a.hmm_accession.empty()) mask |= kAliHasHmmAcc;
    if (!a.hmm_description.empty()) mask |= kAliHasHmmDesc;
    if (!a.target_accession.empty()) mask |= kAliHasSqAcc;
    if (!a.target_description.empty()) mask |= kAliHasSqDesc;

    FixedBlockWriter w(buf, ALIGNMENT_FIXED_SIZE);
    const auto* f = ALIGNMENT_FIELDS;
    w.put(f[alignment_field::kN], static_cast<uint32_t>(a.target_sequence.size()));
    w.put(f[alignment_field::kHmmFrom], static_cast<uint32_t>(a.hmm_from));
    w.put(f[alignment_field::kHmmTo], static_cast<uint32_t>(a.hmm_to));
    w.put(f[alignment_field::kM], static_cast<uint32_t>(a.hmm_length));
    w.put(f[alignment_field::kSqFrom], static_cast<uint64_t>(a.target_from));
    w.put(f[alignment_field::kSqTo], static_cast<uint64_t>(a.target_to));
    w.put(f[alignment_field::kL], static_cast<uint64_t>(a.target_length));
    w.put(f[alignment_field::kLineMask], mask);

    if (mask & kAliHasRf) put_cstr(buf, a.rf_line);
    if (mask & kAliHasMm) put_cstr(buf, a.mm_line);
    if (mask & kAliHasCs) put_cstr(buf, a.cs_line);
    put_cstr(buf, a.hmm_sequence);
    put_cstr(buf, a.identity_sequence);
    put_cstr(buf, a.target_sequence);
    if (mask & kAliHasPp) put_cstr(buf, a.pp_line);
    put_cstr(buf, a.hmm_name);
    if (mask & kAliHasHmmAcc) put_cstr(buf, a.hmm_accession);
    if (mask & kAliHasHmmDesc) put_cstr(buf, a.hmm_description);
    put_cstr(buf, a.target_name);
    if (mask & kAliHasSqAcc) put_cstr(buf, a.target_accession);
    if (mask & kAliHasSqDesc) put_cstr(buf, a.target_description);

    patch_u32(buf, w.start(), static_cast<uint32_t>(buf.size() - w.start()));
}

// --- Domain record ---

static bool decode_domain(ByteReader& r, Domain& d, std::string& error_msg) {
    size_t start = r.pos();
    FixedBlock b;
    if (!r.get_block(DOMAIN_FIXED_SIZE, b)) {
        return fail(error_msg, "domain record truncated", start);
    }

    const auto* f = DOMAIN_FIELDS;
    uint32_t record_size = b.u32(f[domain_field::kRecordSize]);
    d.env_from = b.i64(f[domain_field::kIEnv]);
    d.env_to = b.i64(f[domain_field::kJEnv]);
    d.ali_from = b.i64(f[domain_field::kIAli]);
    d.ali_to = b.i64(f[domain_field::kJAli]);
    d.envelope_score = b.f32(f[domain_field::kEnvsc]);
    d.correction = b.f32(f[domain_field::kDomCorrection]);
    d.bias = b.f32(f[domain_field::kDomBias]);
    d.oasc = b.f32(f[domain_field::kOasc]);
    d.score = b.f32(f[domain_field::kBitscore]);
    d.lnP = b.f64(f[domain_field::kLnP]);
    d.reported = b.u32(f[domain_field::kIsReported]) != 0;
    d.included = b.u32(f[domain_field::kIsIncluded]) != 0;

    uint32_t npos = b.u32(f[domain_field::kNScoresPerPos]);
    if (npos > r.remaining() / 4) {
        return fail(error_msg, "per-position score array exceeds payload", r.pos());
    }
    d.scores_per_pos.resize(npos);
    for (uint32_t i = 0; i < npos; i++) {
        if (!r.get_f32(d.scores_per_pos[i])) {
            return fail(error_msg, "per-position scores truncated", r.pos());
        }
    }

    if (!decode_alignment(r, d.alignment, error_msg)) return false;

    if (r.pos() - start != record_size) {
        return fail(error_msg, "domain record_size " + std::to_string(record_size) +
                    " != consumed " + std::to_string(r.pos() - start), start);
    }
    return true;
}

static void encode_domain(const Domain& d, std::vector<uint8_t>& buf) {
    FixedBlockWriter w(buf, DOMAIN_FIXED_SIZE);
    const auto* f = DOMAIN_FIELDS;
    w.put(f[domain_field::kIEnv], static_cast<uint64_t>(d.env_from));
    w.put(f[domain_field::kJEnv], static_cast<uint64_t>(d.env_to));
    w.put(f[domain_field::kIAli], static_cast<uint64_t>(d.ali_from));
    w.put(f[domain_field::kJAli], static_cast<uint64_t>(d.ali_to));
    w.put_f32(f[domain_field::kEnvsc], d.envelope_score);
    w.put_f32(f[domain_field::kDomCorrection], d.correction);
    w.put_f32(f[domain_field::kDomBias], d.bias);
    w.put_f32(f[domain_field::kOasc], d.oasc);
    w.put_f32(f[domain_field::kBitscore], d.score);
    w.put_f64(f[domain_field::kLnP], d.lnP);
    w.put(f[domain_field::kIsReported], d.reported ? 1 : 0);
    w.put(f[domain_field::kIsIncluded], d.included ? 1 : 0);
    w.put(f[domain_field::kNScoresPerPos], static_cast<uint32_t>(d.scores_per_pos.size()));
    for (float s : d.scores_per_pos) {
        put_f32(buf, s);
    }
    encode_alignment(d.alignment, buf);
    patch_u32(buf, w.start(), static_cast<uint32_t>(buf.size() - w.start()));
}

// --- Hit record ---

bool decode_hit(ByteReader& r, Hit& out, std::string& error_msg) {
    size_t start = r.pos();
    FixedBlock b;
    if (!r.get_block(HIT_FIXED_SIZE, b)) {
        return fail(error_msg, "hit record truncated", start);
    }

    const auto* f = HIT_FIELDS;
    uint32_t record_size = b.u32(f[hit_field::kRecordSize]);
    out.window_length = b.u32(f[hit_field::kWindowLength]);
    out.sortkey = b.f64(f[hit_field::kSortkey]);
    out.score = b.f32(f[hit_field::kScore]);
    out.pre_score = b.f32(f[hit_field::kPreScore]);
    out.sum_score = b.f32(f[hit_field::kSumScore]);
    out.lnP = b.f64(f[hit_field::kLnP]);
    out.pre_lnP = b.f64(f[hit_field::kPreLnP]);
    out.sum_lnP = b.f64(f[hit_field::kSumLnP]);
    out.nexpected = b.f32(f[hit_field::kNExpected]);
    out.nregions = b.u32(f[hit_field::kNRegions]);
    out.nclustered = b.u32(f[hit_field::kNClustered]);
    out.noverlaps = b.u32(f[hit_field::kNOverlaps]);
    out.nenvelopes = b.u32(f[hit_field::kNEnvelopes]);
    out.flags = b.u32(f[hit_field::kFlags]);
    out.nreported = b.u32(f[hit_field::kNReported]);
    out.nincluded = b.u32(f[hit_field::kNIncluded]);
    out.best_domain = b.u32(f[hit_field::kBestDomain]);
    out.seqidx = b.u64(f[hit_field::kSeqidx]);
    out.subseq_start = b.u64(f[hit_field::kSubseqStart]);
    uint32_t ndom = b.u32(f[hit_field::kNDom]);
    uint8_t mask = b.u8(f[hit_field::kStringMask]);

    out.name.clear();
    out.accession.clear();
    out.description.clear();
    if ((mask & kHitHasName) && !r.get_cstr(out.name)) {
        return fail(error_msg, "unterminated hit name", r.pos());
    }
    if ((mask & kHitHasAcc) && !r.get_cstr(out.accession)) {
        return fail(error_msg, "unterminated hit accession", r.pos());
    }
    if ((mask & kHitHasDesc) && !r.get_cstr(out.description)) {
        return fail(error_msg, "unterminated hit description", r.pos());
    }

    if (ndom > r.remaining() / (DOMAIN_FIXED_SIZE + ALIGNMENT_FIXED_SIZE)) {
        return fail(error_msg, "domain count " + std::to_string(ndom) +
                    " exceeds payload", r.pos());
    }
    if (ndom > 0 && out.best_domain >= ndom) {
        return fail(error_msg, "best_domain " + std::to_string(out.best_domain) +
                    " out of range", start);
    }

    out.domains.clear();
    out.domains.resize(ndom);
    for (uint32_t i = 0; i < ndom; i++) {
        if (!decode_domain(r, out.domains[i], error_msg)) return false;
    }

    if (r.pos() - start != record_size) {
        return fail(error_msg, "hit record_size " + std::to_string(record_size) +
                    " != consumed " + std::to_string(r.pos() - start), start);
    }
    return true;
}

void encode_hit(const Hit& hit, std::vector<uint8_t>& buf) {
    uint8_t mask = 0;
    if (!hit.name.empty()) mask |= kHitHasName;
    if (!hit.accession.empty()) mask |= kHitHasAcc;
    if (!hit.description.empty()) mask |= kHitHasDesc;

    FixedBlockWriter w(buf, HIT_FIXED_SIZE);
    const auto* f = HIT_FIELDS;
    w.put(f[hit_field::kWindowLength], hit.window_length);
    w.put_f64(f[hit_field::kSortkey], hit.sortkey);
    w.put_f32(f[hit_field::kScore], hit.score);
    w.put_f32(f[hit_field::kPreScore], hit.pre_score);
    w.put_f32(f[hit_field::kSumScore], hit.sum_score);
    w.put_f64(f[hit_field::kLnP], hit.lnP);
    w.put_f64(f[hit_field::kPreLnP], hit.pre_lnP);
    w.put_f64(f[hit_field::kSumLnP], hit.sum_lnP);
    w.put_f32(f[hit_field::kNExpected], hit.nexpected);
    w.put(f[hit_field::kNRegions], hit.nregions);
    w.put(f[hit_field::kNClustered], hit.nclustered);
    w.put(f[hit_field::kNOverlaps], hit.noverlaps);
    w.put(f[hit_field::kNEnvelopes], hit.nenvelopes);
    w.put(f[hit_field::kFlags], hit.flags);
    w.put(f[hit_field::kNReported], hit.nreported);
    w.put(f[hit_field::kNIncluded], hit.nincluded);
    w.put(f[hit_field::kBestDomain], hit.best_domain);
    w.put(f[hit_field::kSeqidx], hit.seqidx);
    w.put(f[hit_field::kSubseqStart], hit.subseq_start);
    w.put(f[hit_field::kNDom], static_cast<uint32_t>(hit.domains.size()));
    w.put(f[hit_field::kStringMask], mask);

    if (mask & kHitHasName) put_cstr(buf, hit.name);
    if (mask & kHitHasAcc) put_cstr(buf, hit.accession);
    if (mask & kHitHasDesc) put_cstr(buf, hit.description);

    for (const auto& d : hit.domains) {
        encode_domain(d, buf);
    }
    patch_u32(buf, w.start(), static_cast<uint32_t>(buf.size() - w.start()));
}

std::vector<uint8_t> encode_search_payload(SearchStats stats, const std::vector<Hit>& hits) {
    std::vector<uint8_t> records;
    stats.hit_offsets.clear();
    for (const auto& h : hits) {
        stats.hit_offsets.push_back(records.size());
        encode_hit(h, records);
    }
    stats.nhits = hits.size();

    std::vector<uint8_t> buf;
    buf.reserve(STATS_BASE_SIZE + 8 * hits.size() + records.size());
    encode_search_stats(stats, buf);
    buf.insert(buf.end(), records.begin(), records.end());
    return buf;
}

// --- Request line ---

std::string encode_request_line(SearchMode mode, uint32_t db,
                                const std::vector<SeqdbRange>* ranges,
                                const std::string& options) {
    std::string line = (mode == SearchMode::kScan) ? "@--hmmdb " : "@--seqdb ";
    line += std::to_string(db);

    if (mode == SearchMode::kSearch && ranges != nullptr && !ranges->empty()) {
        line += " --seqdb_ranges ";
        for (size_t i = 0; i < ranges->size(); i++) {
            if (i > 0) line += ',';
            line += std::to_string((*ranges)[i].start);
            line += "..";
            line += std::to_string((*ranges)[i].end);
        }
    }

    if (!options.empty()) {
        line += ' ';
        line += options;
    }
    line += '\n';
    return line;
}

} // namespace hmmdc
