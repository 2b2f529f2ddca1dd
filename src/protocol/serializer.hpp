#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "protocol/byte_io.hpp"
#include "protocol/messages.hpp"
#include "result/hit.hpp"
#include "result/seqdb_range.hpp"

namespace hmmdc {

// Decoding. Each function reads through the cursor of r, advancing it
// by exactly the consumed length on success. On malformed data it
// returns false and sets error_msg; the cursor position is then
// unspecified.

// Decode the fixed-size status header. Fails on a short buffer or on a
// status code outside the known enumeration.
bool decode_status_header(const uint8_t* data, size_t size,
                          SearchStatus& out, std::string& error_msg);

// Decode the statistics block including its nhits-entry offset table.
bool decode_search_stats(ByteReader& r, SearchStats& out, std::string& error_msg);

// Decode one hit record with its nested domain and alignment records.
bool decode_hit(ByteReader& r, Hit& out, std::string& error_msg);

// Encoding, the daemon side of the same layouts.

void encode_status_header(const SearchStatus& status, std::vector<uint8_t>& buf);
void encode_search_stats(const SearchStats& stats, std::vector<uint8_t>& buf);
void encode_hit(const Hit& hit, std::vector<uint8_t>& buf);

// Encode a statistics block and the given hits as one success payload.
// nhits and hit_offsets of stats are overwritten with the actual values.
std::vector<uint8_t> encode_search_payload(SearchStats stats, const std::vector<Hit>& hits);

// Render the request line:
//   @--seqdb <db>[ --seqdb_ranges a..b,c..d][ <options>]\n
//   @--hmmdb <db>[ <options>]\n
// ranges may be null; it is ignored in scan mode.
std::string encode_request_line(SearchMode mode, uint32_t db,
                                const std::vector<SeqdbRange>* ranges,
                                const std::string& options);

} // namespace hmmdc
