#include "protocol/messages.hpp"

namespace hmmdc {

static const char* const kStatusNames[] = {
    "OK", "FAIL", "EOL", "EOF", "EOD", "EMEM", "ENOTFOUND", "EFORMAT",
    "EAMBIGUOUS", "EDIVZERO", "EINCOMPAT", "EINVAL", "ESYS", "ECORRUPT",
    "EINCONCEIVABLE", "ESYNTAX", "ERANGE", "EDUP", "ENOHALT", "ENORESULT",
    "ENODATA", "ETYPE", "EOVERWRITE", "ENOSPACE", "EUNIMPLEMENTED",
    "ENOFORMAT", "ENOALPHABET", "EWRITE", "EINACCURATE",
};
static_assert(sizeof(kStatusNames) / sizeof(kStatusNames[0]) ==
                  static_cast<size_t>(StatusCode::kEInaccurate) + 1,
              "status name table must cover the enumeration");

bool is_known_status(uint32_t code) {
    return code <= static_cast<uint32_t>(StatusCode::kEInaccurate);
}

const char* status_name(uint32_t code) {
    return is_known_status(code) ? kStatusNames[code] : "UNKNOWN";
}

} // namespace hmmdc
