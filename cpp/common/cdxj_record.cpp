// cpp/common/cdxj_record.cpp
#include "cdxj_record.h"

#include <algorithm>
#include <cstring>

#include "cdxj_errors.h"

namespace {

static inline std::size_t skip_seps(std::string_view s, std::size_t i) {
    while (i < s.size() && is_field_sep(s[i])) ++i;
    return i;
}

static inline std::size_t find_sep(std::string_view s, std::size_t i) {
    while (i < s.size() && !is_field_sep(s[i])) ++i;
    return i;
}

} // namespace

bool split_record(std::string_view line, CdxjRecord& out) {
    line = strip_newline(line);

    const std::size_t e1 = find_sep(line, 0);
    if (e1 == 0 || e1 == line.size()) return false;

    const std::size_t s2 = skip_seps(line, e1);
    const std::size_t e2 = find_sep(line, s2);
    // second boundary is required, even if the payload ends up empty
    if (e2 == s2 || e2 == line.size()) return false;

    const std::size_t s3 = skip_seps(line, e2);

    out.surt      = line.substr(0, e1);
    out.timestamp = line.substr(s2, e2 - s2);
    out.payload   = line.substr(s3);
    return true;
}

CdxjRecord parse_record(std::string_view line,
                        const std::string& source,
                        std::uint64_t line_no,
                        std::uint64_t byte_offset) {
    CdxjRecord rec;
    if (!split_record(line, rec)) {
        std::string head(strip_newline(line).substr(0, 80));
        throw MalformedRecord("expected '<surt> <timestamp> <payload>', got '" + head + "'",
                              source, line_no, byte_offset);
    }
    return rec;
}

std::string_view surt_of(std::string_view line) {
    line = strip_newline(line);
    const std::size_t e1 = find_sep(line, 0);
    if (e1 == line.size()) return {};
    return line.substr(0, e1);
}

int compare_bytes(std::string_view a, std::string_view b) {
    const std::size_t n = std::min(a.size(), b.size());
    if (n > 0) {
        const int c = std::memcmp(a.data(), b.data(), n);
        if (c != 0) return c < 0 ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

int compare_keys(const CdxjRecord& a, const CdxjRecord& b) {
    const int c = compare_bytes(a.surt, b.surt);
    if (c != 0) return c;
    return compare_bytes(a.timestamp, b.timestamp);
}
