// cpp/common/cdxj_record.h
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

// One index line: "<surt> <timestamp> <payload>".
// Views point into the caller's line buffer; payload is never interpreted.
struct CdxjRecord {
    std::string_view surt;
    std::string_view timestamp;
    std::string_view payload;
};

// Field separators of the first two whitespace runs.
inline bool is_field_sep(char c) { return c == ' ' || c == '\t'; }

// Strip one trailing '\n' (the line terminator is not part of the record).
inline std::string_view strip_newline(std::string_view line) {
    if (!line.empty() && line.back() == '\n') line.remove_suffix(1);
    return line;
}

// Split on the first two whitespace runs. Returns false when the line has fewer
// than two boundaries or an empty surt.
bool split_record(std::string_view line, CdxjRecord& out);

// Same as split_record but throws MalformedRecord with position info.
CdxjRecord parse_record(std::string_view line,
                        const std::string& source,
                        std::uint64_t line_no,
                        std::uint64_t byte_offset);

// Only the surt (first field). Empty view if the line has no separator.
std::string_view surt_of(std::string_view line);

// Raw unsigned byte order; a proper prefix sorts first.
int compare_bytes(std::string_view a, std::string_view b);

// Sort key order: surt, then timestamp. Payload does not participate.
int compare_keys(const CdxjRecord& a, const CdxjRecord& b);

inline bool key_less(const CdxjRecord& a, const CdxjRecord& b) {
    return compare_keys(a, b) < 0;
}
