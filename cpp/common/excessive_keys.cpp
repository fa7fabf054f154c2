// cpp/common/excessive_keys.cpp
#include "excessive_keys.h"

#include <charconv>
#include <iostream>
#include <system_error>
#include <string_view>

#include "cdxj_errors.h"
#include "cdxj_record.h"
#include "content_hash.h"
#include "line_reader.h"
#include "stage_output.h"

DetectStats detect_excessive(std::istream& in,
                             const std::string& source,
                             const DetectOptions& opt,
                             const std::function<void(const ExcessiveKeyEntry&)>& emit) {
    DetectStats st;
    LineReader reader(in, source);
    ContentHash64 hash;

    // current run
    bool have_run = false;
    std::string run_surt;
    std::string prev_ts;
    std::uint64_t run_count = 0;

    auto close_run = [&]() {
        if (!have_run) return;
        ++st.runs;
        if (run_count > st.longest_run) st.longest_run = run_count;
        if (run_count > opt.threshold) {
            ++st.entries;
            emit(ExcessiveKeyEntry{run_surt, run_count});
        }
    };

    std::string_view line;
    while (reader.next(line)) {
        hash.update(line);

        if (strip_newline(line).empty()) { ++st.blank_lines; continue; }

        const CdxjRecord rec = parse_record(line, source, reader.line_no(), reader.line_offset());
        ++st.records;

        if (have_run) {
            int k = compare_bytes(rec.surt, run_surt);
            if (k == 0) k = compare_bytes(rec.timestamp, prev_ts);
            if (k < 0) {
                UnsortedInputViolation err(
                    "key '" + std::string(rec.surt) + " " + std::string(rec.timestamp) +
                    "' sorts before previous '" + run_surt + " " + prev_ts + "'",
                    source, reader.line_no(), reader.line_offset());
                if (opt.on_unsorted == ViolationPolicy::Abort) throw err;
                std::cerr << "[find_excessive] WARN: " << err.what() << "\n";
                ++st.unsorted;
            }
        }

        if (have_run && rec.surt == run_surt) {
            ++run_count;
        } else {
            close_run();
            run_surt.assign(rec.surt.data(), rec.surt.size());
            run_count = 1;
            have_run = true;
        }
        prev_ts.assign(rec.timestamp.data(), rec.timestamp.size());
    }
    close_run();

    st.bytes = hash.bytes();
    st.content_hash = hash.digest();
    return st;
}

std::vector<ExcessiveKeyEntry> detect_excessive_keys(std::istream& in,
                                                     const std::string& source,
                                                     const DetectOptions& opt,
                                                     DetectStats* stats) {
    std::vector<ExcessiveKeyEntry> out;
    DetectStats st = detect_excessive(in, source, opt, [&](const ExcessiveKeyEntry& e) {
        out.push_back(e);
    });
    if (stats) *stats = st;
    return out;
}

void write_entry(std::ostream& out, const ExcessiveKeyEntry& e) {
    std::string line;
    line.reserve(e.surt.size() + 22);
    line += e.surt;
    line += ' ';
    line += std::to_string(e.count);
    line += '\n';
    write_all(out, line);
}

void write_entries(std::ostream& out, const std::vector<ExcessiveKeyEntry>& entries) {
    for (const auto& e : entries) write_entry(out, e);
}

std::vector<ExcessiveKeyEntry> read_entries(std::istream& in, const std::string& source) {
    std::vector<ExcessiveKeyEntry> out;
    LineReader reader(in, source);

    std::string_view line;
    while (reader.next(line)) {
        std::string_view s = strip_newline(line);
        if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
        if (s.empty()) continue;

        const std::string_view surt = surt_of(s);
        std::string_view num = surt.empty() ? std::string_view{} : s.substr(surt.size());
        while (!num.empty() && is_field_sep(num.front())) num.remove_prefix(1);
        while (!num.empty() && is_field_sep(num.back())) num.remove_suffix(1);

        std::uint64_t count = 0;
        const auto res = std::from_chars(num.data(), num.data() + num.size(), count);
        if (surt.empty() || num.empty() || res.ec != std::errc() || res.ptr != num.data() + num.size() || count == 0) {
            throw MalformedRecord("expected '<surt> <count>', got '" + std::string(s.substr(0, 80)) + "'",
                                  source, reader.line_no(), reader.line_offset());
        }
        out.push_back(ExcessiveKeyEntry{std::string(surt), count});
    }
    return out;
}
