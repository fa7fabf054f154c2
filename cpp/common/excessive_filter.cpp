// cpp/common/excessive_filter.cpp
#include "excessive_filter.h"

#include <iostream>
#include <string_view>

#include "cdxj_errors.h"
#include "cdxj_record.h"
#include "content_hash.h"
#include "line_reader.h"
#include "stage_output.h"

namespace {

// Forward scan state over the master: current line, its parsed record, byte
// offset. Never seeks backwards.
class MasterScanner {
public:
    MasterScanner(std::istream& in, const std::string& source, const FilterOptions& opt, FilterStats& st)
        : reader_(in, source), opt_(opt), st_(st) {}

    bool has() const { return has_; }
    bool blank() const { return blank_; }
    std::string_view line() const { return line_; }
    std::string_view surt() const { return rec_.surt; }

    std::uint64_t line_no() const { return reader_.line_no(); }
    std::uint64_t line_offset() const { return has_ ? reader_.line_offset() : reader_.offset(); }
    const std::string& source() const { return reader_.source(); }

    std::uint64_t digest() const { return hash_.digest(); }
    std::uint64_t bytes() const { return hash_.bytes(); }

    void advance() {
        if (has_ && !blank_) {
            prev_surt_.assign(rec_.surt.data(), rec_.surt.size());
            prev_ts_.assign(rec_.timestamp.data(), rec_.timestamp.size());
            have_prev_ = true;
        }

        has_ = reader_.next(line_);
        if (!has_) return;
        hash_.update(line_);

        blank_ = strip_newline(line_).empty();
        if (blank_) {
            rec_ = CdxjRecord{};
            return;
        }

        rec_ = parse_record(line_, reader_.source(), reader_.line_no(), reader_.line_offset());
        ++st_.records_in;
        check_order();
    }

private:
    void check_order() {
        if (!have_prev_) return;
        int k = compare_bytes(rec_.surt, prev_surt_);
        if (k == 0) k = compare_bytes(rec_.timestamp, prev_ts_);
        if (k >= 0) return;

        UnsortedInputViolation err(
            "key '" + std::string(rec_.surt) + " " + std::string(rec_.timestamp) +
            "' sorts before previous '" + prev_surt_ + " " + prev_ts_ + "'",
            reader_.source(), reader_.line_no(), reader_.line_offset());
        if (opt_.on_unsorted == ViolationPolicy::Abort) throw err;
        std::cerr << "[filter_excessive] WARN: " << err.what() << "\n";
        ++st_.unsorted;
    }

    LineReader reader_;
    ContentHash64 hash_;
    const FilterOptions& opt_;
    FilterStats& st_;

    std::string_view line_;
    CdxjRecord rec_{};
    bool has_ = false;
    bool blank_ = false;

    bool have_prev_ = false;
    std::string prev_surt_;
    std::string prev_ts_;
};

} // namespace

FilterStats filter_excessive(std::istream& master,
                             const std::string& source,
                             const std::vector<ExcessiveKeyEntry>& entries,
                             std::ostream& out,
                             const FilterOptions& opt) {
    FilterStats st;
    MasterScanner sc(master, source, opt, st);

    auto copy_current = [&]() {
        write_all(out, sc.line());
        st.bytes_out += sc.line().size();
        ++st.lines_copied;
    };

    auto stale = [&](const std::string& what) {
        StaleEntryMismatch err(what, sc.source(), sc.line_no(), sc.line_offset());
        if (opt.on_stale == ViolationPolicy::Abort) throw err;
        std::cerr << "[filter_excessive] WARN: " << err.what() << "\n";
        ++st.entries_stale;
    };

    sc.advance();

    const ExcessiveKeyEntry* prev_entry = nullptr;
    for (std::size_t ei = 0; ei < entries.size(); ++ei) {
        const ExcessiveKeyEntry& e = entries[ei];

        if (prev_entry && compare_bytes(e.surt, prev_entry->surt) <= 0) {
            UnsortedInputViolation err("entry '" + e.surt + "' does not sort after '" + prev_entry->surt + "'",
                                       opt.entries_source, ei + 1, 0);
            if (opt.on_unsorted == ViolationPolicy::Abort) throw err;
            std::cerr << "[filter_excessive] WARN: " << err.what() << " (entry ignored)\n";
            ++st.unsorted;
            continue;
        }
        prev_entry = &e;

        // gap before the run: copied verbatim
        while (sc.has() && (sc.blank() || compare_bytes(sc.surt(), e.surt) < 0)) {
            copy_current();
            sc.advance();
        }

        if (!sc.has() || sc.surt() != e.surt) {
            stale("flagged key '" + e.surt + "' not present in master");
            continue;
        }

        // skip the run; blank lines inside it are copied and never end or count toward it
        std::uint64_t skipped = 0;
        if (opt.boundary == RunBoundary::Scan) {
            while (sc.has() && (sc.blank() || sc.surt() == e.surt)) {
                if (sc.blank()) {
                    copy_current();
                } else {
                    ++skipped;
                }
                sc.advance();
            }
            if (skipped != e.count) {
                stale("run of '" + e.surt + "' has " + std::to_string(skipped) +
                      " records, entry says " + std::to_string(e.count));
            }
        } else {
            bool reported = false;
            while (skipped < e.count && sc.has()) {
                if (sc.blank()) {
                    copy_current();
                    sc.advance();
                    continue;
                }
                if (!reported && sc.surt() != e.surt) {
                    stale("entry count " + std::to_string(e.count) + " for '" + e.surt +
                          "' overruns its run after " + std::to_string(skipped) + " records");
                    reported = true;
                }
                ++skipped;
                sc.advance();
            }
            while (sc.has() && sc.blank()) {
                copy_current();
                sc.advance();
            }
            if (skipped < e.count) {
                stale("master ended inside the run of '" + e.surt + "'");
            } else if (!reported && sc.has() && sc.surt() == e.surt) {
                stale("run of '" + e.surt + "' is longer than entry count " + std::to_string(e.count));
            }
        }

        st.records_removed += skipped;
        ++st.entries_applied;
    }

    // tail
    while (sc.has()) {
        copy_current();
        sc.advance();
    }

    out.flush();
    if (!out.good()) throw std::runtime_error("write failed");

    st.bytes_in = sc.bytes();
    st.content_hash = sc.digest();

    if (opt.expected_content_hash && *opt.expected_content_hash != st.content_hash) {
        stale("master content hash " + ContentHash64::to_hex(st.content_hash) +
              " does not match the entries' token " + ContentHash64::to_hex(*opt.expected_content_hash));
    }
    return st;
}
