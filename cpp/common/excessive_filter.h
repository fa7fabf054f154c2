// cpp/common/excessive_filter.h
#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "excessive_keys.h"
#include "policy.h"

struct FilterOptions {
    RunBoundary     boundary    = RunBoundary::Scan;
    ViolationPolicy on_unsorted = ViolationPolicy::Abort;
    ViolationPolicy on_stale    = ViolationPolicy::Abort;

    // Freshness token of the snapshot the entries were computed from. When set,
    // the master is hashed while it streams and a mismatch is a stale entry set.
    std::optional<std::uint64_t> expected_content_hash;

    std::string entries_source = "<entries>";
};

struct FilterStats {
    std::uint64_t records_in      = 0;
    std::uint64_t records_removed = 0;
    std::uint64_t lines_copied    = 0; // records kept + blank lines
    std::uint64_t bytes_in        = 0;
    std::uint64_t bytes_out       = 0;
    std::uint64_t entries_applied = 0;
    std::uint64_t entries_stale   = 0; // reported under ViolationPolicy::Warn
    std::uint64_t unsorted        = 0;
    std::uint64_t content_hash    = 0;
};

// Copy `master` to `out` without the runs of the flagged keys.
//
// One forward pass: for each entry (strictly ascending by surt) the gap before
// its run is copied verbatim, the run is skipped, and the tail after the last
// entry is copied. Kept bytes are never re-serialized. `entries` must be in the
// master's sort order.
FilterStats filter_excessive(std::istream& master,
                             const std::string& source,
                             const std::vector<ExcessiveKeyEntry>& entries,
                             std::ostream& out,
                             const FilterOptions& opt = {});
