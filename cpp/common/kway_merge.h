// cpp/common/kway_merge.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "policy.h"

namespace fs = std::filesystem;

// One sorted input. `in` is borrowed; `name` is used in diagnostics.
struct MergeInput {
    std::string name;
    std::istream* in = nullptr;
};

struct MergeOptions {
    ShardErrorPolicy on_shard_error = ShardErrorPolicy::Abort;
    ViolationPolicy  on_unsorted    = ViolationPolicy::Abort;
    bool verbose = false;
};

struct MergeStats {
    std::uint64_t inputs          = 0;
    std::uint64_t records         = 0; // records written
    std::uint64_t bytes_out       = 0;
    std::uint64_t blank_lines     = 0; // dropped, not records
    std::uint64_t malformed       = 0; // dropped under ShardErrorPolicy::Skip
    std::uint64_t unsorted        = 0; // reported under ViolationPolicy::Warn
    std::uint64_t shards_dropped  = 0;
    std::uint64_t passes          = 1;
};

// Stable k-way merge of sorted streams into `out`.
//
// Output order is (surt, timestamp, input index, position in input); nothing
// is de-duplicated. Memory is one buffered record (plus read buffer) per open
// input. Each output line is the input line verbatim, always '\n'-terminated.
MergeStats merge_streams(const std::vector<MergeInput>& inputs,
                         std::ostream& out,
                         const MergeOptions& opt = {});

struct MergeFileOptions : MergeOptions {
    int  max_way   = 0; // >= 2: merge at most this many inputs per pass
    int  threads   = 1; // group merges of one pass run in parallel
    bool durable   = true;
    bool keep_tmp  = false;
};

// File-level merge. Inputs are paths; at most one may be "-" (stdin).
// Output "-" streams to stdout; any other path is written to a temp sibling and
// renamed into place only after the whole merge succeeded.
//
// With max_way >= 2 and more inputs than that, contiguous groups of inputs are
// merged into a private temp directory first (one pass after another) and the
// group outputs merged last; groups keep input order, so ties stay stable.
MergeStats merge_files(const std::vector<std::string>& inputs,
                       const std::string& output,
                       const MergeFileOptions& opt = {});
