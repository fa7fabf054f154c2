// cpp/common/excessive_keys.h
#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "policy.h"

constexpr std::uint64_t DEFAULT_EXCESSIVE_THRESHOLD = 1000;

// (surt, run length) observed on one snapshot of a master file.
struct ExcessiveKeyEntry {
    std::string surt;
    std::uint64_t count = 0;

    bool operator==(const ExcessiveKeyEntry& o) const { return surt == o.surt && count == o.count; }
};

struct DetectOptions {
    std::uint64_t threshold = DEFAULT_EXCESSIVE_THRESHOLD; // emit runs with count > threshold
    ViolationPolicy on_unsorted = ViolationPolicy::Abort;
};

struct DetectStats {
    std::uint64_t records      = 0;
    std::uint64_t runs         = 0;
    std::uint64_t entries      = 0;
    std::uint64_t blank_lines  = 0;
    std::uint64_t unsorted     = 0;
    std::uint64_t bytes        = 0; // bytes read
    std::uint64_t content_hash = 0; // ContentHash64 of every byte read
    std::uint64_t longest_run  = 0;
};

// One pass over a sorted stream keeping only the current run. Calls `emit`
// for every completed run longer than the threshold, in stream order.
DetectStats detect_excessive(std::istream& in,
                             const std::string& source,
                             const DetectOptions& opt,
                             const std::function<void(const ExcessiveKeyEntry&)>& emit);

// Convenience: collect the entries.
std::vector<ExcessiveKeyEntry> detect_excessive_keys(std::istream& in,
                                                     const std::string& source,
                                                     const DetectOptions& opt = {},
                                                     DetectStats* stats = nullptr);

// "surt count\n" per entry.
void write_entry(std::ostream& out, const ExcessiveKeyEntry& e);
void write_entries(std::ostream& out, const std::vector<ExcessiveKeyEntry>& entries);

// Parse "surt count" lines (blank lines ignored). Throws MalformedRecord.
std::vector<ExcessiveKeyEntry> read_entries(std::istream& in, const std::string& source);
