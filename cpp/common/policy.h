// cpp/common/policy.h
#pragma once

#include <stdexcept>
#include <string>

// What a stage does when it detects a broken precondition.
enum class ViolationPolicy {
    Abort, // throw, the stage output is discarded
    Warn,  // log to stderr and keep going
};

// What the merge does with a shard that cannot be read to the end.
enum class ShardErrorPolicy {
    Abort,
    Skip, // drop the shard's remaining records, log a warning
};

// How the filter finds the end of a flagged run.
enum class RunBoundary {
    Scan,  // skip until the surt changes; compare with the entry count
    Trust, // skip exactly entry.count records
};

inline ViolationPolicy parse_violation_policy(const std::string& s) {
    if (s == "abort") return ViolationPolicy::Abort;
    if (s == "warn")  return ViolationPolicy::Warn;
    throw std::invalid_argument("bad violation policy '" + s + "' (abort|warn)");
}

inline ShardErrorPolicy parse_shard_error_policy(const std::string& s) {
    if (s == "abort") return ShardErrorPolicy::Abort;
    if (s == "skip")  return ShardErrorPolicy::Skip;
    throw std::invalid_argument("bad shard error policy '" + s + "' (abort|skip)");
}

inline RunBoundary parse_run_boundary(const std::string& s) {
    if (s == "scan")  return RunBoundary::Scan;
    if (s == "trust") return RunBoundary::Trust;
    throw std::invalid_argument("bad run boundary '" + s + "' (scan|trust)");
}

inline const char* to_string(ViolationPolicy p) {
    return p == ViolationPolicy::Abort ? "abort" : "warn";
}

inline const char* to_string(ShardErrorPolicy p) {
    return p == ShardErrorPolicy::Abort ? "abort" : "skip";
}

inline const char* to_string(RunBoundary b) {
    return b == RunBoundary::Scan ? "scan" : "trust";
}
