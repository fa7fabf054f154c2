// cpp/common/cdxj_errors.h
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Base for every stage failure. `where()` is the offending file (or "-" for
// stdin, "<name>" for in-memory sources); line is 1-based, 0 = unknown.
class CdxjError : public std::runtime_error {
public:
    CdxjError(const std::string& kind,
              const std::string& what,
              const std::string& source,
              std::uint64_t line_no,
              std::uint64_t byte_offset)
        : std::runtime_error(format(kind, what, source, line_no, byte_offset)),
          source_(source),
          line_no_(line_no),
          byte_offset_(byte_offset) {}

    const std::string& where() const { return source_; }
    std::uint64_t line_no() const { return line_no_; }
    std::uint64_t byte_offset() const { return byte_offset_; }

private:
    static std::string format(const std::string& kind,
                              const std::string& what,
                              const std::string& source,
                              std::uint64_t line_no,
                              std::uint64_t byte_offset) {
        std::string s = kind + ": " + what;
        if (!source.empty()) {
            s += " [" + source;
            if (line_no > 0) s += ":" + std::to_string(line_no);
            // open failures carry no position
            if (line_no > 0 || byte_offset > 0) s += " @byte " + std::to_string(byte_offset);
            s += "]";
        }
        return s;
    }

    std::string source_;
    std::uint64_t line_no_;
    std::uint64_t byte_offset_;
};

// Line fails the minimal "surt timestamp payload" split.
class MalformedRecord : public CdxjError {
public:
    MalformedRecord(const std::string& what, const std::string& source,
                    std::uint64_t line_no, std::uint64_t byte_offset)
        : CdxjError("MalformedRecord", what, source, line_no, byte_offset) {}
};

// Read/open failure on an input stream (shard, master, entry list).
class ShardIOError : public CdxjError {
public:
    ShardIOError(const std::string& what, const std::string& source,
                 std::uint64_t line_no = 0, std::uint64_t byte_offset = 0)
        : CdxjError("ShardIOError", what, source, line_no, byte_offset) {}
};

// Record observed out of order relative to its predecessor.
class UnsortedInputViolation : public CdxjError {
public:
    UnsortedInputViolation(const std::string& what, const std::string& source,
                           std::uint64_t line_no, std::uint64_t byte_offset)
        : CdxjError("UnsortedInputViolation", what, source, line_no, byte_offset) {}
};

// Excessive-key entry no longer matches the master it is applied to.
class StaleEntryMismatch : public CdxjError {
public:
    StaleEntryMismatch(const std::string& what, const std::string& source,
                       std::uint64_t line_no, std::uint64_t byte_offset)
        : CdxjError("StaleEntryMismatch", what, source, line_no, byte_offset) {}
};
