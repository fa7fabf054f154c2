// cpp/common/line_reader.h
#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

// Buffered forward-only line reader with explicit scan state.
//
// next() hands out the raw line bytes including the '\n' terminator (a final
// unterminated line is returned as-is). The view stays valid until the next
// call to next(). Lines longer than the buffer grow it; nothing else is kept.
class LineReader {
public:
    static constexpr std::size_t DEFAULT_BUF = 1 << 20;

    LineReader(std::istream& in, std::string source, std::size_t buf_bytes = DEFAULT_BUF);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // false at end of stream; throws ShardIOError if the stream goes bad.
    bool next(std::string_view& line);

    const std::string& source() const { return source_; }

    // 1-based number of the last line returned (0 before the first).
    std::uint64_t line_no() const { return line_no_; }
    // byte offset where the last returned line starts
    std::uint64_t line_offset() const { return line_off_; }
    // byte offset just past the last returned line
    std::uint64_t offset() const { return consumed_; }
    // whether the last returned line ended with '\n'
    bool terminated() const { return terminated_; }

private:
    void compact_and_fill();

    std::istream& in_;
    std::string source_;

    std::vector<char> buf_;
    std::size_t beg_  = 0;
    std::size_t scan_ = 0; // no '\n' in [beg_, scan_)
    std::size_t end_  = 0;
    bool eof_ = false;

    std::uint64_t consumed_ = 0;
    std::uint64_t line_no_  = 0;
    std::uint64_t line_off_ = 0;
    bool terminated_ = true;
};
