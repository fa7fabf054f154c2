// cpp/common/line_reader.cpp
#include "line_reader.h"

#include <cstring>
#include <utility>

#include "cdxj_errors.h"

LineReader::LineReader(std::istream& in, std::string source, std::size_t buf_bytes)
    : in_(in), source_(std::move(source)) {
    if (buf_bytes < 64) buf_bytes = 64;
    buf_.resize(buf_bytes);
}

void LineReader::compact_and_fill() {
    if (beg_ > 0) {
        const std::size_t live = end_ - beg_;
        if (live > 0) std::memmove(buf_.data(), buf_.data() + beg_, live);
        scan_ -= beg_;
        end_ = live;
        beg_ = 0;
    }
    if (end_ == buf_.size()) {
        // one line fills the whole buffer
        buf_.resize(buf_.size() * 2);
    }

    in_.read(buf_.data() + end_, static_cast<std::streamsize>(buf_.size() - end_));
    const std::streamsize got = in_.gcount();
    if (in_.bad()) {
        throw ShardIOError("read failed", source_, line_no_ + 1, consumed_ + (end_ - beg_));
    }
    if (got > 0) end_ += static_cast<std::size_t>(got);
    if (got <= 0 || in_.eof()) eof_ = true;
}

bool LineReader::next(std::string_view& line) {
    for (;;) {
        if (scan_ < end_) {
            const void* hit = std::memchr(buf_.data() + scan_, '\n', end_ - scan_);
            if (hit) {
                const std::size_t nl = static_cast<std::size_t>(static_cast<const char*>(hit) - buf_.data());
                const std::size_t len = nl + 1 - beg_;
                line = std::string_view(buf_.data() + beg_, len);

                line_off_ = consumed_;
                consumed_ += len;
                ++line_no_;
                terminated_ = true;

                beg_ = nl + 1;
                scan_ = beg_;
                return true;
            }
            scan_ = end_;
        }

        if (eof_) {
            if (beg_ == end_) return false;

            const std::size_t len = end_ - beg_;
            line = std::string_view(buf_.data() + beg_, len);
            line_off_ = consumed_;
            consumed_ += len;
            ++line_no_;
            terminated_ = false;

            beg_ = scan_ = end_;
            return true;
        }

        compact_and_fill();
    }
}
