// test/line_reader_test.cc
#include <gtest/gtest.h>

#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

#include "common/cdxj_errors.h"
#include "common/content_hash.h"
#include "common/line_reader.h"

namespace {

std::vector<std::string> read_all(const std::string& data, std::size_t buf) {
    std::istringstream in(data);
    LineReader r(in, "<mem>", buf);
    std::vector<std::string> out;
    std::string_view line;
    while (r.next(line)) out.emplace_back(line);
    return out;
}

// Serves `ok` bytes, then reports a read error.
class FailingBuf : public std::streambuf {
public:
    explicit FailingBuf(std::string ok) : ok_(std::move(ok)) {
        setg(ok_.data(), ok_.data(), ok_.data() + ok_.size());
    }

protected:
    int_type underflow() override { throw std::ios_base::failure("device error"); }

private:
    std::string ok_;
};

} // namespace

TEST(LineReaderTest, ReturnsLinesWithTerminators) {
    const auto lines = read_all("a 1 {}\nb 2 {}\n", 64);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "a 1 {}\n");
    EXPECT_EQ(lines[1], "b 2 {}\n");
}

TEST(LineReaderTest, FinalUnterminatedLine) {
    std::istringstream in("a 1 {}\nb 2 {}");
    LineReader r(in, "<mem>");
    std::string_view line;

    ASSERT_TRUE(r.next(line));
    EXPECT_TRUE(r.terminated());
    ASSERT_TRUE(r.next(line));
    EXPECT_EQ(line, "b 2 {}");
    EXPECT_FALSE(r.terminated());
    EXPECT_FALSE(r.next(line));
}

TEST(LineReaderTest, TracksOffsetsAndLineNumbers) {
    std::istringstream in("ab\n\ncde\n");
    LineReader r(in, "<mem>");
    std::string_view line;

    ASSERT_TRUE(r.next(line));
    EXPECT_EQ(r.line_no(), 1u);
    EXPECT_EQ(r.line_offset(), 0u);
    ASSERT_TRUE(r.next(line));
    EXPECT_EQ(line, "\n");
    EXPECT_EQ(r.line_offset(), 3u);
    ASSERT_TRUE(r.next(line));
    EXPECT_EQ(r.line_no(), 3u);
    EXPECT_EQ(r.line_offset(), 4u);
    EXPECT_EQ(r.offset(), 8u);
}

TEST(LineReaderTest, LinesLongerThanBufferGrowIt) {
    const std::string long_line = std::string(1000, 'x') + "\n";
    const auto lines = read_all("a\n" + long_line + "b\n", 16);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], long_line);
    EXPECT_EQ(lines[2], "b\n");
}

TEST(LineReaderTest, EmptyInput) {
    EXPECT_TRUE(read_all("", 16).empty());
}

TEST(LineReaderTest, BadStreamThrowsShardIOError) {
    FailingBuf buf("a 1 {}\nb 2");
    std::istream in(&buf);
    LineReader r(in, "broken.cdxj", 4);
    std::string_view line;

    EXPECT_THROW({
        while (r.next(line)) {}
    }, ShardIOError);
}

TEST(ContentHashTest, ChunkingDoesNotChangeDigest) {
    std::string data;
    for (int i = 0; i < 200; ++i) data += "com,example)/page" + std::to_string(i) + " 2020 {}\n";

    ContentHash64 whole;
    whole.update(data);

    ContentHash64 pieces;
    for (std::size_t i = 0; i < data.size(); i += 7) pieces.update(std::string_view(data).substr(i, 7));

    EXPECT_EQ(whole.digest(), pieces.digest());
    EXPECT_EQ(whole.bytes(), data.size());
}

TEST(ContentHashTest, DifferentContentDifferentDigest) {
    ContentHash64 a, b;
    a.update("a 1 {}\n");
    b.update("a 1 {}\r\n");
    EXPECT_NE(a.digest(), b.digest());
    EXPECT_EQ(ContentHash64::to_hex(0xabcULL), "0000000000000abc");
}
