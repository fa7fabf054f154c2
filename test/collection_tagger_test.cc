// test/collection_tagger_test.cc
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "common/cdxj_errors.h"
#include "common/collection_tagger.h"

namespace {

std::string tag(const std::string& in, const std::string& name, TagStats* st = nullptr) {
    std::istringstream is(in);
    std::ostringstream os;
    TagStats s = tag_collection(is, "<mem>", name, os);
    if (st) *st = s;
    return os.str();
}

} // namespace

TEST(CollectionTaggerTest, AppendsMemberBeforeClosingBrace) {
    EXPECT_EQ(tag("com,example)/ 20200101 {\"url\": \"http://example.com/\"}\n", "EAWP1"),
              "com,example)/ 20200101 {\"url\": \"http://example.com/\", \"collection\": \"EAWP1\"}\n");
}

TEST(CollectionTaggerTest, EmptyObjectGetsNoComma) {
    EXPECT_EQ(tag("a 1 {}\n", "c"), "a 1 {\"collection\": \"c\"}\n");
    EXPECT_EQ(tag("a 1 { }\n", "c"), "a 1 { \"collection\": \"c\"}\n");
}

TEST(CollectionTaggerTest, NameIsJsonEscaped) {
    EXPECT_EQ(collection_member("a\"b\\c"), "\"collection\": \"a\\\"b\\\\c\"");
}

TEST(CollectionTaggerTest, KeepsKeysSeparatorsAndTrailingBytes) {
    TagStats st;
    const std::string out = tag("a\t1\t{\"k\": {\"n\": 1}}  \r\nb 2 {\"x\": 1}", "c", &st);
    EXPECT_EQ(out, "a\t1\t{\"k\": {\"n\": 1}, \"collection\": \"c\"}  \r\nb 2 {\"x\": 1, \"collection\": \"c\"}\n");
    EXPECT_EQ(st.records, 2u);
    EXPECT_EQ(st.tagged, 2u);
}

TEST(CollectionTaggerTest, AlreadyTaggedPayloadIsUnchanged) {
    TagStats st;
    const std::string line = "a 1 {\"collection\": \"old\"}\n";
    EXPECT_EQ(tag(line, "new", &st), line);
    EXPECT_EQ(st.already_tagged, 1u);
    EXPECT_EQ(st.tagged, 0u);
}

TEST(CollectionTaggerTest, BlankLinesPassThrough) {
    TagStats st;
    EXPECT_EQ(tag("\na 1 {}\n", "c", &st), "\na 1 {\"collection\": \"c\"}\n");
    EXPECT_EQ(st.blank_lines, 1u);
}

TEST(CollectionTaggerTest, NonObjectPayloadIsMalformed) {
    EXPECT_THROW(tag("a 1 [1,2]\n", "c"), MalformedRecord);
    EXPECT_THROW(tag("a 1 {\"unterminated\": \n", "c"), MalformedRecord);
    EXPECT_THROW(tag("a 1 urlkey=x\n", "c"), MalformedRecord);
    EXPECT_THROW(tag("nofields\n", "c"), MalformedRecord);
}
