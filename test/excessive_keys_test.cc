// test/excessive_keys_test.cc
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "common/cdxj_errors.h"
#include "common/content_hash.h"
#include "common/excessive_keys.h"
#include "test_util.h"

TEST(ExcessiveKeysTest, OnlyRunsAboveThresholdAreEmitted) {
    const std::string data = make_run("a", 1) + make_run("b", 1000) + make_run("c", 1001) + make_run("d", 5);
    std::istringstream in(data);

    DetectStats st;
    const auto entries = detect_excessive_keys(in, "<mem>", {}, &st);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], (ExcessiveKeyEntry{"c", 1001}));
    EXPECT_EQ(st.records, 2007u);
    EXPECT_EQ(st.runs, 4u);
    EXPECT_EQ(st.longest_run, 1001u);
}

TEST(ExcessiveKeysTest, LastRunIsClosedAtEndOfStream) {
    std::istringstream in(make_run("a", 2) + make_run("z", 4));
    DetectOptions opt;
    opt.threshold = 3;
    const auto entries = detect_excessive_keys(in, "<mem>", opt);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0], (ExcessiveKeyEntry{"z", 4}));
}

TEST(ExcessiveKeysTest, EntriesComeOutInStreamOrder) {
    std::istringstream in(make_run("a", 3) + make_run("b", 1) + make_run("c", 4));
    DetectOptions opt;
    opt.threshold = 2;
    const auto entries = detect_excessive_keys(in, "<mem>", opt);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].surt, "a");
    EXPECT_EQ(entries[1].surt, "c");
}

TEST(ExcessiveKeysTest, EmptyInputHasNoEntries) {
    std::istringstream in("");
    DetectStats st;
    EXPECT_TRUE(detect_excessive_keys(in, "<mem>", {}, &st).empty());
    EXPECT_EQ(st.records, 0u);
}

TEST(ExcessiveKeysTest, BlankLinesDoNotSplitRuns) {
    std::istringstream in("a 1 {}\n\na 2 {}\na 3 {}\n");
    DetectOptions opt;
    opt.threshold = 2;
    DetectStats st;
    const auto entries = detect_excessive_keys(in, "<mem>", opt, &st);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].count, 3u);
    EXPECT_EQ(st.blank_lines, 1u);
}

TEST(ExcessiveKeysTest, UnsortedInputIsDetected) {
    std::istringstream in("a 2 {}\na 1 {}\n");
    EXPECT_THROW(detect_excessive_keys(in, "<mem>"), UnsortedInputViolation);

    std::istringstream in2("b 1 {}\na 1 {}\n");
    DetectOptions opt;
    opt.on_unsorted = ViolationPolicy::Warn;
    DetectStats st;
    detect_excessive_keys(in2, "<mem>", opt, &st);
    EXPECT_EQ(st.unsorted, 1u);
}

TEST(ExcessiveKeysTest, HashCoversEveryByteRead) {
    const std::string data = "a 1 {}\n\nb 1 {}";
    std::istringstream in(data);
    DetectStats st;
    detect_excessive_keys(in, "<mem>", {}, &st);

    ContentHash64 h;
    h.update(data);
    EXPECT_EQ(st.content_hash, h.digest());
    EXPECT_EQ(st.bytes, data.size());
}

TEST(ExcessiveKeysTest, WriteAndReadEntries) {
    std::ostringstream out;
    write_entries(out, {{"com,example)/", 1500}, {"org,x)/", 1001}});
    EXPECT_EQ(out.str(), "com,example)/ 1500\norg,x)/ 1001\n");

    std::istringstream in("com,example)/ 1500\r\n\norg,x)/\t1001  \n");
    const auto entries = read_entries(in, "<entries>");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0], (ExcessiveKeyEntry{"com,example)/", 1500}));
    EXPECT_EQ(entries[1], (ExcessiveKeyEntry{"org,x)/", 1001}));
}

TEST(ExcessiveKeysTest, ReadEntriesRejectsBadLines) {
    for (const std::string bad : {"onlysurt\n", "a notanumber\n", "a 0\n", "a 12x\n"}) {
        std::istringstream in(bad);
        EXPECT_THROW(read_entries(in, "<entries>"), MalformedRecord) << bad;
    }
}
