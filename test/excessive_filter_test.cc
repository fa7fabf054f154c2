// test/excessive_filter_test.cc
#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "common/cdxj_errors.h"
#include "common/content_hash.h"
#include "common/excessive_filter.h"
#include "common/excessive_keys.h"
#include "test_util.h"

namespace {

std::string run_filter(const std::string& master,
                       const std::vector<ExcessiveKeyEntry>& entries,
                       const FilterOptions& opt = {},
                       FilterStats* st = nullptr) {
    std::istringstream in(master);
    std::ostringstream out;
    FilterStats s = filter_excessive(in, "master.cdxj", entries, out, opt);
    if (st) *st = s;
    return out.str();
}

} // namespace

class ExcessiveFilterTest : public ::testing::Test {
protected:
    const std::string a_ = "a 20200101 {\"url\": \"http://a/\"}\n";
    const std::string c_ = "c\t20200101\t{\"url\": \"http://c/\"}\n";
    std::string master_ = a_ + make_run("b", 1001) + c_;
};

TEST_F(ExcessiveFilterTest, RemovesFlaggedRunOnly) {
    FilterStats st;
    const std::string out = run_filter(master_, {{"b", 1001}}, {}, &st);
    EXPECT_EQ(out, a_ + c_);
    EXPECT_EQ(st.records_removed, 1001u);
    EXPECT_EQ(st.entries_applied, 1u);
    EXPECT_EQ(st.records_in, 1003u);
}

TEST_F(ExcessiveFilterTest, TrustModeSkipsExactCount) {
    FilterOptions opt;
    opt.boundary = RunBoundary::Trust;
    EXPECT_EQ(run_filter(master_, {{"b", 1001}}, opt), a_ + c_);
}

TEST_F(ExcessiveFilterTest, IdentityWhenNothingIsExcessive) {
    const std::string master = make_run("a", 3) + "\n" + make_run("b", 999) + "c 1 {}";
    std::istringstream din(master);
    const auto entries = detect_excessive_keys(din, "master.cdxj");
    ASSERT_TRUE(entries.empty());
    EXPECT_EQ(run_filter(master, entries), master);
}

TEST_F(ExcessiveFilterTest, FilterOfDetectRemovesEveryFlaggedRun) {
    const std::string master = make_run("a", 4) + make_run("b", 1) + make_run("c", 5) + make_run("d", 2);
    std::istringstream din(master);
    DetectOptions dopt;
    dopt.threshold = 3;
    DetectStats dst;
    const auto entries = detect_excessive_keys(din, "master.cdxj", dopt, &dst);

    FilterOptions fopt;
    fopt.expected_content_hash = dst.content_hash;
    EXPECT_EQ(run_filter(master, entries, fopt), make_run("b", 1) + make_run("d", 2));
}

TEST_F(ExcessiveFilterTest, ScanDetectsWrongCount) {
    EXPECT_THROW(run_filter(master_, {{"b", 1000}}), StaleEntryMismatch);

    FilterOptions opt;
    opt.on_stale = ViolationPolicy::Warn;
    FilterStats st;
    EXPECT_EQ(run_filter(master_, {{"b", 1000}}, opt, &st), a_ + c_) << "scan still removes the whole run";
    EXPECT_EQ(st.entries_stale, 1u);
}

TEST_F(ExcessiveFilterTest, TrustDetectsOverrunAndShortCount) {
    FilterOptions opt;
    opt.boundary = RunBoundary::Trust;
    EXPECT_THROW(run_filter(master_, {{"b", 1002}}, opt), StaleEntryMismatch) << "would eat 'c'";
    EXPECT_THROW(run_filter(master_, {{"b", 1000}}, opt), StaleEntryMismatch) << "run is longer";
    EXPECT_THROW(run_filter(a_ + make_run("b", 3), {{"b", 5}}, opt), StaleEntryMismatch) << "master ends";
}

TEST_F(ExcessiveFilterTest, MissingKeyIsStale) {
    EXPECT_THROW(run_filter(master_, {{"bb", 1001}}), StaleEntryMismatch);

    FilterOptions opt;
    opt.on_stale = ViolationPolicy::Warn;
    EXPECT_EQ(run_filter(master_, {{"bb", 5}, {"zz", 5}}, opt), master_);
}

TEST_F(ExcessiveFilterTest, EntriesMustBeStrictlyAscending) {
    const std::string master = make_run("a", 3) + make_run("b", 3);
    try {
        run_filter(master, {{"b", 3}, {"a", 3}});
        FAIL() << "expected UnsortedInputViolation";
    } catch (const UnsortedInputViolation& e) {
        EXPECT_EQ(e.where(), "<entries>");
        EXPECT_EQ(e.line_no(), 2u);
    }
    EXPECT_THROW(run_filter(master, {{"a", 3}, {"a", 3}}), UnsortedInputViolation);
}

TEST_F(ExcessiveFilterTest, UnsortedMasterIsDetected) {
    EXPECT_THROW(run_filter("b 1 {}\na 1 {}\n", {}), UnsortedInputViolation);
}

TEST_F(ExcessiveFilterTest, BlankLinesAndUnterminatedTailAreCopied) {
    const std::string master = "a 1 {}\n\n" + make_run("b", 2) + "\nc 1 {}";
    EXPECT_EQ(run_filter(master, {{"b", 2}}), "a 1 {}\n\n\nc 1 {}");
}

TEST_F(ExcessiveFilterTest, BlankLineInsideRunKeepsRunWhole) {
    const std::string master = "a 1 {}\nb 1 {}\n\nb 2 {}\nc 1 {}\n";
    std::istringstream din(master);
    DetectOptions dopt;
    dopt.threshold = 1;
    const auto entries = detect_excessive_keys(din, "master.cdxj", dopt);
    ASSERT_EQ(entries.size(), 1u);
    ASSERT_EQ(entries[0], (ExcessiveKeyEntry{"b", 2}));

    FilterStats st;
    EXPECT_EQ(run_filter(master, entries, {}, &st), "a 1 {}\n\nc 1 {}\n");
    EXPECT_EQ(st.records_removed, 2u);
    EXPECT_EQ(st.entries_stale, 0u);

    FilterOptions trust;
    trust.boundary = RunBoundary::Trust;
    EXPECT_EQ(run_filter(master, entries, trust, &st), "a 1 {}\n\nc 1 {}\n");
    EXPECT_EQ(st.records_removed, 2u);
    EXPECT_EQ(st.entries_stale, 0u);
}

TEST_F(ExcessiveFilterTest, TrustNoticesLongerRunAcrossBlankLine) {
    FilterOptions opt;
    opt.boundary = RunBoundary::Trust;
    EXPECT_THROW(run_filter("b 1 {}\n\nb 2 {}\n", {{"b", 1}}, opt), StaleEntryMismatch);
}

TEST_F(ExcessiveFilterTest, ContentHashMismatchIsStale) {
    ContentHash64 h;
    h.update(master_);

    FilterOptions opt;
    opt.expected_content_hash = h.digest();
    FilterStats st;
    EXPECT_EQ(run_filter(master_, {{"b", 1001}}, opt, &st), a_ + c_);
    EXPECT_EQ(st.content_hash, h.digest());

    opt.expected_content_hash = h.digest() ^ 1;
    EXPECT_THROW(run_filter(master_, {{"b", 1001}}, opt), StaleEntryMismatch);
}
