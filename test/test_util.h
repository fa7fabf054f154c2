// test/test_util.h
#pragma once

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>

#include "common/stage_output.h"

// Fresh scratch directory per test, removed in TearDown.
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() /
               (std::string("cdxj_") + info->test_suite_name() + "_" + info->name() + make_temp_suffix());
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path path(const std::string& name) const { return dir_ / name; }

    fs::path write_file(const std::string& name, const std::string& content) const {
        const fs::path p = path(name);
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
        return p;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Files in the scratch dir whose name contains `needle`.
    int count_entries_containing(const std::string& needle) const {
        int n = 0;
        for (const auto& de : fs::directory_iterator(dir_)) {
            if (de.path().filename().string().find(needle) != std::string::npos) ++n;
        }
        return n;
    }

    fs::path dir_;
};

// "<surt> <ts> {}\n" repeated `n` times with increasing timestamps.
inline std::string make_run(const std::string& surt, int n, const std::string& payload = "{}") {
    std::string s;
    for (int i = 0; i < n; ++i) {
        char ts[16];
        std::snprintf(ts, sizeof(ts), "2020%08d", i);
        s += surt + " " + ts + " " + payload + "\n";
    }
    return s;
}
