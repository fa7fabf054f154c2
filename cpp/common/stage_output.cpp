// cpp/common/stage_output.cpp
#include "stage_output.h"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <system_error>
#include <utility>

#if defined(__linux__)
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {

#if defined(__linux__)
static void fsync_path_file(const fs::path& p) {
    int fd = ::open(p.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

static void fsync_dir(const fs::path& dir) {
    int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd >= 0) {
        ::fsync(dfd);
        ::close(dfd);
    }
}
#endif

} // namespace

std::string make_temp_suffix() {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::random_device rd;
    std::uint64_t rnd = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
#if defined(__linux__)
    std::uint64_t pid = static_cast<std::uint64_t>(getpid());
#else
    std::uint64_t pid = 0;
#endif
    return ".tmp_cdxj_" + std::to_string(static_cast<std::uint64_t>(now)) + "_" +
           std::to_string(pid) + "_" + std::to_string(rnd);
}

void atomic_replace_file(const fs::path& tmp, const fs::path& dst, bool durable) {
#if defined(__linux__)
    if (durable) fsync_path_file(tmp);
#endif

    // rename() replaces dst atomically on the same filesystem
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec) throw std::runtime_error("rename failed: " + tmp.string() + " -> " + dst.string() + ": " + ec.message());

#if defined(__linux__)
    if (durable) fsync_dir(dst.parent_path());
#else
    (void)durable;
#endif
}

fs::path make_temp_dir(const fs::path& near, const std::string& tag) {
    fs::path parent = near.parent_path();
    if (parent.empty()) parent = ".";
    fs::path dir = parent / (make_temp_suffix() + "_" + tag);
    fs::create_directories(dir);
    return dir;
}

StageOutput::StageOutput(fs::path final_path, bool durable)
    : final_(std::move(final_path)), durable_(durable) {
    tmp_ = final_;
    tmp_ += make_temp_suffix();

    out_.open(tmp_, std::ios::binary | std::ios::trunc);
    if (!out_) throw std::runtime_error("cannot open output tmp: " + tmp_.string());
}

StageOutput::~StageOutput() {
    if (!committed_) discard();
}

void StageOutput::commit() {
    if (committed_) return;
    out_.flush();
    if (!out_.good()) throw std::runtime_error("write failed: " + tmp_.string());
    out_.close();
    if (out_.fail()) throw std::runtime_error("close failed: " + tmp_.string());

    atomic_replace_file(tmp_, final_, durable_);
    committed_ = true;
}

void StageOutput::discard() {
    if (out_.is_open()) out_.close();
    std::error_code ec;
    fs::remove(tmp_, ec);
    if (ec) {
        std::cerr << "[stage_output] WARN: cannot remove " << tmp_.string() << ": " << ec.message() << "\n";
    }
}
