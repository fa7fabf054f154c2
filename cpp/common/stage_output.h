// cpp/common/stage_output.h
#pragma once

#include <filesystem>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

inline void write_all(std::ostream& out, std::string_view bytes) {
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out.good()) throw std::runtime_error("write failed");
}

// ".tmp_cdxj_<time>_<pid>_<rand>": unique across reruns and crashed runs.
std::string make_temp_suffix();

// Remove dst, rename tmp over it; with durable=true fsync the file and the
// parent directory around the rename (Linux).
void atomic_replace_file(const fs::path& tmp, const fs::path& dst, bool durable);

// Private scratch directory next to `near` (created).
fs::path make_temp_dir(const fs::path& near, const std::string& tag);

// A stage output that only becomes visible at commit().
//
// Bytes go to a temp sibling of the destination; commit() flushes, closes and
// atomically renames it. Destroying an uncommitted StageOutput (exception,
// cancellation) removes the temp file.
class StageOutput {
public:
    explicit StageOutput(fs::path final_path, bool durable = true);
    ~StageOutput();

    StageOutput(const StageOutput&) = delete;
    StageOutput& operator=(const StageOutput&) = delete;

    std::ostream& stream() { return out_; }

    const fs::path& final_path() const { return final_; }
    const fs::path& tmp_path() const { return tmp_; }
    bool committed() const { return committed_; }

    void commit();
    void discard();

private:
    fs::path final_;
    fs::path tmp_;
    bool durable_;
    bool committed_ = false;
    std::ofstream out_;
};
