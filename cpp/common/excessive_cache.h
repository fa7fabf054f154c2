// cpp/common/excessive_cache.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "excessive_keys.h"

namespace fs = std::filesystem;

constexpr int EXCESSIVE_CACHE_FORMAT = 1;

// Identity of the master snapshot the entries were computed from.
struct MasterToken {
    std::string path;
    std::uint64_t bytes = 0;
    std::uint64_t content_hash = 0; // ContentHash64 over the whole file
};

// Side artifact: excessive-key entries plus the token they are valid for.
//
// {"format":1,"collection":"...","threshold":1000,
//  "master":{"path":"...","bytes":N,"content_hash":"<16 hex>"},
//  "entries":[["surt",count],...]}
struct ExcessiveKeyCache {
    std::string collection;
    std::uint64_t threshold = DEFAULT_EXCESSIVE_THRESHOLD;
    MasterToken master;
    std::vector<ExcessiveKeyEntry> entries;
};

// Written through a StageOutput (temp + atomic rename).
void save_cache(const fs::path& path, const ExcessiveKeyCache& cache, bool durable = true);

// nullopt if the file is missing or unreadable as a cache (logged).
std::optional<ExcessiveKeyCache> load_cache(const fs::path& path);

// Cache usable for `master_path`: same collection, same threshold and the
// master still has the recorded size. The content hash is checked by the
// filter while it streams the master (FilterOptions::expected_content_hash).
std::optional<ExcessiveKeyCache> load_if_fresh(const fs::path& cache_path,
                                               const fs::path& master_path,
                                               const std::string& collection,
                                               std::uint64_t threshold);

// "<cache_dir>/<collection or master file name>.excessive.json"
fs::path cache_path_for(const fs::path& cache_dir, const fs::path& master_path, const std::string& collection);
