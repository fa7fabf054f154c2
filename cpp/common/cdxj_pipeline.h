// cpp/common/cdxj_pipeline.h
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "collection_tagger.h"
#include "excessive_filter.h"
#include "excessive_keys.h"
#include "kway_merge.h"
#include "policy.h"

namespace fs = std::filesystem;

struct PipelineConfig {
    std::vector<std::string> shards;   // sorted per-capture indexes
    std::string master_path;           // merged (and tagged) master
    std::string filtered_path;         // empty = stop after the master
    std::string collection;            // empty = no tagging
    std::string cache_dir;             // empty = master's directory

    std::uint64_t threshold = DEFAULT_EXCESSIVE_THRESHOLD;
    int merge_max_way = 0;             // 0 = single pass
    int threads       = 1;

    ShardErrorPolicy on_shard_error = ShardErrorPolicy::Abort;
    ViolationPolicy  on_unsorted    = ViolationPolicy::Abort;
    ViolationPolicy  on_stale       = ViolationPolicy::Abort;
    RunBoundary      run_boundary   = RunBoundary::Scan;

    bool durable_fsync = true;
    bool keep_tmp      = false;
    bool incremental   = false;        // skip merge+tag if master is newer than every shard
    bool verbose       = false;
};

struct PipelineReport {
    bool merged = false;
    MergeStats merge;

    bool tagged = false;
    TagStats tag;

    bool cache_hit = false;
    bool cache_retry = false;          // cached entries were stale; recomputed
    DetectStats detect;
    std::size_t entries = 0;
    std::string cache_path;

    bool filtered = false;
    FilterStats filter;
};

// Defaults with threads = hardware concurrency (capped at 16).
PipelineConfig default_pipeline_config();

// Optional JSON config (snake_case keys); unknown keys are ignored, bad values
// throw std::runtime_error.
void load_config_from_json(const fs::path& path, PipelineConfig& cfg);

// CDXJ_* environment knobs override file values.
void apply_env_overrides(PipelineConfig& cfg);

// "@list.txt" expands to one shard path per line; other args pass through.
std::vector<std::string> expand_shard_args(const std::vector<std::string>& args);

// Stage options carried by a config.
MergeFileOptions merge_options(const PipelineConfig& cfg);
DetectOptions detect_options(const PipelineConfig& cfg);
FilterOptions filter_options(const PipelineConfig& cfg);

// merge -> [tag] -> detect (or cached entries) -> filter, each stage published
// by atomic rename only when it completed. Writes "<master>.meta.json".
PipelineReport run_pipeline(const PipelineConfig& cfg);

nlohmann::json pipeline_meta_json(const PipelineConfig& cfg, const PipelineReport& rep);
