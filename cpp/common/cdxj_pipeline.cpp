// cpp/common/cdxj_pipeline.cpp
#include "cdxj_pipeline.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "cdxj_errors.h"
#include "content_hash.h"
#include "env_knobs.h"
#include "excessive_cache.h"
#include "stage_output.h"

using json = nlohmann::json;

namespace {

static void normalize(PipelineConfig& cfg) {
    if (cfg.merge_max_way < 0) cfg.merge_max_way = 0;
    if (cfg.merge_max_way == 1) cfg.merge_max_way = 2;
    if (cfg.threads < 1) cfg.threads = 1;
    if (cfg.threads > 256) cfg.threads = 256;
}

static fs::path dir_of(const fs::path& p) {
    fs::path d = p.parent_path();
    return d.empty() ? fs::path(".") : d;
}

// Typed stage: one input file -> one output file, published only on success.
template <class Fn>
static auto run_file_stage(const fs::path& in_path, const fs::path& out_path, bool durable, Fn&& fn) {
    std::ifstream in(in_path, std::ios::binary);
    if (!in) throw ShardIOError("cannot open input", in_path.string());
    StageOutput so(out_path, durable);
    auto st = fn(in, so.stream());
    so.commit();
    return st;
}

static bool master_is_current(const fs::path& master, const std::vector<std::string>& shards) {
    std::error_code ec;
    if (!fs::exists(master, ec)) return false;
    const auto mt = fs::last_write_time(master, ec);
    if (ec) return false;
    for (const auto& s : shards) {
        if (s == "-") return false;
        const auto st = fs::last_write_time(s, ec);
        if (ec || st >= mt) return false;
    }
    return true;
}

static ExcessiveKeyCache detect_and_cache(const PipelineConfig& cfg,
                                          const fs::path& master,
                                          const fs::path& cache_path,
                                          PipelineReport& rep) {
    std::ifstream in(master, std::ios::binary);
    if (!in) throw ShardIOError("cannot open master", master.string());

    ExcessiveKeyCache cache;
    cache.collection = cfg.collection;
    cache.threshold = cfg.threshold;
    cache.entries = detect_excessive_keys(in, master.string(), detect_options(cfg), &rep.detect);
    cache.master.path = master.string();
    cache.master.bytes = rep.detect.bytes;
    cache.master.content_hash = rep.detect.content_hash;

    save_cache(cache_path, cache, cfg.durable_fsync);

    if (cfg.verbose) {
        std::cerr << "[cdxj_pipeline] detected " << cache.entries.size() << " excessive keys (threshold="
                  << cfg.threshold << ") -> " << cache_path.string() << "\n";
    }
    return cache;
}

static json merge_json(const MergeStats& s) {
    json j;
    j["inputs"] = s.inputs;
    j["records"] = s.records;
    j["bytes_out"] = s.bytes_out;
    j["blank_lines"] = s.blank_lines;
    j["malformed"] = s.malformed;
    j["unsorted"] = s.unsorted;
    j["shards_dropped"] = s.shards_dropped;
    j["passes"] = s.passes;
    return j;
}

} // namespace

MergeFileOptions merge_options(const PipelineConfig& cfg) {
    MergeFileOptions o;
    o.on_shard_error = cfg.on_shard_error;
    o.on_unsorted = cfg.on_unsorted;
    o.verbose = cfg.verbose;
    o.max_way = cfg.merge_max_way;
    o.threads = cfg.threads;
    o.durable = cfg.durable_fsync;
    o.keep_tmp = cfg.keep_tmp;
    return o;
}

DetectOptions detect_options(const PipelineConfig& cfg) {
    DetectOptions o;
    o.threshold = cfg.threshold;
    o.on_unsorted = cfg.on_unsorted;
    return o;
}

FilterOptions filter_options(const PipelineConfig& cfg) {
    FilterOptions o;
    o.boundary = cfg.run_boundary;
    o.on_unsorted = cfg.on_unsorted;
    o.on_stale = cfg.on_stale;
    return o;
}

PipelineConfig default_pipeline_config() {
    PipelineConfig cfg;
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    cfg.threads = static_cast<int>(std::min<unsigned>(hw, 16u));
    return cfg;
}

void load_config_from_json(const fs::path& path, PipelineConfig& cfg) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open config: " + path.string());

    try {
        json j;
        in >> j;

        if (j.contains("shards"))         cfg.shards        = j["shards"].get<std::vector<std::string>>();
        if (j.contains("master"))         cfg.master_path   = j["master"].get<std::string>();
        if (j.contains("filtered"))       cfg.filtered_path = j["filtered"].get<std::string>();
        if (j.contains("collection"))     cfg.collection    = j["collection"].get<std::string>();
        if (j.contains("cache_dir"))      cfg.cache_dir     = j["cache_dir"].get<std::string>();

        if (j.contains("threshold"))      cfg.threshold     = j["threshold"].get<std::uint64_t>();
        if (j.contains("merge_max_way"))  cfg.merge_max_way = j["merge_max_way"].get<int>();
        if (j.contains("threads"))        cfg.threads       = j["threads"].get<int>();

        if (j.contains("on_shard_error")) cfg.on_shard_error = parse_shard_error_policy(j["on_shard_error"].get<std::string>());
        if (j.contains("on_unsorted"))    cfg.on_unsorted    = parse_violation_policy(j["on_unsorted"].get<std::string>());
        if (j.contains("on_stale"))       cfg.on_stale       = parse_violation_policy(j["on_stale"].get<std::string>());
        if (j.contains("run_boundary"))   cfg.run_boundary   = parse_run_boundary(j["run_boundary"].get<std::string>());

        if (j.contains("durable_fsync"))  cfg.durable_fsync = j["durable_fsync"].get<bool>();
        if (j.contains("incremental"))    cfg.incremental   = j["incremental"].get<bool>();
    } catch (const json::exception& e) {
        throw std::runtime_error("bad config " + path.string() + ": " + e.what());
    }

    normalize(cfg);
}

void apply_env_overrides(PipelineConfig& cfg) {
    if (env_is_set("CDXJ_THRESHOLD")) {
        const long t = env_long("CDXJ_THRESHOLD", static_cast<long>(cfg.threshold));
        cfg.threshold = t < 0 ? 0 : static_cast<std::uint64_t>(t);
    }
    cfg.merge_max_way = env_int("CDXJ_MERGE_MAX_WAY", cfg.merge_max_way);
    cfg.threads       = env_int("CDXJ_THREADS", cfg.threads);

    if (env_is_set("CDXJ_ON_SHARD_ERROR")) cfg.on_shard_error = parse_shard_error_policy(env_str("CDXJ_ON_SHARD_ERROR", ""));
    if (env_is_set("CDXJ_ON_UNSORTED"))    cfg.on_unsorted    = parse_violation_policy(env_str("CDXJ_ON_UNSORTED", ""));
    if (env_is_set("CDXJ_ON_STALE"))       cfg.on_stale       = parse_violation_policy(env_str("CDXJ_ON_STALE", ""));
    if (env_is_set("CDXJ_RUN_BOUNDARY"))   cfg.run_boundary   = parse_run_boundary(env_str("CDXJ_RUN_BOUNDARY", ""));

    cfg.durable_fsync = env_bool("CDXJ_DURABLE_FSYNC", cfg.durable_fsync);
    cfg.keep_tmp      = env_bool("CDXJ_TMP_KEEP", cfg.keep_tmp);
    cfg.verbose       = env_bool("CDXJ_VERBOSE", cfg.verbose);

    normalize(cfg);
}

std::vector<std::string> expand_shard_args(const std::vector<std::string>& args) {
    std::vector<std::string> out;
    for (const auto& a : args) {
        if (a.size() < 2 || a[0] != '@') {
            out.push_back(a);
            continue;
        }
        const std::string list_path = a.substr(1);
        std::ifstream in(list_path);
        if (!in) throw std::runtime_error("cannot open shard list: " + list_path);

        std::string line;
        while (std::getline(in, line)) {
            while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) line.pop_back();
            std::size_t b = 0;
            while (b < line.size() && (line[b] == ' ' || line[b] == '\t')) ++b;
            if (b == line.size() || line[b] == '#') continue;
            out.push_back(line.substr(b));
        }
    }
    return out;
}

PipelineReport run_pipeline(const PipelineConfig& cfg) {
    if (cfg.shards.empty()) throw std::invalid_argument("no shards given");
    if (cfg.master_path.empty()) throw std::invalid_argument("no master path given");

    PipelineReport rep;
    const fs::path master = cfg.master_path;

    // ---- merge (+ tag) ----
    if (cfg.incremental && master_is_current(master, cfg.shards)) {
        if (cfg.verbose) {
            std::cerr << "[cdxj_pipeline] " << master.string() << " is newer than every shard, merge skipped\n";
        }
    } else if (cfg.collection.empty()) {
        rep.merge = merge_files(cfg.shards, master.string(), merge_options(cfg));
        rep.merged = true;
    } else {
        // merged stream stays private until it is tagged
        fs::path untagged = master;
        untagged += make_temp_suffix() + "_untagged";
        struct Cleanup {
            fs::path p;
            ~Cleanup() { std::error_code ec; fs::remove(p, ec); }
        } cleanup{untagged};

        MergeFileOptions mo = merge_options(cfg);
        mo.durable = false;
        rep.merge = merge_files(cfg.shards, untagged.string(), mo);
        rep.merged = true;

        rep.tag = run_file_stage(untagged, master, cfg.durable_fsync, [&](std::istream& in, std::ostream& out) {
            return tag_collection(in, untagged.string(), cfg.collection, out);
        });
        rep.tagged = true;
    }

    if (cfg.verbose && rep.merged) {
        std::cerr << "[cdxj_pipeline] merged " << rep.merge.inputs << " shards -> " << master.string()
                  << " records=" << rep.merge.records << " passes=" << rep.merge.passes << "\n";
    }

    // ---- detect (or reuse) + filter ----
    if (!cfg.filtered_path.empty()) {
        const fs::path cache_dir = cfg.cache_dir.empty() ? dir_of(master) : fs::path(cfg.cache_dir);
        fs::create_directories(cache_dir);
        const fs::path cache_path = cache_path_for(cache_dir, master, cfg.collection);
        rep.cache_path = cache_path.string();

        ExcessiveKeyCache cache;
        if (std::optional<ExcessiveKeyCache> c = load_if_fresh(cache_path, master, cfg.collection, cfg.threshold)) {
            cache = std::move(*c);
            rep.cache_hit = true;
        } else {
            cache = detect_and_cache(cfg, master, cache_path, rep);
        }

        FilterOptions fo = filter_options(cfg);
        fo.entries_source = cache_path.string();
        fo.expected_content_hash = cache.master.content_hash;

        auto filter_stage = [&](std::istream& in, std::ostream& out) {
            return filter_excessive(in, master.string(), cache.entries, out, fo);
        };

        try {
            rep.filter = run_file_stage(master, cfg.filtered_path, cfg.durable_fsync, filter_stage);
        } catch (const StaleEntryMismatch& e) {
            if (!rep.cache_hit) throw;
            std::cerr << "[cdxj_pipeline] WARN: cached entries do not match the master (" << e.what()
                      << "), recomputing\n";
            std::error_code ec;
            fs::remove(cache_path, ec);

            cache = detect_and_cache(cfg, master, cache_path, rep);
            fo.expected_content_hash = cache.master.content_hash;
            rep.cache_retry = true;
            rep.filter = run_file_stage(master, cfg.filtered_path, cfg.durable_fsync, filter_stage);
        }
        rep.filtered = true;
        rep.entries = cache.entries.size();
    }

    // ---- meta ----
    {
        fs::path meta_path = master;
        meta_path += ".meta.json";
        StageOutput so(meta_path, cfg.durable_fsync);
        so.stream() << pipeline_meta_json(cfg, rep).dump() << "\n";
        so.commit();
    }

    return rep;
}

json pipeline_meta_json(const PipelineConfig& cfg, const PipelineReport& rep) {
    json j_cfg;
    j_cfg["shards"] = cfg.shards.size();
    j_cfg["collection"] = cfg.collection;
    j_cfg["threshold"] = cfg.threshold;
    j_cfg["merge_max_way"] = cfg.merge_max_way;
    j_cfg["threads"] = cfg.threads;
    j_cfg["on_shard_error"] = to_string(cfg.on_shard_error);
    j_cfg["on_unsorted"] = to_string(cfg.on_unsorted);
    j_cfg["on_stale"] = to_string(cfg.on_stale);
    j_cfg["run_boundary"] = to_string(cfg.run_boundary);
    j_cfg["durable_fsync"] = cfg.durable_fsync;
    j_cfg["incremental"] = cfg.incremental;

    json j_stats;
    j_stats["merge"] = rep.merged ? merge_json(rep.merge) : json(nullptr);

    if (rep.tagged) {
        json t;
        t["records"] = rep.tag.records;
        t["tagged"] = rep.tag.tagged;
        t["already_tagged"] = rep.tag.already_tagged;
        j_stats["tag"] = std::move(t);
    } else {
        j_stats["tag"] = nullptr;
    }

    if (rep.filtered) {
        json d;
        d["cache"] = rep.cache_path;
        d["cache_hit"] = rep.cache_hit;
        d["cache_retry"] = rep.cache_retry;
        d["entries"] = rep.entries;
        if (!rep.cache_hit || rep.cache_retry) {
            d["records"] = rep.detect.records;
            d["runs"] = rep.detect.runs;
            d["longest_run"] = rep.detect.longest_run;
        }
        j_stats["detect"] = std::move(d);

        json f;
        f["records_in"] = rep.filter.records_in;
        f["records_removed"] = rep.filter.records_removed;
        f["bytes_in"] = rep.filter.bytes_in;
        f["bytes_out"] = rep.filter.bytes_out;
        f["entries_applied"] = rep.filter.entries_applied;
        f["entries_stale"] = rep.filter.entries_stale;
        f["master_content_hash"] = ContentHash64::to_hex(rep.filter.content_hash);
        j_stats["filter"] = std::move(f);
    } else {
        j_stats["detect"] = nullptr;
        j_stats["filter"] = nullptr;
    }

    json j_meta;
    j_meta["config"] = std::move(j_cfg);
    j_meta["stats"] = std::move(j_stats);
    return j_meta;
}
