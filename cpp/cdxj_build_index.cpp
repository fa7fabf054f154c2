// cpp/cdxj_build_index.cpp
//
// Whole collection build: merge shards into the master, tag it, find the
// excessive keys (or reuse a fresh cache) and write the filtered index.
//
// Precedence: built-in defaults < -c config.json < CDXJ_* env < command line.
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "common/cdxj_pipeline.h"

static void usage() {
    std::cerr
        << "Usage: cdxj_build_index [-c config.json] -o <master> [-f <filtered>] [-t threshold]\n"
        << "                        [-n collection] [-x cache_dir] [-i] [-v] <shard|@list>...\n"
        << "  -i  incremental: keep the master if it is newer than every shard\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::string config_path;
    std::string master, filtered, collection, cache_dir, threshold;
    bool threshold_given = false;
    bool incremental = false;
    bool verbose = false;
    std::vector<std::string> shard_args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };

        bool ok = true;
        if (a == "-c")      ok = value(config_path);
        else if (a == "-o") ok = value(master);
        else if (a == "-f") ok = value(filtered);
        else if (a == "-t") ok = threshold_given = value(threshold);
        else if (a == "-n") ok = value(collection);
        else if (a == "-x") ok = value(cache_dir);
        else if (a == "-i") incremental = true;
        else if (a == "-v") verbose = true;
        else if (a == "-" || a[0] != '-') shard_args.push_back(a);
        else ok = false;

        if (!ok) {
            usage();
            return 1;
        }
    }

    try {
        PipelineConfig cfg = default_pipeline_config();
        if (!config_path.empty()) load_config_from_json(config_path, cfg);
        apply_env_overrides(cfg);

        if (!master.empty())     cfg.master_path = master;
        if (!filtered.empty())   cfg.filtered_path = filtered;
        if (!collection.empty()) cfg.collection = collection;
        if (!cache_dir.empty())  cfg.cache_dir = cache_dir;
        if (incremental)         cfg.incremental = true;
        if (verbose)             cfg.verbose = true;
        if (threshold_given) {
            char* end = nullptr;
            const unsigned long long t = std::strtoull(threshold.c_str(), &end, 10);
            if (threshold.empty() || threshold[0] == '-' || *end != '\0') {
                std::cerr << "[cdxj_build_index] bad threshold '" << threshold << "'\n";
                return 1;
            }
            cfg.threshold = t;
        }
        if (!shard_args.empty()) cfg.shards = expand_shard_args(shard_args);

        if (cfg.master_path.empty() || cfg.shards.empty()) {
            usage();
            return 1;
        }

        const PipelineReport rep = run_pipeline(cfg);

        std::cerr << "[cdxj_build_index] master " << cfg.master_path;
        if (rep.merged) {
            std::cerr << ": shards=" << rep.merge.inputs
                      << " records=" << rep.merge.records
                      << " passes=" << rep.merge.passes
                      << " dropped_shards=" << rep.merge.shards_dropped;
        } else {
            std::cerr << ": up to date";
        }
        if (rep.tagged) std::cerr << " tagged=" << rep.tag.tagged << " collection=" << cfg.collection;
        std::cerr << "\n";

        if (rep.filtered) {
            std::cerr
                << "[cdxj_build_index] filtered " << cfg.filtered_path << ": "
                << "excessive=" << rep.entries
                << " threshold=" << cfg.threshold
                << " removed=" << rep.filter.records_removed
                << " kept=" << (rep.filter.records_in - rep.filter.records_removed)
                << " cache=" << (rep.cache_hit ? (rep.cache_retry ? "stale" : "hit") : "miss")
                << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[cdxj_build_index] ERROR: " << e.what() << "\n";
        return 2;
    }
}
