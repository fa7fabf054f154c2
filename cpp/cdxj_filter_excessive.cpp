// cpp/cdxj_filter_excessive.cpp
//
// Usage: cdxj_filter_excessive <excessive_keys|cache.json> <master|-> [output|-]
// Removes the runs of the listed keys from a sorted master. A .json argument is
// an excessive-key cache; its content hash is checked against the master.
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/cdxj_pipeline.h"
#include "common/excessive_cache.h"
#include "common/excessive_filter.h"
#include "common/excessive_keys.h"
#include "common/stage_output.h"

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: cdxj_filter_excessive <excessive_keys|cache.json> <master|-> [output|-]\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    const fs::path entries_path = argv[1];
    const std::string master = argv[2];
    const std::string output = argc > 3 ? argv[3] : "-";

    try {
        PipelineConfig cfg = default_pipeline_config();
        apply_env_overrides(cfg);

        FilterOptions fo = filter_options(cfg);
        fo.entries_source = entries_path.string();

        std::vector<ExcessiveKeyEntry> entries;
        if (entries_path.extension() == ".json") {
            std::optional<ExcessiveKeyCache> c = load_cache(entries_path);
            if (!c) {
                std::cerr << "[cdxj_filter_excessive] cannot load cache " << entries_path.string() << "\n";
                return 1;
            }
            entries = std::move(c->entries);
            fo.expected_content_hash = c->master.content_hash;
        } else {
            std::ifstream ein(entries_path, std::ios::binary);
            if (!ein) {
                std::cerr << "[cdxj_filter_excessive] cannot open " << entries_path.string() << "\n";
                return 1;
            }
            entries = read_entries(ein, entries_path.string());
        }

        std::unique_ptr<std::ifstream> file;
        std::istream* in = &std::cin;
        if (master != "-") {
            file = std::make_unique<std::ifstream>(master, std::ios::binary);
            if (!*file) {
                std::cerr << "[cdxj_filter_excessive] cannot open " << master << "\n";
                return 1;
            }
            in = file.get();
        }

        FilterStats st;
        if (output == "-") {
            st = filter_excessive(*in, master, entries, std::cout, fo);
        } else {
            StageOutput so(output, cfg.durable_fsync);
            st = filter_excessive(*in, master, entries, so.stream(), fo);
            so.commit();
        }

        std::cerr
            << "[cdxj_filter_excessive] " << master << " -> " << output << ": "
            << "records_in=" << st.records_in
            << " removed=" << st.records_removed
            << " entries=" << entries.size()
            << " applied=" << st.entries_applied
            << " stale=" << st.entries_stale
            << " boundary=" << to_string(fo.boundary)
            << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[cdxj_filter_excessive] ERROR: " << e.what() << "\n";
        return 2;
    }
}
