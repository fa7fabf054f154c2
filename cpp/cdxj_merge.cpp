// cpp/cdxj_merge.cpp
//
// Usage: cdxj_merge <output|-> <input|-|@list>...
// Stable k-way merge of sorted CDXJ shards. Knobs: CDXJ_MERGE_MAX_WAY,
// CDXJ_THREADS, CDXJ_ON_SHARD_ERROR, CDXJ_ON_UNSORTED, CDXJ_DURABLE_FSYNC,
// CDXJ_TMP_KEEP, CDXJ_VERBOSE.
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "common/cdxj_pipeline.h"
#include "common/kway_merge.h"

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: cdxj_merge <output|-> <input|-|@list>...\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        PipelineConfig cfg = default_pipeline_config();
        apply_env_overrides(cfg);

        const std::string output = argv[1];
        const std::vector<std::string> inputs = expand_shard_args(std::vector<std::string>(argv + 2, argv + argc));
        if (inputs.empty()) {
            std::cerr << "[cdxj_merge] no inputs\n";
            return 1;
        }

        const MergeStats st = merge_files(inputs, output, merge_options(cfg));

        std::cerr
            << "[cdxj_merge] merged " << st.inputs << " inputs -> " << output << ": "
            << "records=" << st.records
            << " bytes=" << st.bytes_out
            << " passes=" << st.passes
            << " blank=" << st.blank_lines
            << " malformed=" << st.malformed
            << " unsorted=" << st.unsorted
            << " dropped_shards=" << st.shards_dropped
            << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[cdxj_merge] ERROR: " << e.what() << "\n";
        return 2;
    }
}
