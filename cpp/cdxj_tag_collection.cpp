// cpp/cdxj_tag_collection.cpp
//
// Usage: cdxj_tag_collection <name> <input|-> <output|->
// Adds "collection": "<name>" to every record's JSON payload.
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "common/cdxj_pipeline.h"
#include "common/collection_tagger.h"
#include "common/stage_output.h"

int main(int argc, char** argv) {
    if (argc != 4) {
        std::cerr << "Usage: cdxj_tag_collection <name> <input|-> <output|->\n";
        return 1;
    }

    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    const std::string name   = argv[1];
    const std::string input  = argv[2];
    const std::string output = argv[3];

    if (name.empty()) {
        std::cerr << "[cdxj_tag_collection] empty collection name\n";
        return 1;
    }

    try {
        PipelineConfig cfg = default_pipeline_config();
        apply_env_overrides(cfg);

        std::unique_ptr<std::ifstream> file;
        std::istream* in = &std::cin;
        if (input != "-") {
            file = std::make_unique<std::ifstream>(input, std::ios::binary);
            if (!*file) {
                std::cerr << "[cdxj_tag_collection] cannot open " << input << "\n";
                return 1;
            }
            in = file.get();
        }

        TagStats st;
        if (output == "-") {
            st = tag_collection(*in, input, name, std::cout);
        } else {
            // output may be the input itself: the temp sibling is renamed over it at the end
            StageOutput so(output, cfg.durable_fsync);
            st = tag_collection(*in, input, name, so.stream());
            file.reset();
            so.commit();
        }

        std::cerr
            << "[cdxj_tag_collection] " << input << " -> " << output << ": "
            << "records=" << st.records
            << " tagged=" << st.tagged
            << " already_tagged=" << st.already_tagged
            << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[cdxj_tag_collection] ERROR: " << e.what() << "\n";
        return 2;
    }
}
