// cpp/cdxj_find_excessive.cpp
//
// Usage: cdxj_find_excessive [-n threshold] [-o entries_out] <input|->
// Prints "surt count" for every key whose run is longer than the threshold.
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "common/cdxj_pipeline.h"
#include "common/excessive_keys.h"
#include "common/stage_output.h"

static void usage() {
    std::cerr << "Usage: cdxj_find_excessive [-n threshold] [-o entries_out] <input|->\n";
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    try {
        PipelineConfig cfg = default_pipeline_config();
        apply_env_overrides(cfg);

        std::string input;
        std::string output = "-";
        for (int i = 1; i < argc; ++i) {
            const std::string a = argv[i];
            if ((a == "-n" || a == "-o") && i + 1 < argc) {
                const std::string v = argv[++i];
                if (a == "-o") {
                    output = v;
                    continue;
                }
                char* end = nullptr;
                const unsigned long long t = std::strtoull(v.c_str(), &end, 10);
                if (v.empty() || v[0] == '-' || *end != '\0') {
                    std::cerr << "[cdxj_find_excessive] bad threshold '" << v << "'\n";
                    return 1;
                }
                cfg.threshold = t;
            } else if (input.empty() && (a == "-" || a[0] != '-')) {
                input = a;
            } else {
                usage();
                return 1;
            }
        }
        if (input.empty()) {
            usage();
            return 1;
        }

        std::unique_ptr<std::ifstream> file;
        std::istream* in = &std::cin;
        if (input != "-") {
            file = std::make_unique<std::ifstream>(input, std::ios::binary);
            if (!*file) {
                std::cerr << "[cdxj_find_excessive] cannot open " << input << "\n";
                return 1;
            }
            in = file.get();
        }

        DetectStats st;
        if (output == "-") {
            st = detect_excessive(*in, input, detect_options(cfg),
                                  [](const ExcessiveKeyEntry& e) { write_entry(std::cout, e); });
            std::cout.flush();
            if (!std::cout.good()) throw std::runtime_error("write failed: stdout");
        } else {
            StageOutput so(output, cfg.durable_fsync);
            st = detect_excessive(*in, input, detect_options(cfg),
                                  [&](const ExcessiveKeyEntry& e) { write_entry(so.stream(), e); });
            so.commit();
        }

        std::cerr
            << "[cdxj_find_excessive] " << input << ": "
            << "records=" << st.records
            << " runs=" << st.runs
            << " excessive=" << st.entries
            << " threshold=" << cfg.threshold
            << " longest_run=" << st.longest_run
            << " unsorted=" << st.unsorted
            << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[cdxj_find_excessive] ERROR: " << e.what() << "\n";
        return 2;
    }
}
