// cpp/common/kway_merge.cpp
#include "kway_merge.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <queue>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "cdxj_errors.h"
#include "cdxj_record.h"
#include "line_reader.h"
#include "stage_output.h"

namespace {

// ==================== merge cursor ====================
struct ShardCursor {
    std::string name;
    std::unique_ptr<LineReader> reader; // released when the shard is exhausted

    std::string_view line; // raw bytes of the current record (incl. '\n' if any)
    CdxjRecord cur{};
    bool has = false;

    // previous key of this input (sortedness check)
    bool have_prev = false;
    std::string prev_surt;
    std::string prev_ts;
};

struct HeapItem {
    std::string_view surt;
    std::string_view ts;
    std::size_t input;
};

struct HeapCmp {
    bool operator()(const HeapItem& a, const HeapItem& b) const {
        // min-heap (invert); equal keys pop in input order
        int c = compare_bytes(a.surt, b.surt);
        if (c != 0) return c > 0;
        c = compare_bytes(a.ts, b.ts);
        if (c != 0) return c > 0;
        return a.input > b.input;
    }
};

static void drop_shard(ShardCursor& c, MergeStats& st, const std::string& why) {
    std::cerr << "[cdxj_merge] WARN: dropping rest of shard " << c.name << ": " << why << "\n";
    c.has = false;
    c.reader.reset();
    ++st.shards_dropped;
}

// Load the next record of `c`; mark the cursor exhausted at end of input.
static void advance(ShardCursor& c, const MergeOptions& opt, MergeStats& st) {
    if (!c.reader) { c.has = false; return; }

    if (c.has) {
        c.prev_surt.assign(c.cur.surt.data(), c.cur.surt.size());
        c.prev_ts.assign(c.cur.timestamp.data(), c.cur.timestamp.size());
        c.have_prev = true;
    }

    for (;;) {
        std::string_view line;
        try {
            if (!c.reader->next(line)) {
                c.has = false;
                c.reader.reset();
                return;
            }
        } catch (const ShardIOError& e) {
            if (opt.on_shard_error == ShardErrorPolicy::Abort) throw;
            drop_shard(c, st, e.what());
            return;
        }

        if (strip_newline(line).empty()) { ++st.blank_lines; continue; }

        CdxjRecord rec;
        try {
            rec = parse_record(line, c.name, c.reader->line_no(), c.reader->line_offset());
        } catch (const MalformedRecord& e) {
            if (opt.on_shard_error == ShardErrorPolicy::Abort) throw;
            std::cerr << "[cdxj_merge] WARN: skipping line: " << e.what() << "\n";
            ++st.malformed;
            continue;
        }

        if (c.have_prev) {
            int k = compare_bytes(rec.surt, c.prev_surt);
            if (k == 0) k = compare_bytes(rec.timestamp, c.prev_ts);
            if (k < 0) {
                UnsortedInputViolation err(
                    "key '" + std::string(rec.surt) + " " + std::string(rec.timestamp) +
                    "' sorts before previous '" + c.prev_surt + " " + c.prev_ts + "'",
                    c.name, c.reader->line_no(), c.reader->line_offset());
                if (opt.on_unsorted == ViolationPolicy::Abort) throw err;
                std::cerr << "[cdxj_merge] WARN: " << err.what() << "\n";
                ++st.unsorted;
            }
        }

        c.line = line;
        c.cur = rec;
        c.has = true;
        return;
    }
}

// ==================== path helpers ====================
struct OpenedInputs {
    std::vector<std::unique_ptr<std::ifstream>> files;
    std::vector<MergeInput> inputs;
};

static OpenedInputs open_inputs(const std::vector<std::string>& paths,
                                const MergeOptions& opt,
                                MergeStats& st) {
    OpenedInputs oi;
    oi.files.reserve(paths.size());
    oi.inputs.reserve(paths.size());

    for (const auto& p : paths) {
        if (p == "-") {
            oi.inputs.push_back(MergeInput{"-", &std::cin});
            continue;
        }
        auto f = std::make_unique<std::ifstream>(p, std::ios::binary);
        if (!*f) {
            ShardIOError err("cannot open input", p);
            if (opt.on_shard_error == ShardErrorPolicy::Abort) throw err;
            std::cerr << "[cdxj_merge] WARN: dropping shard " << p << ": " << err.what() << "\n";
            ++st.shards_dropped;
            continue;
        }
        oi.inputs.push_back(MergeInput{p, f.get()});
        oi.files.push_back(std::move(f));
    }
    return oi;
}

static void add_counters(MergeStats& acc, const MergeStats& s) {
    acc.blank_lines    += s.blank_lines;
    acc.malformed      += s.malformed;
    acc.unsorted       += s.unsorted;
    acc.shards_dropped += s.shards_dropped;
}

static MergeStats merge_paths_to_stream(const std::vector<std::string>& paths,
                                        std::ostream& out,
                                        const MergeOptions& opt) {
    MergeStats open_st;
    OpenedInputs oi = open_inputs(paths, opt, open_st);
    MergeStats st = merge_streams(oi.inputs, out, opt);
    st.inputs = paths.size();
    add_counters(st, open_st);
    return st;
}

static MergeStats merge_group_to_file(const std::vector<std::string>& group,
                                      const fs::path& out_path,
                                      const MergeOptions& opt) {
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot create group output: " + out_path.string());
    MergeStats st = merge_paths_to_stream(group, out, opt);
    out.close();
    if (out.fail()) throw std::runtime_error("write failed: " + out_path.string());
    return st;
}

struct TempDirGuard {
    fs::path dir;
    bool keep = false;
    ~TempDirGuard() {
        if (dir.empty() || keep) return;
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

// One pass: contiguous groups of at most max_way inputs, merged in parallel.
static std::vector<std::string> merge_pass(const std::vector<std::string>& cur,
                                           const fs::path& tmp_dir,
                                           unsigned pass,
                                           const MergeFileOptions& opt,
                                           MergeStats& acc) {
    const std::size_t way = static_cast<std::size_t>(opt.max_way);

    std::vector<std::vector<std::string>> groups;
    for (std::size_t i = 0; i < cur.size(); i += way) {
        const std::size_t j = std::min(i + way, cur.size());
        groups.emplace_back(cur.begin() + static_cast<std::ptrdiff_t>(i),
                            cur.begin() + static_cast<std::ptrdiff_t>(j));
    }

    std::vector<std::string> next(groups.size());
    for (std::size_t g = 0; g < groups.size(); ++g) {
        next[g] = (tmp_dir / ("merged_p" + std::to_string(pass) + "_g" + std::to_string(g) + ".cdxj")).string();
    }

    std::vector<MergeStats> gst(groups.size());
    std::vector<std::exception_ptr> errs(groups.size());
    std::atomic<std::size_t> next_group{0};

    std::size_t nthreads = static_cast<std::size_t>(std::max(1, opt.threads));
    nthreads = std::min(nthreads, groups.size());

    std::vector<std::thread> workers;
    workers.reserve(nthreads);
    for (std::size_t t = 0; t < nthreads; ++t) {
        workers.emplace_back([&]() {
            for (;;) {
                const std::size_t g = next_group.fetch_add(1);
                if (g >= groups.size()) return;
                try {
                    gst[g] = merge_group_to_file(groups[g], next[g], opt);
                } catch (...) {
                    errs[g] = std::current_exception();
                }
            }
        });
    }
    for (auto& th : workers) th.join();

    for (auto& e : errs) {
        if (e) std::rethrow_exception(e);
    }
    for (const auto& s : gst) add_counters(acc, s);

    if (opt.verbose) {
        std::cerr << "[cdxj_merge] pass " << pass << ": " << cur.size() << " inputs -> "
                  << next.size() << " groups (threads=" << nthreads << ")\n";
    }
    return next;
}

} // namespace

MergeStats merge_streams(const std::vector<MergeInput>& inputs,
                         std::ostream& out,
                         const MergeOptions& opt) {
    MergeStats st;
    st.inputs = inputs.size();

    std::vector<ShardCursor> cursors(inputs.size());
    for (std::size_t i = 0; i < inputs.size(); ++i) {
        if (!inputs[i].in) throw std::invalid_argument("null input stream: " + inputs[i].name);
        cursors[i].name = inputs[i].name;
        cursors[i].reader = std::make_unique<LineReader>(*inputs[i].in, inputs[i].name);
    }

    std::priority_queue<HeapItem, std::vector<HeapItem>, HeapCmp> heap;

    // prime heap
    for (std::size_t i = 0; i < cursors.size(); ++i) {
        advance(cursors[i], opt, st);
        if (cursors[i].has) heap.push(HeapItem{cursors[i].cur.surt, cursors[i].cur.timestamp, i});
    }

    while (!heap.empty()) {
        const HeapItem it = heap.top();
        heap.pop();

        ShardCursor& c = cursors[it.input];
        write_all(out, c.line);
        st.bytes_out += c.line.size();
        if (c.line.back() != '\n') {
            write_all(out, "\n");
            ++st.bytes_out;
        }
        ++st.records;

        // advance that cursor
        advance(c, opt, st);
        if (c.has) heap.push(HeapItem{c.cur.surt, c.cur.timestamp, it.input});
    }

    out.flush();
    if (!out.good()) throw std::runtime_error("write failed");
    return st;
}

MergeStats merge_files(const std::vector<std::string>& inputs,
                       const std::string& output,
                       const MergeFileOptions& opt) {
    if (inputs.empty()) throw std::invalid_argument("merge needs at least one input");
    if (std::count(inputs.begin(), inputs.end(), std::string("-")) > 1) {
        throw std::invalid_argument("at most one input may be '-' (stdin)");
    }

    MergeStats acc;
    std::vector<std::string> cur = inputs;
    unsigned pass = 0;

    TempDirGuard tmp;
    tmp.keep = opt.keep_tmp;

    if (opt.max_way >= 2 && cur.size() > static_cast<std::size_t>(opt.max_way)) {
        tmp.dir = make_temp_dir(output == "-" ? fs::current_path() / "stdout" : fs::path(output), "merge");

        while (cur.size() > static_cast<std::size_t>(opt.max_way)) {
            std::vector<std::string> next = merge_pass(cur, tmp.dir, pass, opt, acc);

            // previous generation of intermediates can go now (never the caller's inputs)
            if (pass > 0 && !opt.keep_tmp) {
                std::error_code ec;
                for (const auto& p : cur) fs::remove(p, ec);
            }
            cur = std::move(next);
            ++pass;
        }
    }

    MergeStats fin;
    if (output == "-") {
        fin = merge_paths_to_stream(cur, std::cout, opt);
    } else {
        StageOutput so(output, opt.durable);
        fin = merge_paths_to_stream(cur, so.stream(), opt);
        so.commit();
    }

    add_counters(acc, fin);
    acc.inputs    = inputs.size();
    acc.records   = fin.records;
    acc.bytes_out = fin.bytes_out;
    acc.passes    = pass + 1;
    return acc;
}
