// cpp/common/excessive_cache.cpp
#include "excessive_cache.h"

#include <charconv>
#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

#include "content_hash.h"
#include "stage_output.h"

using json = nlohmann::json;

namespace {

static bool parse_hex64(const std::string& s, std::uint64_t& out) {
    if (s.empty() || s.size() > 16) return false;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out, 16);
    return res.ec == std::errc() && res.ptr == s.data() + s.size();
}

} // namespace

void save_cache(const fs::path& path, const ExcessiveKeyCache& cache, bool durable) {
    json j_entries = json::array();
    for (const auto& e : cache.entries) {
        j_entries.push_back(json::array({e.surt, e.count}));
    }

    json j_master;
    j_master["path"] = cache.master.path;
    j_master["bytes"] = cache.master.bytes;
    j_master["content_hash"] = ContentHash64::to_hex(cache.master.content_hash);

    json j;
    j["format"] = EXCESSIVE_CACHE_FORMAT;
    j["collection"] = cache.collection;
    j["threshold"] = cache.threshold;
    j["master"] = std::move(j_master);
    j["entries"] = std::move(j_entries);

    StageOutput so(path, durable);
    so.stream() << j.dump() << "\n";
    so.commit();
}

std::optional<ExcessiveKeyCache> load_cache(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    std::ifstream in(path);
    if (!in) {
        std::cerr << "[excessive_cache] WARN: cannot open " << path.string() << "\n";
        return std::nullopt;
    }

    try {
        json j;
        in >> j;

        if (j.value("format", 0) != EXCESSIVE_CACHE_FORMAT) {
            std::cerr << "[excessive_cache] WARN: unknown format in " << path.string() << "\n";
            return std::nullopt;
        }

        ExcessiveKeyCache c;
        c.collection = j.at("collection").get<std::string>();
        c.threshold = j.at("threshold").get<std::uint64_t>();

        const json& m = j.at("master");
        c.master.path = m.at("path").get<std::string>();
        c.master.bytes = m.at("bytes").get<std::uint64_t>();
        if (!parse_hex64(m.at("content_hash").get<std::string>(), c.master.content_hash)) {
            std::cerr << "[excessive_cache] WARN: bad content_hash in " << path.string() << "\n";
            return std::nullopt;
        }

        for (const auto& e : j.at("entries")) {
            c.entries.push_back(ExcessiveKeyEntry{e.at(0).get<std::string>(), e.at(1).get<std::uint64_t>()});
        }
        return c;
    } catch (const json::exception& e) {
        std::cerr << "[excessive_cache] WARN: ignoring unreadable cache " << path.string() << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<ExcessiveKeyCache> load_if_fresh(const fs::path& cache_path,
                                               const fs::path& master_path,
                                               const std::string& collection,
                                               std::uint64_t threshold) {
    std::optional<ExcessiveKeyCache> c = load_cache(cache_path);
    if (!c) return std::nullopt;

    auto stale = [&](const std::string& why) -> std::optional<ExcessiveKeyCache> {
        std::cerr << "[excessive_cache] " << cache_path.string() << " is stale: " << why << "\n";
        return std::nullopt;
    };

    if (c->collection != collection) return stale("collection '" + c->collection + "' != '" + collection + "'");
    if (c->threshold != threshold) {
        return stale("threshold " + std::to_string(c->threshold) + " != " + std::to_string(threshold));
    }

    std::error_code ec;
    const std::uintmax_t size = fs::file_size(master_path, ec);
    if (ec) return stale("cannot stat master: " + ec.message());
    if (static_cast<std::uint64_t>(size) != c->master.bytes) {
        return stale("master size " + std::to_string(size) + " != recorded " + std::to_string(c->master.bytes));
    }
    return c;
}

fs::path cache_path_for(const fs::path& cache_dir, const fs::path& master_path, const std::string& collection) {
    const std::string base = collection.empty() ? master_path.filename().string() : collection;
    return cache_dir / (base + ".excessive.json");
}
