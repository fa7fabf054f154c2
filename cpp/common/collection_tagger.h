// cpp/common/collection_tagger.h
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

struct TagStats {
    std::uint64_t records        = 0;
    std::uint64_t tagged         = 0;
    std::uint64_t already_tagged = 0; // payload already had a "collection" member
    std::uint64_t blank_lines    = 0;
    std::uint64_t bytes_out      = 0;
};

// `"collection": "<name>"` with the name escaped as a JSON string.
std::string collection_member(const std::string& collection);

// Append the collection member to every record's JSON payload. Keys and all
// other bytes are untouched, so a sorted input stays sorted. A payload that is
// not a JSON object throws MalformedRecord.
TagStats tag_collection(std::istream& in,
                        const std::string& source,
                        const std::string& collection,
                        std::ostream& out);
