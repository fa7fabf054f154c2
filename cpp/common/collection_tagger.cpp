// cpp/common/collection_tagger.cpp
#include "collection_tagger.h"

#include <string_view>

#include <simdjson.h>
#include <nlohmann/json.hpp>

#include "cdxj_errors.h"
#include "cdxj_record.h"
#include "line_reader.h"
#include "stage_output.h"

using json = nlohmann::json;

std::string collection_member(const std::string& collection) {
    return "\"collection\": " + json(collection).dump();
}

TagStats tag_collection(std::istream& in,
                        const std::string& source,
                        const std::string& collection,
                        std::ostream& out) {
    TagStats st;
    LineReader reader(in, source);
    simdjson::dom::parser parser;

    const std::string member = collection_member(collection);
    const std::string member_next = ", " + member;

    auto emit = [&](std::string_view bytes) {
        write_all(out, bytes);
        st.bytes_out += bytes.size();
    };

    std::string_view line;
    while (reader.next(line)) {
        if (strip_newline(line).empty()) {
            ++st.blank_lines;
            emit(line);
            continue;
        }

        const CdxjRecord rec = parse_record(line, source, reader.line_no(), reader.line_offset());
        ++st.records;

        simdjson::dom::element doc;
        simdjson::dom::object obj;
        auto err = parser.parse(rec.payload.data(), rec.payload.size()).get(doc);
        if (!err) err = doc.get_object().get(obj);
        if (err) {
            throw MalformedRecord("payload is not a JSON object (" + std::string(simdjson::error_message(err)) + ")",
                                  source, reader.line_no(), reader.line_offset());
        }

        if (obj["collection"].error() == simdjson::SUCCESS) {
            ++st.already_tagged;
            emit(line);
            continue;
        }

        // simdjson accepted it as an object, so the last '}' closes it
        const std::size_t payload_at = static_cast<std::size_t>(rec.payload.data() - line.data());
        const std::size_t close_at = payload_at + rec.payload.rfind('}');

        emit(line.substr(0, close_at));
        emit(obj.size() == 0 ? member : member_next);
        emit(line.substr(close_at));
        if (line.back() != '\n') emit("\n");
        ++st.tagged;
    }

    out.flush();
    if (!out.good()) throw std::runtime_error("write failed");
    return st;
}
