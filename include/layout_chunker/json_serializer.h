#pragma once

#include "layout_chunker/document_chunker.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace layout_chunker {

class JsonSerializer {
public:
    // {"kind", "content", "doc_name", "title", "english", "token_count",
    //  "positions": [[page, left, right, top, bottom], ...], "image_png_base64"?}
    static nlohmann::json record_to_json(const IndexRecord& record, bool include_image = true);

    static nlohmann::json records_to_json(const std::vector<IndexRecord>& records,
                                          bool include_images = true);

    // Same document as records_to_json, written through rapidjson
    static std::string serialize_records(const std::vector<IndexRecord>& records,
                                         bool pretty = false, bool include_images = true);

    // Missing keys keep their defaults; wrong types or values throw std::invalid_argument
    static ParserConfig parse_config(const nlohmann::json& json);
    static nlohmann::json config_to_json(const ParserConfig& config);

    static std::string base64_encode(const std::vector<uint8_t>& data);
};

} // namespace layout_chunker
