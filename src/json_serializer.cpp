#include "layout_chunker/json_serializer.h"
#include "layout_chunker/json_types.h"
#include <stdexcept>

namespace layout_chunker {

namespace {

nlohmann::json position_to_json(const Position& pos) {
    return nlohmann::json::array({pos.page, pos.left, pos.right, pos.top, pos.bottom});
}

} // namespace

std::string JsonSerializer::base64_encode(const std::vector<uint8_t>& data) {
    static const char* const alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        encoded += alphabet[(triple >> 18) & 0x3F];
        encoded += alphabet[(triple >> 12) & 0x3F];
        encoded += alphabet[(triple >> 6) & 0x3F];
        encoded += alphabet[triple & 0x3F];
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t triple = data[i] << 16;
        encoded += alphabet[(triple >> 18) & 0x3F];
        encoded += alphabet[(triple >> 12) & 0x3F];
        encoded += "==";
    } else if (remaining == 2) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8);
        encoded += alphabet[(triple >> 18) & 0x3F];
        encoded += alphabet[(triple >> 12) & 0x3F];
        encoded += alphabet[(triple >> 6) & 0x3F];
        encoded += '=';
    }

    return encoded;
}

nlohmann::json JsonSerializer::record_to_json(const IndexRecord& record, bool include_image) {
    nlohmann::json json;
    json["kind"] = to_string(record.kind);
    json["content"] = record.content;
    json["doc_name"] = record.doc_name;
    json["title"] = record.title;
    json["english"] = record.english;
    json["token_count"] = record.token_count;

    json["positions"] = nlohmann::json::array();
    for (const auto& pos : record.positions) {
        json["positions"].push_back(position_to_json(pos));
    }

    if (include_image && record.image && !record.image->empty()) {
        json["image_png_base64"] = base64_encode(record.image->to_png());
    }

    return json;
}

nlohmann::json JsonSerializer::records_to_json(const std::vector<IndexRecord>& records,
                                               bool include_images) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& record : records) {
        array.push_back(record_to_json(record, include_images));
    }
    return array;
}

std::string JsonSerializer::serialize_records(const std::vector<IndexRecord>& records,
                                              bool pretty, bool include_images) {
    JsonBuilder builder;
    for (const auto& record : records) {
        builder.add_record(record, include_images);
    }
    return builder.serialize(pretty);
}

ParserConfig JsonSerializer::parse_config(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw std::invalid_argument("Parser config must be a JSON object");
    }

    ParserConfig config;

    if (json.contains("chunk_token_num")) {
        const auto& value = json["chunk_token_num"];
        if (!value.is_number_integer() || value.get<int>() <= 0) {
            throw std::invalid_argument("chunk_token_num must be a positive integer");
        }
        config.chunk_token_num = value.get<int>();
    }

    if (json.contains("delimiter")) {
        const auto& value = json["delimiter"];
        if (!value.is_string()) {
            throw std::invalid_argument("delimiter must be a string");
        }
        config.delimiter = value.get<std::string>();
    }

    if (json.contains("layout_recognize")) {
        const auto& value = json["layout_recognize"];
        if (!value.is_string() || value.get<std::string>().empty()) {
            throw std::invalid_argument("layout_recognize must be a non-empty string");
        }
        config.layout_recognize = value.get<std::string>();
    }

    return config;
}

nlohmann::json JsonSerializer::config_to_json(const ParserConfig& config) {
    return {
        {"chunk_token_num", config.chunk_token_num},
        {"delimiter", config.delimiter},
        {"layout_recognize", config.layout_recognize}
    };
}

void JsonBuilder::add_record(const IndexRecord& record, bool include_image) {
    JsonAllocator& alloc = allocator();

    JsonValue value(rapidjson::kObjectType);
    value.AddMember("kind", JsonValue(rapidjson::StringRef(to_string(record.kind))), alloc);
    value.AddMember("content", string_value(record.content), alloc);
    value.AddMember("doc_name", string_value(record.doc_name), alloc);
    value.AddMember("title", string_value(record.title), alloc);
    value.AddMember("english", record.english, alloc);
    value.AddMember("token_count", static_cast<uint64_t>(record.token_count), alloc);

    JsonValue positions(rapidjson::kArrayType);
    for (const auto& pos : record.positions) {
        JsonValue entry(rapidjson::kArrayType);
        entry.PushBack(pos.page, alloc);
        entry.PushBack(pos.left, alloc);
        entry.PushBack(pos.right, alloc);
        entry.PushBack(pos.top, alloc);
        entry.PushBack(pos.bottom, alloc);
        positions.PushBack(entry, alloc);
    }
    value.AddMember("positions", positions, alloc);

    if (include_image && record.image && !record.image->empty()) {
        value.AddMember("image_png_base64",
                        string_value(JsonSerializer::base64_encode(record.image->to_png())), alloc);
    }

    doc_->PushBack(value, alloc);
}

} // namespace layout_chunker
