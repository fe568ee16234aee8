#pragma once

#include "layout_chunker/document_chunker.h"
#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/prettywriter.h>
#include <string>
#include <memory>

namespace layout_chunker {

using JsonDocument = rapidjson::Document;
using JsonValue = rapidjson::Value;
using JsonAllocator = rapidjson::MemoryPoolAllocator<>;

// Builds the bulk record array with rapidjson; same layout as
// JsonSerializer::records_to_json without the nlohmann DOM overhead
class JsonBuilder {
public:
    JsonBuilder() : doc_(std::make_unique<JsonDocument>()) {
        doc_->SetArray();
    }

    JsonDocument* document() { return doc_.get(); }
    JsonAllocator& allocator() { return doc_->GetAllocator(); }

    void add_record(const IndexRecord& record, bool include_image = true);

    size_t size() const { return doc_->Size(); }

    std::string serialize(bool pretty = false) const {
        rapidjson::StringBuffer buffer;

        if (pretty) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            doc_->Accept(writer);
        }

        return std::string(buffer.GetString(), buffer.GetSize());
    }

private:
    JsonValue string_value(const std::string& value) {
        return JsonValue(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), allocator());
    }

    std::unique_ptr<JsonDocument> doc_;
};

} // namespace layout_chunker
