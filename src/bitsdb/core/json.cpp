#include "bitsdb/core/json.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace bitsdb {
namespace core {

Result<std::string> normalize_json_object(const std::string& text, const std::string& what) {
    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError()) {
        return Result<std::string>::error(
            what + " is not valid JSON: " + rapidjson::GetParseError_En(doc.GetParseError()) +
                " at offset " + std::to_string(doc.GetErrorOffset()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<std::string>::error(what + " must be a JSON object",
                                          Error::Code::INVALID_ARGUMENT);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return Result<std::string>(std::string(buffer.GetString(), buffer.GetSize()));
}

std::string labels_to_json(const Labels& labels) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    // Labels::Map is ordered, so keys come out sorted
    for (const auto& [name, value] : labels.map()) {
        doc.AddMember(rapidjson::Value(name.c_str(), allocator).Move(),
                      rapidjson::Value(value.c_str(), allocator).Move(),
                      allocator);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

} // namespace core
} // namespace bitsdb
