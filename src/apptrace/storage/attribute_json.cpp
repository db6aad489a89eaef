#include "apptrace/storage/attribute_json.h"
#include "apptrace/core/error.h"

#include <cmath>
#include <type_traits>

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace apptrace {
namespace storage {

namespace {

template<typename Writer>
void WriteValue(Writer& writer, const core::AttributeValue& value) {
    std::visit([&writer](const auto& v) {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            writer.String(v.c_str(), static_cast<rapidjson::SizeType>(v.size()));
        } else if constexpr (std::is_same_v<V, bool>) {
            writer.Bool(v);
        } else if constexpr (std::is_same_v<V, int64_t>) {
            writer.Int64(v);
        } else if constexpr (std::is_same_v<V, double>) {
            if (std::isfinite(v)) {
                writer.Double(v);
            } else {
                auto text = core::AttributeToString(v);
                writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
            }
        } else {
            auto hex = core::HexEncode(v);
            writer.String(hex.c_str(), static_cast<rapidjson::SizeType>(hex.size()));
        }
    }, value);
}

std::string ToJsonText(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

std::string SerializeAttributes(const core::Attributes& attributes) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    for (const auto& [key, value] : attributes) {
        writer.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        WriteValue(writer, value);
    }
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

core::Attributes ParseAttributes(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        throw core::InvalidArgumentError(std::string("Invalid attribute JSON: ") +
                                         rapidjson::GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw core::InvalidArgumentError("Attribute JSON must be an object");
    }

    core::Attributes attributes;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        const auto& value = it->value;
        if (value.IsString()) {
            attributes[key] = std::string(value.GetString(), value.GetStringLength());
        } else if (value.IsBool()) {
            attributes[key] = value.GetBool();
        } else if (value.IsInt64()) {
            attributes[key] = static_cast<int64_t>(value.GetInt64());
        } else if (value.IsNumber()) {
            attributes[key] = value.GetDouble();
        } else if (value.IsNull()) {
            attributes[key] = std::string();
        } else {
            attributes[key] = ToJsonText(value);
        }
    }
    return attributes;
}

rapidjson::Value AttributesToJson(const core::Attributes& attributes,
                                  rapidjson::Document::AllocatorType& allocator) {
    rapidjson::Value object(rapidjson::kObjectType);
    for (const auto& [key, value] : attributes) {
        rapidjson::Value json_key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), allocator);
        rapidjson::Value json_value;
        std::visit([&json_value, &allocator](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<V, std::string>) {
                json_value.SetString(v.c_str(), static_cast<rapidjson::SizeType>(v.size()), allocator);
            } else if constexpr (std::is_same_v<V, bool>) {
                json_value.SetBool(v);
            } else if constexpr (std::is_same_v<V, int64_t>) {
                json_value.SetInt64(v);
            } else if constexpr (std::is_same_v<V, double>) {
                if (std::isfinite(v)) {
                    json_value.SetDouble(v);
                } else {
                    auto text = core::AttributeToString(v);
                    json_value.SetString(text.c_str(), static_cast<rapidjson::SizeType>(text.size()), allocator);
                }
            } else {
                auto hex = core::HexEncode(v);
                json_value.SetString(hex.c_str(), static_cast<rapidjson::SizeType>(hex.size()), allocator);
            }
        }, value);
        object.AddMember(json_key, json_value, allocator);
    }
    return object;
}

} // namespace storage
} // namespace apptrace
