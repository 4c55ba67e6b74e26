// src/attribute_codec.cpp
// JSON attribute codec

#include "sessiondb/attribute_codec.hpp"
#include <nlohmann/json.hpp>
#include <type_traits>

namespace sessiondb {

JsonAttributeCodec::JsonAttributeCodec(size_t max_payload_size)
    : max_payload_size_(max_payload_size) {}

Blob JsonAttributeCodec::encode(const Properties& attributes) const {
    nlohmann::json json_obj = nlohmann::json::object();

    for (const auto& [key, value] : attributes) {
        std::visit([&json_obj, &key](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                json_obj[key] = nullptr;
            } else {
                json_obj[key] = v;
            }
        }, value);
    }

    std::string json_str;
    try {
        json_str = json_obj.dump();
    } catch (const nlohmann::json::exception& e) {
        throw Errors::serialization_failed(e.what());
    }

    if (json_str.size() > max_payload_size_) {
        throw Errors::payload_too_large(json_str.size(), max_payload_size_);
    }
    return Blob(json_str.begin(), json_str.end());
}

Properties JsonAttributeCodec::decode(const Blob& payload) const {
    Properties properties;
    if (payload.empty()) {
        return properties;
    }
    if (payload.size() > max_payload_size_) {
        throw Errors::payload_too_large(payload.size(), max_payload_size_);
    }

    nlohmann::json json_obj;
    try {
        json_obj = nlohmann::json::parse(payload.begin(), payload.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw Errors::deserialization_failed(e.what());
    }

    if (!json_obj.is_object()) {
        throw Errors::deserialization_failed("payload is not a JSON object");
    }

    for (auto& [key, value] : json_obj.items()) {
        if (value.is_string()) {
            properties[key] = value.get<std::string>();
        } else if (value.is_boolean()) {
            properties[key] = value.get<bool>();
        } else if (value.is_number_integer()) {
            properties[key] = value.get<int64_t>();
        } else if (value.is_number_float()) {
            properties[key] = value.get<double>();
        } else if (value.is_null()) {
            properties[key] = nullptr;
        } else {
            throw Errors::deserialization_failed("unsupported value type for attribute '" + key + "'");
        }
    }
    return properties;
}

std::shared_ptr<AttributeCodec> make_default_codec() {
    return std::make_shared<JsonAttributeCodec>();
}

} // namespace sessiondb
