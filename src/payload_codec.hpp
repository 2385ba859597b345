#pragma once

#include <nlohmann/json.hpp>
#include <zerialize/zerialize.hpp>
#include <zerialize/protocols/msgpack.hpp>
#include <zerialize/protocols/cbor.hpp>
#include <zerialize/protocols/flex.hpp>
#include <zerialize/protocols/zera.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace shadowsync {

// Wire encodings accepted on inbound topics, keyed by content type.
enum class payload_format {
    json,
    msgpack,
    cbor,
    flexbuffers,
    zera
};

// "application/json" -> json, ... Parameters after ';' are ignored.
// Returns nullopt for unsupported content types.
std::optional<payload_format> parse_content_type(std::string_view content_type);

// Convert a zerialize reader into a JSON value.
template <typename Reader>
nlohmann::json to_json_value(Reader& value) {
    if (value.isMap()) {
        nlohmann::json obj = nlohmann::json::object();
        for (auto key_sv : value.mapKeys()) {
            auto child = value[key_sv];
            obj[std::string(key_sv)] = to_json_value(child);
        }
        return obj;
    }
    if (value.isArray()) {
        nlohmann::json arr = nlohmann::json::array();
        auto sz = value.arraySize();
        for (std::size_t i = 0; i < sz; ++i) {
            auto elem = value[i];
            arr.push_back(to_json_value(elem));
        }
        return arr;
    }
    if (value.isBool())   return value.asBool();
    if (value.isInt() || value.isUInt()) return value.asInt64();
    if (value.isFloat())  return value.asDouble();
    if (value.isString()) return std::string(value.asStringView());
    return nullptr;
}

// Decode a message body according to its content type.
// Throws malformed_message_error on unsupported type or undecodable bytes.
nlohmann::json decode_payload(std::string_view content_type, std::span<const char> body);

// Encode a JSON value as the given content type (json or msgpack/cbor via nlohmann).
std::string encode_payload(payload_format format, const nlohmann::json& value);

} // namespace shadowsync
