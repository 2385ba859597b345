#include "payload_codec.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace shadowsync {

std::optional<payload_format> parse_content_type(std::string_view content_type) {
    auto semi = content_type.find(';');
    if (semi != std::string_view::npos) content_type = content_type.substr(0, semi);
    while (!content_type.empty() && std::isspace(static_cast<unsigned char>(content_type.back()))) {
        content_type.remove_suffix(1);
    }

    std::string ct(content_type);
    std::transform(ct.begin(), ct.end(), ct.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ct.empty() || ct == "application/json") return payload_format::json;
    if (ct == "application/msgpack" || ct == "application/x-msgpack") return payload_format::msgpack;
    if (ct == "application/cbor")          return payload_format::cbor;
    if (ct == "application/x-flexbuffers") return payload_format::flexbuffers;
    if (ct == "application/x-zera")        return payload_format::zera;
    return std::nullopt;
}

nlohmann::json decode_payload(std::string_view content_type, std::span<const char> body) {
    auto format = parse_content_type(content_type);
    if (!format) {
        throw malformed_message_error("unsupported content type '" + std::string(content_type) + "'");
    }
    if (body.empty()) {
        throw malformed_message_error("empty payload");
    }

    try {
        if (*format == payload_format::json) {
            return nlohmann::json::parse(body.begin(), body.end());
        }

        auto bytes = std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(body.data()), body.size());

        switch (*format) {
            case payload_format::msgpack: {
                zerialize::MsgPack::Deserializer reader(bytes);
                return to_json_value(reader);
            }
            case payload_format::cbor: {
                zerialize::CBOR::Deserializer reader(bytes);
                return to_json_value(reader);
            }
            case payload_format::flexbuffers: {
                zerialize::Flex::Deserializer reader(bytes);
                return to_json_value(reader);
            }
            case payload_format::zera: {
                zerialize::Zera::Deserializer reader(bytes);
                return to_json_value(reader);
            }
            case payload_format::json:
                break;
        }
    } catch (const malformed_message_error&) {
        throw;
    } catch (const std::exception& e) {
        throw malformed_message_error(std::string("decode failed: ") + e.what());
    }

    throw malformed_message_error("unsupported content type '" + std::string(content_type) + "'");
}

std::string encode_payload(payload_format format, const nlohmann::json& value) {
    switch (format) {
        case payload_format::msgpack: {
            auto bytes = nlohmann::json::to_msgpack(value);
            return std::string(bytes.begin(), bytes.end());
        }
        case payload_format::cbor: {
            auto bytes = nlohmann::json::to_cbor(value);
            return std::string(bytes.begin(), bytes.end());
        }
        case payload_format::json:
            return value.dump();
        case payload_format::flexbuffers:
        case payload_format::zera:
            break;
    }
    throw std::invalid_argument("encode_payload: format not supported for encoding");
}

} // namespace shadowsync
