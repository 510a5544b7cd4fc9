/**
 * @file wire_codec.cpp
 * @brief Wire codec implementation.
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#include "kasad/protocol/wire_codec.hpp"

namespace kasad {
namespace protocol {

namespace {

// Both directions carry a JSON object; decodeBody rejects anything else
std::string printPayload(const JsonValue& payload) {
    if (payload.kind_case() != JsonValue::kStructValue) {
        throw CodecError(CodecErrorKind::INVALID_JSON, "payload is not a JSON object");
    }
    try {
        return printJson(payload);
    } catch (const std::runtime_error& e) {
        throw CodecError(CodecErrorKind::INVALID_JSON, e.what());
    }
}

}  // namespace

std::vector<uint8_t> encrypt(const std::string& plaintext) {
    std::vector<uint8_t> out;
    out.reserve(plaintext.size());

    XorCipher cipher;
    for (char c : plaintext) {
        out.push_back(cipher.encrypt(static_cast<uint8_t>(c)));
    }
    return out;
}

std::string decrypt(const uint8_t* data, size_t length) {
    std::string out;
    out.reserve(length);

    XorCipher cipher;
    for (size_t i = 0; i < length; ++i) {
        out.push_back(static_cast<char>(cipher.decrypt(data[i])));
    }
    return out;
}

uint32_t readFrameLength(const uint8_t* header) {
    return (static_cast<uint32_t>(header[0]) << 24) |
           (static_cast<uint32_t>(header[1]) << 16) |
           (static_cast<uint32_t>(header[2]) << 8) |
           static_cast<uint32_t>(header[3]);
}

std::vector<uint8_t> encode(const JsonValue& payload) {
    std::string text = printPayload(payload);
    auto length = static_cast<uint32_t>(text.size());

    std::vector<uint8_t> frame;
    frame.reserve(FRAME_HEADER_SIZE + text.size());
    frame.push_back(static_cast<uint8_t>(length >> 24));
    frame.push_back(static_cast<uint8_t>(length >> 16));
    frame.push_back(static_cast<uint8_t>(length >> 8));
    frame.push_back(static_cast<uint8_t>(length));

    XorCipher cipher;
    for (char c : text) {
        frame.push_back(cipher.encrypt(static_cast<uint8_t>(c)));
    }
    return frame;
}

JsonValue decode(const uint8_t* data, size_t length) {
    if (length < FRAME_HEADER_SIZE) {
        throw CodecError(CodecErrorKind::TRUNCATED,
                         "frame header needs 4 bytes, got " + std::to_string(length));
    }

    uint32_t declared = readFrameLength(data);
    size_t available = length - FRAME_HEADER_SIZE;
    if (available < declared) {
        throw CodecError(CodecErrorKind::TRUNCATED,
                         "frame declares " + std::to_string(declared) +
                         " bytes, got " + std::to_string(available));
    }

    return decodeBody(data + FRAME_HEADER_SIZE, declared);
}

JsonValue decode(const std::vector<uint8_t>& frame) {
    return decode(frame.data(), frame.size());
}

JsonValue decodeBody(const uint8_t* data, size_t length) {
    std::string text = decrypt(data, length);

    std::string error;
    auto value = parseJson(text, &error);
    if (!value) {
        throw CodecError(CodecErrorKind::INVALID_JSON, "body is not JSON: " + error);
    }
    if (value->kind_case() != JsonValue::kStructValue) {
        throw CodecError(CodecErrorKind::INVALID_JSON, "body is not a JSON object");
    }
    return *value;
}

std::vector<uint8_t> encodeDatagram(const JsonValue& payload) {
    return encrypt(printPayload(payload));
}

JsonValue decodeDatagram(const uint8_t* data, size_t length) {
    return decodeBody(data, length);
}

}  // namespace protocol
}  // namespace kasad
