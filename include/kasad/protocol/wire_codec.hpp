/**
 * @file wire_codec.hpp
 * @brief Encoder/decoder for the smart-plug wire protocol.
 *
 * The devices speak JSON obfuscated with a running-key XOR cipher:
 * the key starts at 0xAB and, after every byte, becomes the ciphertext
 * byte just produced. Over TCP each message is preceded by a 4-byte
 * big-endian length; UDP datagrams carry the ciphertext alone.
 *
 * @code
 * JsonValue request = ...;
 * std::vector<uint8_t> frame = encode(request);    // TCP
 * JsonValue reply = decode(buffer.data(), buffer.size());
 * @endcode
 *
 * @copyright Copyright (c) 2024 kasad Contributors
 * @license MIT License
 */

#pragma once

#include "kasad/protocol/export.hpp"
#include "kasad/protocol/json_value.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace kasad {
namespace protocol {

constexpr uint8_t INITIAL_KEY = 0xAB;
constexpr size_t FRAME_HEADER_SIZE = 4;

/**
 * @enum CodecErrorKind
 * @brief Why a buffer could not be decoded.
 */
enum class CodecErrorKind {
    TRUNCATED,     ///< Fewer bytes than the header declares
    INVALID_JSON   ///< Decrypted body is not a JSON object
};

inline const char* codecErrorKindToString(CodecErrorKind kind) {
    switch (kind) {
        case CodecErrorKind::TRUNCATED: return "truncated";
        case CodecErrorKind::INVALID_JSON: return "invalid-json";
        default: return "unknown";
    }
}

class KASAD_PROTOCOL_API CodecError : public std::runtime_error {
public:
    CodecError(CodecErrorKind kind, const std::string& what)
        : std::runtime_error(what)
        , kind_(kind)
    {}

    CodecErrorKind kind() const { return kind_; }

private:
    CodecErrorKind kind_;
};

/**
 * @class XorCipher
 * @brief The self-synchronizing keystream, one byte at a time.
 *
 * Both directions advance the key to the ciphertext byte, so a decoder
 * started mid-stream with key = previous ciphertext byte stays in sync.
 */
class KASAD_PROTOCOL_API XorCipher {
public:
    explicit XorCipher(uint8_t key = INITIAL_KEY) : key_(key) {}

    uint8_t encrypt(uint8_t plain) {
        key_ = static_cast<uint8_t>(key_ ^ plain);
        return key_;
    }

    uint8_t decrypt(uint8_t cipher) {
        uint8_t plain = static_cast<uint8_t>(key_ ^ cipher);
        key_ = cipher;
        return plain;
    }

    uint8_t key() const { return key_; }

private:
    uint8_t key_;
};

KASAD_PROTOCOL_API std::vector<uint8_t> encrypt(const std::string& plaintext);
KASAD_PROTOCOL_API std::string decrypt(const uint8_t* data, size_t length);

/**
 * @brief Read the big-endian body length from a frame header.
 * @pre @p header points at FRAME_HEADER_SIZE readable bytes.
 */
KASAD_PROTOCOL_API uint32_t readFrameLength(const uint8_t* header);

/**
 * @brief Serialize, encrypt and length-prefix a payload (TCP form).
 *
 * The payload must be a JSON object, the only envelope the devices use and
 * the only one decode() accepts.
 *
 * @throws CodecError (INVALID_JSON) if the payload is not an object or
 *         cannot be printed.
 */
KASAD_PROTOCOL_API std::vector<uint8_t> encode(const JsonValue& payload);

/**
 * @brief Decode a length-prefixed frame. Bytes past the declared length are ignored.
 * @throws CodecError TRUNCATED or INVALID_JSON.
 */
KASAD_PROTOCOL_API JsonValue decode(const uint8_t* data, size_t length);
KASAD_PROTOCOL_API JsonValue decode(const std::vector<uint8_t>& frame);

/**
 * @brief Decrypt and parse a body that has already been de-framed.
 * @throws CodecError (INVALID_JSON).
 */
KASAD_PROTOCOL_API JsonValue decodeBody(const uint8_t* data, size_t length);

/// Unframed form used for UDP discovery. Same object-only rule as encode().
KASAD_PROTOCOL_API std::vector<uint8_t> encodeDatagram(const JsonValue& payload);
KASAD_PROTOCOL_API JsonValue decodeDatagram(const uint8_t* data, size_t length);

}  // namespace protocol
}  // namespace kasad
