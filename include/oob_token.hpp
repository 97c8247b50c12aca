#pragma once
#include <cstdint>
#include <optional>
#include <vector>

// How the frame payload carries the token
enum class WireFormat : uint8_t {
    Structured = 0, // serialized OutOfBandAssociationToken envelope
    Raw        = 1, // token bytes verbatim
};

struct OobToken {
    std::vector<uint8_t> encryption_key; // raw format: the whole payload
    std::vector<uint8_t> ihu_iv;         // structured only
    std::vector<uint8_t> mobile_iv;      // structured only
};

// Structured: nullopt if the bytes do not parse or carry no encryption key.
// Raw: nullopt only for an empty payload.
std::optional<OobToken> decode_token(const std::vector<uint8_t>& bytes, WireFormat fmt);

// Inverse of decode_token, used by the sending side. Raw drops the IVs.
std::vector<uint8_t> encode_token(const OobToken& token, WireFormat fmt);
