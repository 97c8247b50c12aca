#include "../include/oob_token.hpp"
#include <iostream>
#include <string>

#include "oob_association_token.pb.h"

static std::vector<uint8_t> to_vec(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string to_str(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

std::optional<OobToken> decode_token(const std::vector<uint8_t>& bytes, WireFormat fmt) {
    if (fmt == WireFormat::Raw) {
        if (bytes.empty()) return std::nullopt;
        OobToken t;
        t.encryption_key = bytes;
        return t;
    }

    com::google::companionprotos::OutOfBandAssociationToken msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        std::cerr << "[OobToken] " << bytes.size() << " bytes did not parse as OutOfBandAssociationToken\n";
        return std::nullopt;
    }
    if (msg.encryption_key().empty()) {
        std::cerr << "[OobToken] envelope carries no encryption key\n";
        return std::nullopt;
    }

    OobToken t;
    t.encryption_key = to_vec(msg.encryption_key());
    t.ihu_iv         = to_vec(msg.ihu_iv());
    t.mobile_iv      = to_vec(msg.mobile_iv());
    return t;
}

std::vector<uint8_t> encode_token(const OobToken& token, WireFormat fmt) {
    if (fmt == WireFormat::Raw) return token.encryption_key;

    com::google::companionprotos::OutOfBandAssociationToken msg;
    msg.set_encryption_key(to_str(token.encryption_key));
    msg.set_ihu_iv(to_str(token.ihu_iv));
    msg.set_mobile_iv(to_str(token.mobile_iv));

    std::string out;
    if (!msg.SerializeToString(&out)) {
        std::cerr << "[OobToken] could not serialize OutOfBandAssociationToken\n";
        return {};
    }
    return to_vec(out);
}
