/**
 * \file message/TakProtocol.cpp
 * \brief Varint and header handling for TAK protocol version 1.
 * \ingroup message_module
 */
#include "TakProtocol.hpp"

namespace takclient::message {

std::string TakProtocol::encode_varint(std::uint64_t value) {
    std::string out;
    do {
        std::uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value) byte |= 0x80;
        out.push_back(static_cast<char>(byte));
    } while (value);
    return out;
}

TakProtocol::Status TakProtocol::decode_varint(std::string_view bytes, size_t& pos, std::uint64_t& value) {
    std::uint64_t result = 0;
    for (size_t i = 0; i < kMaxVarintBytes; ++i) {
        if (pos + i >= bytes.size()) return Status::Incomplete;
        auto byte = static_cast<std::uint8_t>(bytes[pos + i]);
        result |= static_cast<std::uint64_t>(byte & 0x7f) << (7 * i);
        if (!(byte & 0x80)) {
            value = result;
            pos += i + 1;
            return Status::Complete;
        }
    }
    return Status::Invalid;
}

std::string TakProtocol::frame(std::string_view payload, TakProtoVariant variant) {
    std::string out;
    out.push_back(static_cast<char>(kMagic));
    if (variant == TakProtoVariant::Mesh) {
        out.push_back(static_cast<char>(kMeshVersion));
        out.push_back(static_cast<char>(kMagic));
    } else {
        out += encode_varint(payload.size());
    }
    out.append(payload.data(), payload.size());
    return out;
}

TakProtocol::Status TakProtocol::unframe(std::string_view bytes, TakProtoVariant variant, size_t& header_len,
                                         size_t& payload_len) {
    if (bytes.empty()) return Status::Incomplete;
    if (!starts_with_magic(bytes)) return Status::Invalid;

    if (variant == TakProtoVariant::Mesh) {
        if (bytes.size() < 3) return Status::Incomplete;
        if (static_cast<std::uint8_t>(bytes[2]) != kMagic) return Status::Invalid;
        header_len = 3;
        payload_len = bytes.size() - 3;
        return Status::Complete;
    }

    size_t pos = 1;
    std::uint64_t length = 0;
    auto st = decode_varint(bytes, pos, length);
    if (st != Status::Complete) return st;
    header_len = pos;
    payload_len = static_cast<size_t>(length);
    if (bytes.size() - pos < length) return Status::Incomplete;
    return Status::Complete;
}

} // namespace takclient::message
