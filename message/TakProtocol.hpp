/**
 * \file message/TakProtocol.hpp
 * \brief TAK protocol version 1 framing (mesh and stream headers).
 * \ingroup message_module
 * \details Version 1 frames start with the magic byte 0xbf. Mesh frames (multicast)
 * carry the fixed header `bf 01 bf`; stream frames (TCP/TLS/unicast) carry
 * `bf <varint payload length>`. The payload itself is an opaque message handled
 * by an installed \ref ITakPayloadCodec.
 */
#pragma once

#include "CotEvent.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace takclient::message {

enum class TakProtoVariant { Mesh, Stream };

inline const char* to_string(TakProtoVariant v) { return v == TakProtoVariant::Mesh ? "mesh" : "stream"; }

/** \brief Payload conversion for protocol version 1 (e.g. a protobuf TakMessage codec). */
class ITakPayloadCodec {
public:
    virtual ~ITakPayloadCodec() = default;
    /** \brief Serialize `event` to a header-less payload. */
    virtual std::string encode(const CotEvent& event) = 0;
    /** \brief Parse a header-less payload; nullopt if it is not a CoT message. */
    virtual std::optional<CotEvent> decode(std::string_view payload) = 0;
};

class TakProtocol {
public:
    static constexpr std::uint8_t kMagic = 0xbf;
    static constexpr std::uint8_t kMeshVersion = 0x01;
    /** \brief Largest varint this implementation accepts (10 bytes, 64 bits). */
    static constexpr size_t kMaxVarintBytes = 10;

    enum class Status { Complete, Incomplete, Invalid };

    /** \brief Header-prefixed frame for `payload`. */
    static std::string frame(std::string_view payload, TakProtoVariant variant);

    /**
     * \brief Locate the payload in `bytes`.
     * \param header_len Out: bytes before the payload.
     * \param payload_len Out: payload size; for mesh, everything after the header.
     */
    static Status unframe(std::string_view bytes, TakProtoVariant variant, size_t& header_len, size_t& payload_len);

    static std::string encode_varint(std::uint64_t value);
    /** \brief Decode a varint at `pos`; advances `pos` on Complete. */
    static Status decode_varint(std::string_view bytes, size_t& pos, std::uint64_t& value);

    static bool starts_with_magic(std::string_view bytes) {
        return !bytes.empty() && static_cast<std::uint8_t>(bytes.front()) == kMagic;
    }
};

} // namespace takclient::message
