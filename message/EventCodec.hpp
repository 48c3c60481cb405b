/**
 * \file message/EventCodec.hpp
 * \brief Encode/decode CoT events for protocol version 0 (XML) and 1 (TAK).
 * \ingroup message_module
 */
#pragma once

#include "CotEvent.hpp"
#include "TakProtocol.hpp"
#include "logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace takclient::message {

/** \brief `<?xml ... ?>` line prepended to every version 0 event. */
inline constexpr const char* kXmlDeclaration = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes" ?>)";

/**
 * \brief Stateless apart from the optional payload codec and the one-shot fallback warning.
 * \details Version 1 needs an \ref ITakPayloadCodec. Without one, \ref encode falls back
 * to version 0 (warning once) and \ref decode hands back version 1 input as a RawFrame.
 */
class EventCodec {
public:
    explicit EventCodec(std::shared_ptr<Logger> logger = nullptr,
                        TakProtoVariant variant = TakProtoVariant::Stream,
                        std::shared_ptr<ITakPayloadCodec> payload_codec = nullptr);

    void set_payload_codec(std::shared_ptr<ITakPayloadCodec> codec) { payload_codec_ = std::move(codec); }
    bool has_payload_codec() const { return payload_codec_ != nullptr; }
    TakProtoVariant variant() const { return variant_; }

    /** \brief Wire bytes for `event`; `version` is 0 or 1. */
    std::string encode(const CotEvent& event, int version);
    /** \brief As above; raw frames are written through unchanged. */
    std::string encode(const DecodedFrame& frame, int version);

    /**
     * \brief Decode one complete frame.
     * \details Input starting with the 0xbf magic is treated as version 1 whatever
     * `version` says; anything that is not a well-formed CoT event comes back as RawFrame.
     */
    DecodedFrame decode(std::string_view bytes, int version) const;

    /** \brief Declaration + newline + `<event>` element. */
    static std::string encode_xml(const CotEvent& event);
    /** \brief Parse an `<event>` document; nullopt for malformed XML or a different root. */
    static std::optional<CotEvent> decode_xml(std::string_view xml);

private:
    std::shared_ptr<Logger> logger_;
    TakProtoVariant variant_;
    std::shared_ptr<ITakPayloadCodec> payload_codec_;
    bool fallback_warned_{false};
};

} // namespace takclient::message
