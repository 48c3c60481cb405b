// CotEvent.hpp - Cursor-on-Target event model and construction helpers
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

/**
 * \defgroup message_module CoT Message Module
 * \brief Event model, XML/TAK-protocol codecs and stream framing.
 */

/**
 * \file message/CotEvent.hpp
 * \brief In-memory CoT event and the standard timestamp helpers.
 * \ingroup message_module
 */

namespace takclient::message {

/** \brief UTC time at microsecond precision (the resolution of the wire format). */
using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

/** \brief Current UTC time truncated to microseconds. */
TimePoint now();

/** \brief Format as `%Y-%m-%dT%H:%M:%S.ffffffZ`. */
std::string format_cot_time(TimePoint tp);
/** \brief Parse `YYYY-MM-DDTHH:MM:SS[.f{1,9}]Z`; digits beyond microseconds are truncated. */
std::optional<TimePoint> parse_cot_time(std::string_view text);
/** \brief `now() + offset`, formatted. */
std::string cot_time(std::chrono::seconds offset = std::chrono::seconds{0});

/** \brief Unknown-value sentinel for hae/ce/le. */
inline constexpr double kUnknownValue = 9999999.0;

struct CotPoint {
    double lat{0.0};
    double lon{0.0};
    double hae{kUnknownValue};
    double ce{kUnknownValue};
    double le{kUnknownValue};

    bool operator==(const CotPoint&) const = default;
};

/** \brief One CoT `<event>`. */
struct CotEvent {
    std::string version{"2.0"};
    std::string type{"a-u-G"};
    std::string uid;
    std::string how{"m-g"};
    TimePoint time{};
    TimePoint start{};
    TimePoint stale{};
    CotPoint point{};
    std::string detail; ///< Inner XML of `<detail>`; empty for none

    bool operator==(const CotEvent&) const = default;
};

/** \brief Bytes that did not decode into a CoT event (binary payload without a codec, foreign XML). */
struct RawFrame {
    std::string bytes;

    bool operator==(const RawFrame&) const = default;
};

/** \brief Result of decoding one wire frame; also the element type of the pipeline queues. */
using DecodedFrame = std::variant<CotEvent, RawFrame>;

/** \brief Attribute name this client stamps into `<_flow-tags_>`: `takclient-<hostname>`. */
std::string flow_tag_name();

/**
 * \brief Event with the standard time triad: time = start = now, stale = now + `stale_after`.
 * \details The detail always starts with `<_flow-tags_ takclient-<hostname>="<time>"/>`.
 * \param callsign Adds `<contact callsign=".."/>` to the detail when non-empty.
 */
CotEvent make_event(std::string type, std::string uid, std::chrono::seconds stale_after,
                    CotPoint point = {}, const std::string& callsign = {});

/** \brief Greeting sent once at session start (type `t-x-d-d`). */
CotEvent hello_event(const std::string& uid = "takPing");

/** \brief Keep-alive reply (uid `takPong`, stale one hour out). */
CotEvent pong_event();

/**
 * \brief Retracts a previously sent event by uid.
 * \details Carries only `<link uid=.. relation="none" type="none"/>` and `<__forcedelete/>`.
 */
CotEvent delete_event(const std::string& uid, std::chrono::seconds stale_after = std::chrono::seconds{20});

/** \brief Escape &, <, >, " and ' for use in attribute values and text. */
std::string xml_escape(std::string_view text);

} // namespace takclient::message
