/**
 * \file message/EventCodec.cpp
 * \brief XML encoding by string assembly, decoding with libxml2.
 * \ingroup message_module
 */
#include "EventCodec.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <cctype>
#include <charconv>
#include <cmath>
#include <mutex>

namespace takclient::message {

namespace {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
struct XmlBufferDeleter {
    void operator()(xmlBuffer* buf) const { xmlBufferFree(buf); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlBufferPtr = std::unique_ptr<xmlBuffer, XmlBufferDeleter>;

void ensure_parser_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

std::string format_double(double value) {
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value);
    std::string out(buf, res.ptr);
    // Integral values keep a ".0" suffix to match the conventional 9999999.0 sentinel.
    if (std::isfinite(value) && out.find_first_of(".e") == std::string::npos) out += ".0";
    return out;
}

std::optional<std::string> attribute(xmlNode* node, const char* name) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value) return std::nullopt;
    std::string out(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return out;
}

bool parse_double(const std::optional<std::string>& text, double& out) {
    if (!text) return true; // absent keeps the default
    const char* first = text->data();
    const char* last = first + text->size();
    auto res = std::from_chars(first, last, out);
    return res.ec == std::errc{} && res.ptr == last;
}

bool parse_time(const std::optional<std::string>& text, TimePoint& out) {
    if (!text) return true;
    auto tp = parse_cot_time(*text);
    if (!tp) return false;
    out = *tp;
    return true;
}

bool is_element(xmlNode* node, const char* name) {
    return node && node->type == XML_ELEMENT_NODE &&
           xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(name)) == 0;
}

std::string dump_children(xmlDoc* doc, xmlNode* parent) {
    XmlBufferPtr buf(xmlBufferCreate());
    if (!buf) return {};
    for (xmlNode* child = parent->children; child; child = child->next) {
        xmlNodeDump(buf.get(), doc, child, 0, 0);
    }
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                       static_cast<size_t>(xmlBufferLength(buf.get())));
}

/**
 * \brief Markup between the first `<detail>` start tag and the last `</detail>`, byte for byte.
 * \details libxml2 re-serializes nodes (quote style, empty elements), so the detail
 * is sliced from the input to keep decode(encode(e)) == e. nullopt when the tags
 * cannot be located; the caller then falls back to the parsed tree.
 */
std::optional<std::string> raw_detail(std::string_view xml) {
    constexpr std::string_view open_tag = "<detail";
    size_t pos = xml.find(open_tag);
    while (pos != std::string_view::npos) {
        size_t after = pos + open_tag.size();
        if (after < xml.size() &&
            (xml[after] == '>' || xml[after] == '/' || std::isspace(static_cast<unsigned char>(xml[after])))) {
            break;
        }
        pos = xml.find(open_tag, after);
    }
    if (pos == std::string_view::npos) return std::nullopt;
    size_t tag_end = xml.find('>', pos);
    if (tag_end == std::string_view::npos) return std::nullopt;
    if (xml[tag_end - 1] == '/') return std::string{};
    size_t close = xml.rfind("</detail");
    if (close == std::string_view::npos || close <= tag_end) return std::nullopt;
    return std::string(xml.substr(tag_end + 1, close - tag_end - 1));
}

} // namespace

EventCodec::EventCodec(std::shared_ptr<Logger> logger, TakProtoVariant variant,
                       std::shared_ptr<ITakPayloadCodec> payload_codec)
    : logger_(std::move(logger)), variant_(variant), payload_codec_(std::move(payload_codec)) {}

std::string EventCodec::encode_xml(const CotEvent& event) {
    std::string out;
    out.reserve(512 + event.detail.size());
    out += kXmlDeclaration;
    out += '\n';
    out += "<event version=\"" + xml_escape(event.version) + "\"";
    out += " type=\"" + xml_escape(event.type) + "\"";
    out += " uid=\"" + xml_escape(event.uid) + "\"";
    out += " how=\"" + xml_escape(event.how) + "\"";
    out += " time=\"" + format_cot_time(event.time) + "\"";
    out += " start=\"" + format_cot_time(event.start) + "\"";
    out += " stale=\"" + format_cot_time(event.stale) + "\">";
    out += "<point lat=\"" + format_double(event.point.lat) + "\"";
    out += " lon=\"" + format_double(event.point.lon) + "\"";
    out += " hae=\"" + format_double(event.point.hae) + "\"";
    out += " ce=\"" + format_double(event.point.ce) + "\"";
    out += " le=\"" + format_double(event.point.le) + "\"/>";
    if (event.detail.empty()) {
        out += "<detail/>";
    } else {
        out += "<detail>" + event.detail + "</detail>";
    }
    out += "</event>";
    return out;
}

std::optional<CotEvent> EventCodec::decode_xml(std::string_view xml) {
    ensure_parser_initialized();
    XmlDocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
                                XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) return std::nullopt;

    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!is_element(root, "event")) return std::nullopt;

    CotEvent event;
    auto uid = attribute(root, "uid");
    auto type = attribute(root, "type");
    if (!uid || !type) return std::nullopt;
    event.uid = *uid;
    event.type = *type;
    if (auto v = attribute(root, "version")) event.version = *v;
    if (auto h = attribute(root, "how")) event.how = *h;
    if (!parse_time(attribute(root, "time"), event.time) ||
        !parse_time(attribute(root, "start"), event.start) ||
        !parse_time(attribute(root, "stale"), event.stale)) {
        return std::nullopt;
    }

    for (xmlNode* child = root->children; child; child = child->next) {
        if (is_element(child, "point")) {
            if (!parse_double(attribute(child, "lat"), event.point.lat) ||
                !parse_double(attribute(child, "lon"), event.point.lon) ||
                !parse_double(attribute(child, "hae"), event.point.hae) ||
                !parse_double(attribute(child, "ce"), event.point.ce) ||
                !parse_double(attribute(child, "le"), event.point.le)) {
                return std::nullopt;
            }
        } else if (is_element(child, "detail")) {
            auto raw = raw_detail(xml);
            event.detail = raw ? std::move(*raw) : dump_children(doc.get(), child);
        }
    }
    return event;
}

std::string EventCodec::encode(const CotEvent& event, int version) {
    if (version == 1) {
        if (payload_codec_) {
            return TakProtocol::frame(payload_codec_->encode(event), variant_);
        }
        if (!fallback_warned_) {
            fallback_warned_ = true;
            if (logger_) logger_->warning("TAK protocol 1 requested but no payload codec is installed; sending protocol 0 XML");
        }
    }
    return encode_xml(event);
}

std::string EventCodec::encode(const DecodedFrame& frame, int version) {
    if (const auto* raw = std::get_if<RawFrame>(&frame)) return raw->bytes;
    return encode(std::get<CotEvent>(frame), version);
}

DecodedFrame EventCodec::decode(std::string_view bytes, int version) const {
    if (TakProtocol::starts_with_magic(bytes)) {
        if (!payload_codec_) return RawFrame{std::string(bytes)};
        size_t header_len = 0;
        size_t payload_len = 0;
        if (TakProtocol::unframe(bytes, variant_, header_len, payload_len) != TakProtocol::Status::Complete) {
            if (logger_) logger_->debug("Malformed TAK protocol 1 header (" + std::to_string(bytes.size()) + " bytes)");
            return RawFrame{std::string(bytes)};
        }
        if (auto event = payload_codec_->decode(bytes.substr(header_len, payload_len))) return *event;
        return RawFrame{std::string(bytes)};
    }

    if (version == 1 && logger_) logger_->debug("Received protocol 0 frame on a protocol 1 session");
    if (auto event = decode_xml(bytes)) return *event;
    return RawFrame{std::string(bytes)};
}

} // namespace takclient::message
