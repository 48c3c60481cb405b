#include "EventCodec.hpp"

#include <gtest/gtest.h>

using namespace takclient::message;

namespace {

/** Toy payload codec: the payload is the uid followed by '|' and the type. */
class UidTypeCodec : public ITakPayloadCodec {
public:
    std::string encode(const CotEvent& event) override { return event.uid + "|" + event.type; }
    std::optional<CotEvent> decode(std::string_view payload) override {
        auto bar = payload.find('|');
        if (bar == std::string_view::npos) return std::nullopt;
        CotEvent ev;
        ev.uid = std::string(payload.substr(0, bar));
        ev.type = std::string(payload.substr(bar + 1));
        return ev;
    }
};

CotEvent sample() {
    auto ev = make_event("a-f-G-U-C", "unit-7", std::chrono::seconds{120}, CotPoint{37.5, -122.25, 10.0, 5.0, 2.0}, "ALPHA");
    return ev;
}

} // namespace

TEST(EventCodec, XmlStartsWithDeclaration) {
    auto xml = EventCodec::encode_xml(sample());
    std::string prefix = std::string(kXmlDeclaration) + "\n<event version=\"2.0\" type=\"a-f-G-U-C\" uid=\"unit-7\" how=\"m-g\"";
    EXPECT_EQ(xml.rfind(prefix, 0), 0u) << xml;
    EXPECT_NE(xml.find("<point lat=\"37.5\" lon=\"-122.25\" hae=\"10.0\" ce=\"5.0\" le=\"2.0\"/>"), std::string::npos) << xml;
    EXPECT_EQ(xml.substr(xml.size() - 8), "</event>");
}

TEST(EventCodec, EmptyDetailIsSelfClosing) {
    CotEvent ev;
    ev.uid = "x";
    EXPECT_NE(EventCodec::encode_xml(ev).find("<detail/>"), std::string::npos);
}

TEST(EventCodec, UnknownValueSentinelKeepsDecimal) {
    CotEvent ev;
    ev.uid = "x";
    EXPECT_NE(EventCodec::encode_xml(ev).find("hae=\"9999999.0\""), std::string::npos);
}

TEST(EventCodec, DecodeRecoversEncodedEvent) {
    auto ev = sample();
    auto decoded = EventCodec::decode_xml(EventCodec::encode_xml(ev));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, ev);
}

TEST(EventCodec, DecodeKeepsNestedDetail) {
    auto ev = delete_event("target-1");
    auto decoded = EventCodec::decode_xml(EventCodec::encode_xml(ev));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->detail, ev.detail);
    EXPECT_EQ(decoded->how, "h-g-i-g-o");
}

TEST(EventCodec, DetailMarkupIsReturnedVerbatim) {
    auto ev = sample();
    ev.detail = "<contact callsign='A'/><remarks></remarks><track course=\"90.0\" speed=\"0.0\" />";
    auto decoded = EventCodec::decode_xml(EventCodec::encode_xml(ev));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->detail, ev.detail);
    EXPECT_EQ(*decoded, ev);

    auto spaced = EventCodec::decode_xml(R"(<event uid="u" type="t"><detail ><a x='1'></a></detail></event>)");
    ASSERT_TRUE(spaced);
    EXPECT_EQ(spaced->detail, "<a x='1'></a>");
}

TEST(EventCodec, DecodeWithoutDeclarationOrPoint) {
    auto decoded = EventCodec::decode_xml(R"(<event version="2.0" uid="u" type="t-x-c-t"/>)");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->uid, "u");
    EXPECT_EQ(decoded->point.hae, kUnknownValue);
    EXPECT_TRUE(decoded->detail.empty());
}

TEST(EventCodec, NonEventInputBecomesRawFrame) {
    EventCodec codec;
    auto frame = codec.decode("<foo/>", 0);
    ASSERT_TRUE(std::holds_alternative<RawFrame>(frame));
    EXPECT_EQ(std::get<RawFrame>(frame).bytes, "<foo/>");

    EXPECT_TRUE(std::holds_alternative<RawFrame>(codec.decode("<event uid=\"x\"", 0)));
    EXPECT_TRUE(std::holds_alternative<RawFrame>(codec.decode("<event type=\"a\"/>", 0)));
    EXPECT_TRUE(std::holds_alternative<RawFrame>(
        codec.decode(R"(<event uid="x" type="a" time="yesterday"/>)", 0)));
}

TEST(EventCodec, RawFrameEncodesVerbatim) {
    EventCodec codec;
    DecodedFrame raw = RawFrame{"\x01\x02payload"};
    EXPECT_EQ(codec.encode(raw, 0), "\x01\x02payload");
    EXPECT_EQ(codec.encode(raw, 1), "\x01\x02payload");
}

TEST(EventCodec, VersionOneWithoutCodecFallsBackWithOneWarning) {
    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("codec");
    logger->add_sink(sink);
    EventCodec codec(logger);

    auto ev = sample();
    EXPECT_EQ(codec.encode(ev, 1), EventCodec::encode_xml(ev));
    EXPECT_EQ(codec.encode(ev, 1), EventCodec::encode_xml(ev));
    EXPECT_EQ(sink->get_lines(0, SIZE_MAX, LogLevel::Warning).size(), 1u);
}

TEST(EventCodec, VersionOneInputWithoutCodecIsRaw) {
    EventCodec codec;
    std::string bytes = TakProtocol::frame("abc", TakProtoVariant::Stream);
    auto frame = codec.decode(bytes, 1);
    ASSERT_TRUE(std::holds_alternative<RawFrame>(frame));
    EXPECT_EQ(std::get<RawFrame>(frame).bytes, bytes);
}

TEST(EventCodec, VersionOneStreamUsesPayloadCodec) {
    EventCodec codec(nullptr, TakProtoVariant::Stream, std::make_shared<UidTypeCodec>());
    auto bytes = codec.encode(sample(), 1);
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xbf);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), std::string("unit-7|a-f-G-U-C").size());

    auto frame = codec.decode(bytes, 1);
    ASSERT_TRUE(std::holds_alternative<CotEvent>(frame));
    EXPECT_EQ(std::get<CotEvent>(frame).uid, "unit-7");
}

TEST(EventCodec, VersionOneMeshHeader) {
    EventCodec codec(nullptr, TakProtoVariant::Mesh, std::make_shared<UidTypeCodec>());
    auto bytes = codec.encode(sample(), 1);
    EXPECT_EQ(bytes.substr(0, 3), std::string("\xbf\x01\xbf"));
    EXPECT_EQ(bytes.substr(3), "unit-7|a-f-G-U-C");
    auto frame = codec.decode(bytes, 1);
    ASSERT_TRUE(std::holds_alternative<CotEvent>(frame));
    EXPECT_EQ(std::get<CotEvent>(frame).type, "a-f-G-U-C");
}

TEST(TakProtocol, VarintBoundaries) {
    EXPECT_EQ(TakProtocol::encode_varint(0), std::string(1, '\0'));
    EXPECT_EQ(TakProtocol::encode_varint(127), "\x7f");
    EXPECT_EQ(TakProtocol::encode_varint(128), "\x80\x01");
    EXPECT_EQ(TakProtocol::encode_varint(300), "\xac\x02");

    std::string bytes = "\xac\x02rest";
    size_t pos = 0;
    std::uint64_t value = 0;
    EXPECT_EQ(TakProtocol::decode_varint(bytes, pos, value), TakProtocol::Status::Complete);
    EXPECT_EQ(value, 300u);
    EXPECT_EQ(pos, 2u);

    pos = 0;
    EXPECT_EQ(TakProtocol::decode_varint("\x80", pos, value), TakProtocol::Status::Incomplete);
    pos = 0;
    EXPECT_EQ(TakProtocol::decode_varint(std::string(11, '\xff'), pos, value), TakProtocol::Status::Invalid);
}

TEST(TakProtocol, UnframeReportsIncompleteStreamPayload) {
    auto bytes = TakProtocol::frame(std::string(200, 'x'), TakProtoVariant::Stream);
    size_t header = 0, payload = 0;
    EXPECT_EQ(TakProtocol::unframe(std::string_view(bytes).substr(0, 50), TakProtoVariant::Stream, header, payload),
              TakProtocol::Status::Incomplete);
    EXPECT_EQ(TakProtocol::unframe(bytes, TakProtoVariant::Stream, header, payload), TakProtocol::Status::Complete);
    EXPECT_EQ(header, 3u);
    EXPECT_EQ(payload, 200u);
    EXPECT_EQ(TakProtocol::unframe("<event/>", TakProtoVariant::Stream, header, payload),
              TakProtocol::Status::Invalid);
}
