#include "CotEvent.hpp"

#include <gtest/gtest.h>

using namespace takclient::message;
using namespace std::chrono;

TEST(CotTime, FormatsWithMicrosecondsAndZulu) {
    TimePoint tp = TimePoint{seconds{1700000000}} + microseconds{42};
    EXPECT_EQ(format_cot_time(tp), "2023-11-14T22:13:20.000042Z");
}

TEST(CotTime, ParseAcceptsShortAndLongFractions) {
    auto base = TimePoint{seconds{1700000000}};
    EXPECT_EQ(parse_cot_time("2023-11-14T22:13:20Z"), base);
    EXPECT_EQ(parse_cot_time("2023-11-14T22:13:20.5Z"), base + milliseconds{500});
    EXPECT_EQ(parse_cot_time("2023-11-14T22:13:20.123456789Z"), base + microseconds{123456});
}

TEST(CotTime, ParseRejectsMalformed) {
    EXPECT_FALSE(parse_cot_time("2023-11-14 22:13:20Z"));
    EXPECT_FALSE(parse_cot_time("2023-11-14T22:13:20"));
    EXPECT_FALSE(parse_cot_time("2023-13-14T22:13:20Z"));
    EXPECT_FALSE(parse_cot_time("2023-11-14T22:13:20.Z"));
    EXPECT_FALSE(parse_cot_time(""));
}

TEST(CotTime, OffsetMovesForward) {
    auto later = parse_cot_time(cot_time(seconds{60}));
    ASSERT_TRUE(later);
    auto delta = *later - now();
    EXPECT_GT(delta, seconds{55});
    EXPECT_LE(delta, seconds{60});
}

TEST(CotEventHelpers, MakeEventSetsTimeTriad) {
    auto ev = make_event("a-f-G", "unit-1", seconds{120}, CotPoint{1.5, 2.5}, "ALPHA");
    EXPECT_EQ(ev.time, ev.start);
    EXPECT_EQ(ev.stale - ev.time, seconds{120});
    EXPECT_EQ(ev.point.lat, 1.5);
    EXPECT_EQ(ev.point.hae, kUnknownValue);
    EXPECT_EQ(ev.detail, "<_flow-tags_ " + flow_tag_name() + "=\"" + format_cot_time(ev.time) +
                             "\"/><contact callsign=\"ALPHA\"/>");
}

TEST(CotEventHelpers, EveryGeneratedEventCarriesFlowTag) {
    auto name = flow_tag_name();
    EXPECT_EQ(name.rfind("takclient-", 0), 0u) << name;
    EXPECT_EQ(name.find('@'), std::string::npos);

    auto ev = make_event("a-f-G", "unit-2", seconds{60});
    EXPECT_EQ(ev.detail, "<_flow-tags_ " + name + "=\"" + format_cot_time(ev.time) + "\"/>");
    EXPECT_EQ(hello_event().detail.rfind("<_flow-tags_ " + name + "=\"", 0), 0u);
}

TEST(CotEventHelpers, HelloDefaultsToTakPing) {
    auto ev = hello_event();
    EXPECT_EQ(ev.uid, "takPing");
    EXPECT_EQ(ev.type, "t-x-d-d");
    EXPECT_EQ(ev.stale - ev.time, seconds{120});
    EXPECT_EQ(hello_event("").uid, "takPing");
    EXPECT_EQ(hello_event("takclient@host").uid, "takclient@host");
}

TEST(CotEventHelpers, PongStaysForAnHour) {
    auto ev = pong_event();
    EXPECT_EQ(ev.uid, "takPong");
    EXPECT_EQ(ev.stale - ev.time, seconds{3600});
}

TEST(CotEventHelpers, DeleteCarriesForceDeleteLink) {
    auto ev = delete_event("a<b");
    EXPECT_EQ(ev.how, "h-g-i-g-o");
    EXPECT_EQ(ev.type, "t-x-d-d");
    EXPECT_EQ(ev.detail, "<link uid=\"a&lt;b\" relation=\"none\" type=\"none\"/><__forcedelete/>");
}

TEST(CotEventHelpers, EscapesAllMarkup) {
    EXPECT_EQ(xml_escape(R"(<a href="x">&'</a>)"), "&lt;a href=&quot;x&quot;&gt;&amp;&apos;&lt;/a&gt;");
}
