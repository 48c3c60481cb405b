/**
 * \file message/CotEvent.cpp
 * \brief Time formatting and event construction helpers.
 * \ingroup message_module
 */
#include "CotEvent.hpp"
#include "processUtils.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace takclient::message {

TimePoint now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string format_cot_time(TimePoint tp) {
    using namespace std::chrono;
    auto secs = floor<seconds>(tp);
    auto micros = duration_cast<microseconds>(tp - secs).count();
    std::time_t t = system_clock::to_time_t(time_point_cast<system_clock::duration>(secs));
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<long long>(micros));
    return buf;
}

namespace {

bool read_int(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    auto first = text.data() + pos;
    auto [ptr, ec] = std::from_chars(first, first + len, out);
    return ec == std::errc{} && ptr == first + len;
}

} // namespace

std::optional<TimePoint> parse_cot_time(std::string_view text) {
    int year, month, day, hour, minute, second;
    if (text.size() < 20) return std::nullopt;
    if (!read_int(text, 0, 4, year) || text[4] != '-' || !read_int(text, 5, 2, month) || text[7] != '-' ||
        !read_int(text, 8, 2, day) || text[10] != 'T' || !read_int(text, 11, 2, hour) || text[13] != ':' ||
        !read_int(text, 14, 2, minute) || text[16] != ':' || !read_int(text, 17, 2, second)) {
        return std::nullopt;
    }
    long long micros = 0;
    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        while (digits++ < 6) micros *= 10;
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    std::time_t t = ::timegm(&tm);
    return TimePoint{std::chrono::seconds{t}} + std::chrono::microseconds{micros};
}

std::string cot_time(std::chrono::seconds offset) {
    return format_cot_time(now() + offset);
}

std::string flow_tag_name() {
    auto name = ProcessUtils::default_host_id();
    // Attribute names allow letters, digits, '-', '_' and '.' only.
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') c = '-';
    }
    return name;
}

CotEvent make_event(std::string type, std::string uid, std::chrono::seconds stale_after, CotPoint point,
                    const std::string& callsign) {
    CotEvent ev;
    ev.type = std::move(type);
    ev.uid = std::move(uid);
    ev.time = now();
    ev.start = ev.time;
    ev.stale = ev.time + stale_after;
    ev.point = point;
    ev.detail = "<_flow-tags_ " + flow_tag_name() + "=\"" + format_cot_time(ev.time) + "\"/>";
    if (!callsign.empty()) {
        ev.detail += "<contact callsign=\"" + xml_escape(callsign) + "\"/>";
    }
    return ev;
}

CotEvent hello_event(const std::string& uid) {
    return make_event("t-x-d-d", uid.empty() ? std::string("takPing") : uid, std::chrono::seconds{120});
}

CotEvent pong_event() {
    return make_event("t-x-d-d", "takPong", std::chrono::seconds{3600});
}

CotEvent delete_event(const std::string& uid, std::chrono::seconds stale_after) {
    auto ev = make_event("t-x-d-d", uid, stale_after);
    ev.how = "h-g-i-g-o";
    ev.detail = "<link uid=\"" + xml_escape(uid) + "\" relation=\"none\" type=\"none\"/><__forcedelete/>";
    return ev;
}

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

} // namespace takclient::message
