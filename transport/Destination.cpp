/**
 * \file transport/Destination.cpp
 * \brief Destination URL parsing.
 * \ingroup socket_backend
 */
#include "Destination.hpp"
#include "common/Errors.hpp"
#include "config/Config.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cstring>
#include <vector>

namespace takclient::transport {

const char* to_string(Scheme scheme) {
    switch (scheme) {
        case Scheme::Tcp:  return "tcp";
        case Scheme::Tls:  return "tls";
        case Scheme::Udp:  return "udp";
        case Scheme::Log:  return "log";
        case Scheme::File: return "file";
    }
    return "unknown";
}

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

int parse_port(const std::string& text, const std::string& url) {
    if (text.empty() || text.size() > 5) throw AddressError("Invalid port in '" + url + "'");
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw AddressError("Invalid port in '" + url + "'");
    }
    int port = std::stoi(text);
    if (port < 1 || port > 65535) throw AddressError("Port out of range in '" + url + "'");
    return port;
}

} // namespace

Destination Destination::parse(const std::string& url) {
    std::string scheme_text;
    std::string rest;
    if (auto pos = url.find("://"); pos != std::string::npos) {
        scheme_text = url.substr(0, pos);
        rest = url.substr(pos + 3);
    } else if (auto colon = url.find(':'); colon != std::string::npos) {
        scheme_text = url.substr(0, colon);
        rest = url.substr(colon + 1);
    } else {
        throw UnsupportedScheme("Missing scheme in destination '" + url + "' (expected e.g. tcp://host:port)");
    }

    auto parts = split(lower(scheme_text), '+');
    Destination d;
    const auto& base = parts.front();
    if (base == "tcp") d.scheme_ = Scheme::Tcp;
    else if (base == "tls" || base == "ssl") d.scheme_ = Scheme::Tls;
    else if (base == "udp") d.scheme_ = Scheme::Udp;
    else if (base == "log") d.scheme_ = Scheme::Log;
    else if (base == "file") d.scheme_ = Scheme::File;
    else throw UnsupportedScheme("Unsupported scheme '" + scheme_text + "' in '" + url + "'");

    for (size_t i = 1; i < parts.size(); ++i) {
        const auto& mod = parts[i];
        if (d.scheme_ != Scheme::Udp) {
            throw UnsupportedScheme("Modifier '+" + mod + "' is only valid for udp in '" + url + "'");
        }
        if (mod == "broadcast") d.broadcast_ = true;
        else if (mod == "multicast") d.multicast_modifier_ = true;
        else if (mod == "wo") d.write_only_ = true;
        else throw UnsupportedScheme("Unsupported scheme modifier '+" + mod + "' in '" + url + "'");
    }

    if (d.scheme_ == Scheme::Log) {
        auto host = lower(rest);
        while (!host.empty() && host.back() == '/') host.pop_back();
        if (host.empty()) host = "stdout";
        if (host != "stdout" && host != "stderr") {
            throw AddressError("log destination must be stdout or stderr, got '" + rest + "'");
        }
        d.host_ = host;
        return d;
    }

    if (d.scheme_ == Scheme::File) {
        if (rest.empty()) throw AddressError("Missing path in '" + url + "'");
        d.path_ = rest;
        return d;
    }

    // Drop any trailing path component; CoT endpoints are host:port only.
    if (auto slash = rest.find('/'); slash != std::string::npos) rest.resize(slash);

    std::string port_text;
    if (!rest.empty() && rest.front() == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) throw AddressError("Unterminated IPv6 literal in '" + url + "'");
        d.host_ = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') throw AddressError("Malformed host in '" + url + "'");
            port_text = rest.substr(close + 2);
        }
    } else if (auto colon = rest.find(':'); colon != std::string::npos) {
        d.host_ = rest.substr(0, colon);
        port_text = rest.substr(colon + 1);
    } else {
        d.host_ = rest;
    }

    if (d.host_.empty()) throw AddressError("Missing host in '" + url + "'");

    if (!port_text.empty()) {
        d.port_ = parse_port(port_text, url);
    } else if (d.broadcast_ || d.multicast_modifier_) {
        d.port_ = config::defaults::BroadcastPort;
    } else {
        d.port_ = config::defaults::CotPort;
    }
    return d;
}

bool Destination::multicast() const {
    return multicast_modifier_ || (scheme_ == Scheme::Udp && is_multicast_address(host_));
}

bool Destination::is_multicast_address(const std::string& host) {
    in_addr v4{};
    if (::inet_pton(AF_INET, host.c_str(), &v4) == 1) {
        return (ntohl(v4.s_addr) & 0xF0000000u) == 0xE0000000u;
    }
    in6_addr v6{};
    if (::inet_pton(AF_INET6, host.c_str(), &v6) == 1) {
        return v6.s6_addr[0] == 0xff;
    }
    return false;
}

std::string Destination::to_string() const {
    std::string s = transport::to_string(scheme_);
    if (broadcast_) s += "+broadcast";
    if (multicast_modifier_) s += "+multicast";
    if (write_only_) s += "+wo";
    s += "://";
    switch (scheme_) {
        case Scheme::Log:
            return s + host_;
        case Scheme::File:
            return s + path_;
        default:
            break;
    }
    if (host_.find(':') != std::string::npos) s += "[" + host_ + "]";
    else s += host_;
    return s + ":" + std::to_string(port_);
}

} // namespace takclient::transport
