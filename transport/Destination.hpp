/**
 * \file transport/Destination.hpp
 * \brief Parsed CoT destination descriptor (`scheme://host:port`).
 * \ingroup socket_backend
 */
#pragma once

#include <string>

namespace takclient::transport {

/** \brief Base transport scheme; `ssl` parses as `Tls`. */
enum class Scheme { Tcp, Tls, Udp, Log, File };

const char* to_string(Scheme scheme);

/**
 * \brief Immutable destination descriptor.
 * \details Grammar: `scheme:host:port` or `scheme://host:port`, where scheme is one of
 * `tcp`, `tls`, `ssl`, `udp` (with optional `+broadcast`, `+multicast`, `+wo` modifiers),
 * `log` (host `stdout` or `stderr`, no port) and `file` (path).
 */
class Destination {
public:
    /**
     * \brief Parse a destination URL.
     * \throws UnsupportedScheme for a missing or unknown scheme or modifier.
     * \throws AddressError for a missing host or malformed port.
     */
    static Destination parse(const std::string& url);

    Scheme scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    /** \brief Output path for the `file` scheme. */
    const std::string& path() const { return path_; }
    bool broadcast() const { return broadcast_; }
    bool write_only() const { return write_only_; }
    /** \brief True if `+multicast` was given or the host is a multicast IP literal. */
    bool multicast() const;
    /** \brief Canonical `scheme://host:port` form. */
    std::string to_string() const;

    /** \brief True if `host` is an IPv4 (224.0.0.0/4) or IPv6 (ff00::/8) multicast literal. */
    static bool is_multicast_address(const std::string& host);

private:
    Destination() = default;

    Scheme scheme_{Scheme::Udp};
    std::string host_;
    int port_{0};
    std::string path_;
    bool broadcast_{false};
    bool multicast_modifier_{false};
    bool write_only_{false};
};

} // namespace takclient::transport
