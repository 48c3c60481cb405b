/**
 * \file config/Config.hpp
 * \brief Key/value configuration surface read by every component.
 * \details Keys follow the CoT ecosystem convention (`COT_URL`, `TAK_PROTO`, ...).
 * Values are strings; typed getters parse on access. The mapping is populated
 * once at startup (options, environment, preference package) and read-only
 * afterwards.
 */
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace takclient::config {

/** \brief Well-known configuration keys. */
namespace keys {
inline constexpr const char* CotUrl = "COT_URL";
inline constexpr const char* TakProto = "TAK_PROTO";
inline constexpr const char* CotStale = "COT_STALE";
inline constexpr const char* CotHostId = "COT_HOST_ID";
inline constexpr const char* Pacing = "TAK_PACING";
inline constexpr const char* Sleep = "TAK_SLEEP";
inline constexpr const char* FtsCompat = "FTS_COMPAT";
inline constexpr const char* MulticastTtl = "TAK_MULTICAST_TTL";
inline constexpr const char* MulticastLocalAddr = "TAK_MULTICAST_LOCAL_ADDR";
inline constexpr const char* IpFamily = "TAK_IP_FAMILY";
inline constexpr const char* TlsClientCert = "TAK_TLS_CLIENT_CERT";
inline constexpr const char* TlsClientKey = "TAK_TLS_CLIENT_KEY";
inline constexpr const char* TlsClientCaFile = "TAK_TLS_CLIENT_CAFILE";
inline constexpr const char* TlsClientCiphers = "TAK_TLS_CLIENT_CIPHERS";
inline constexpr const char* TlsClientPassword = "TAK_TLS_CLIENT_PASSWORD";
inline constexpr const char* TlsClientKeyPassword = "TAK_TLS_CLIENT_KEY_PASSWORD";
inline constexpr const char* TlsCaPassword = "TAK_TLS_CA_PASSWORD";
inline constexpr const char* TlsExpectedHostname = "TAK_TLS_SERVER_EXPECTED_HOSTNAME";
inline constexpr const char* TlsDontVerify = "TAK_TLS_DONT_VERIFY";
inline constexpr const char* TlsDontCheckHostname = "TAK_TLS_DONT_CHECK_HOSTNAME";
inline constexpr const char* MaxInQueue = "MAX_IN_QUEUE";
inline constexpr const char* MaxOutQueue = "MAX_OUT_QUEUE";
inline constexpr const char* MaxFrameBytes = "TAK_MAX_FRAME_BYTES";
inline constexpr const char* PrefPackage = "PREF_PACKAGE";
inline constexpr const char* NoHello = "TAK_NO_HELLO";
inline constexpr const char* Debug = "DEBUG";
} // namespace keys

/** \brief Built-in defaults. */
namespace defaults {
inline constexpr const char* CotUrl = "udp+wo://239.2.3.1:6969"; // ATAK default multicast
inline constexpr int CotStaleSeconds = 120;
inline constexpr int CotPort = 8087;
inline constexpr int BroadcastPort = 6969;
inline constexpr int SleepSeconds = 5;
inline constexpr int MulticastTtl = 1;
inline constexpr const char* MulticastLocalAddr = "0.0.0.0";
inline constexpr std::size_t MaxOutQueue = 100;
inline constexpr std::size_t MaxInQueue = 500;
inline constexpr std::size_t MaxFrameBytes = 1024 * 1024;
inline constexpr const char* CotValue = "9999999.0";
} // namespace defaults

/** \brief True for "true", "yes", "y", "on", "1" (case-insensitive). */
bool parse_bool(const std::string& value);

class Config {
public:
    Config() = default;
    explicit Config(std::map<std::string, std::string> values) : values_(std::move(values)) {}

    bool contains(const std::string& key) const;
    std::optional<std::string> get(const std::string& key) const;
    std::string get_or(const std::string& key, const std::string& fallback) const;
    /** \brief Boolean view; missing or empty keys yield `fallback`. */
    bool get_bool(const std::string& key, bool fallback = false) const;
    /** \brief Integer view; throws ConfigError naming the key on malformed input. */
    std::int64_t get_int(const std::string& key, std::int64_t fallback) const;
    double get_double(const std::string& key, double fallback) const;

    void set(const std::string& key, std::string value);

    /**
     * \brief Copy entries of `other` whose key is not already set here.
     * \return Number of keys filled.
     */
    std::size_t merge_missing(const Config& other);

    const std::map<std::string, std::string>& values() const { return values_; }

    /** \brief Read `KEY=VALUE` lines; `#` and `;` start comments, `[section]` lines are ignored. */
    static Config from_ini(const std::string& text);

private:
    std::map<std::string, std::string> values_;
};

} // namespace takclient::config
