/**
 * \file client/ClientOptions.cpp
 * \brief Implementation of tak-client CLI and configuration option helpers.
 */

#include "ClientOptions.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

namespace takclient::client::client_opts {

namespace keys = config::keys;

/// Transport keys supplied by the JSON `"tak"` object.
static std::map<std::string, std::string> g_json_settings;
/// Cached CLI overrides for the dedicated options.
static std::optional<std::string> g_cot_url;
static std::optional<std::string> g_pref_package;
static std::optional<int> g_tak_proto;
static bool g_no_hello{false};
static bool g_debug{false};
/// Repeated `--set KEY=VALUE` arguments.
static std::vector<std::string> g_overrides;
/// Beacon settings (JSON `"client"` object, then CLI).
static ClientOptions g_client;

std::optional<std::string> get_cot_url() { return g_cot_url; }
std::optional<std::string> get_pref_package() { return g_pref_package; }
std::optional<int> get_tak_proto() { return g_tak_proto; }
const std::vector<std::string>& get_overrides() { return g_overrides; }
ClientOptions get_client_options() { return g_client; }

std::optional<std::string> system_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

const std::vector<std::string>& known_keys() {
    static const std::vector<std::string> k = {
        keys::CotUrl, keys::TakProto, keys::CotStale, keys::CotHostId, keys::Pacing, keys::Sleep,
        keys::FtsCompat, keys::MulticastTtl, keys::MulticastLocalAddr, keys::IpFamily,
        keys::TlsClientCert, keys::TlsClientKey, keys::TlsClientCaFile, keys::TlsClientCiphers,
        keys::TlsClientPassword, keys::TlsClientKeyPassword, keys::TlsCaPassword, keys::TlsExpectedHostname,
        keys::TlsDontVerify, keys::TlsDontCheckHostname, keys::MaxInQueue, keys::MaxOutQueue,
        keys::MaxFrameBytes, keys::PrefPackage, keys::NoHello, keys::Debug,
    };
    return k;
}

namespace {

std::string json_scalar(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

std::string override_check(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) return "expected KEY=VALUE, got '" + text + "'";
    return {};
}

} // namespace

config::Config build_config(const EnvLookup& env) {
    config::Config cfg(g_json_settings);

    for (const auto& key : known_keys()) {
        if (auto value = env(key)) cfg.set(key, *value);
    }

    if (g_cot_url) cfg.set(keys::CotUrl, *g_cot_url);
    if (g_pref_package) cfg.set(keys::PrefPackage, *g_pref_package);
    if (g_tak_proto) cfg.set(keys::TakProto, std::to_string(*g_tak_proto));
    if (g_no_hello) cfg.set(keys::NoHello, "true");
    if (g_debug) cfg.set(keys::Debug, "true");
    for (const auto& item : g_overrides) {
        auto eq = item.find('=');
        cfg.set(item.substr(0, eq), item.substr(eq + 1));
    }

    if (cfg.get_or(keys::CotHostId, "").empty()) {
        cfg.set(keys::CotHostId, ProcessUtils::default_host_id());
    }
    return cfg;
}

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        // Reset cached values so repeated parses start clean.
        g_json_settings.clear();
        g_cot_url.reset();
        g_pref_package.reset();
        g_tak_proto.reset();
        g_no_hello = false;
        g_debug = false;
        g_overrides.clear();
        g_client = ClientOptions{};

        if (j.contains("tak") && j["tak"].is_object()) {
            for (const auto& [key, value] : j["tak"].items()) {
                if (value.is_null() || value.is_object() || value.is_array()) continue;
                g_json_settings[key] = json_scalar(value);
            }
        }
        if (j.contains("client") && j["client"].is_object()) {
            const auto& c = j["client"];
            if (c.contains("beacon_interval") && c["beacon_interval"].is_number()) {
                g_client.beacon_interval_s = c["beacon_interval"].get<double>();
            }
            if (c.contains("callsign") && c["callsign"].is_string()) g_client.callsign = c["callsign"].get<std::string>();
            if (c.contains("lat") && c["lat"].is_number()) g_client.lat = c["lat"].get<double>();
            if (c.contains("lon") && c["lon"].is_number()) g_client.lon = c["lon"].get<double>();
        }

        app.add_option("-u,--cot-url", g_cot_url, "Destination, e.g. tcp://host:8087, tls://host:8089, udp+wo://239.2.3.1:6969")
            ->group("Connection");
        app.add_option("-p,--pref-package", g_pref_package, "Preference package (.zip) to import")
            ->check(CLI::ExistingFile)
            ->group("Connection");
        app.add_option("--tak-proto", g_tak_proto, "Wire protocol: 0 (XML) or 1 (TAK protocol)")
            ->check(CLI::IsMember({0, 1}))
            ->group("Connection");
        app.add_flag("--no-hello", g_no_hello, "Do not send the hello event on connect")
            ->group("Connection");
        app.add_option("--set", g_overrides, "Set any configuration key (repeatable)")
            ->type_name("KEY=VALUE")
            ->check(CLI::Validator(override_check, "KEY=VALUE"))
            ->group("Connection");

        app.add_flag("-d,--debug", g_debug, "Enable debug logging")
            ->group("General");

        app.add_option("--beacon-interval", g_client.beacon_interval_s,
                       "Send a position event every N seconds (0 disables)")
            ->check(CLI::NonNegativeNumber)
            ->capture_default_str()
            ->group("Beacon");
        app.add_option("--callsign", g_client.callsign, "Beacon callsign")
            ->group("Beacon");
        app.add_option("--lat", g_client.lat, "Beacon latitude")
            ->check(CLI::Range(-90.0, 90.0))
            ->group("Beacon");
        app.add_option("--lon", g_client.lon, "Beacon longitude")
            ->check(CLI::Range(-180.0, 180.0))
            ->group("Beacon");
    });
}

} // namespace takclient::client::client_opts

namespace {
    struct ClientOptsAutoReg {
        ClientOptsAutoReg() { takclient::client::client_opts::register_options(); }
    } client_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
