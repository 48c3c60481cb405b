/**
 * \file client/ClientOptions.hpp
 * \brief Command-line and JSON options for the tak-client binary.
 */
#pragma once

#include "config/Config.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace takclient::client {

/** \brief Application-level settings that are not part of the transport configuration. */
struct ClientOptions {
    double beacon_interval_s{0.0};  ///< 0 disables the position beacon.
    std::string callsign;           ///< Beacon callsign; empty uses the host id.
    double lat{0.0};
    double lon{0.0};
};

} // namespace takclient::client

/** \brief Helper API for accessing tak-client CLI and config options. */
namespace takclient::client::client_opts {

/** \brief Environment lookup; returns nullopt for unset variables. */
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/** \brief `std::getenv` wrapper. */
std::optional<std::string> system_env(const std::string& name);

/** \brief Every configuration key the environment layer reads. */
const std::vector<std::string>& known_keys();

/**
 * \brief Layer the configuration: CLI > environment > JSON `"tak"` object > defaults.
 * \details Transport defaults stay out of the mapping so preference package values
 * can still fill them; only `COT_HOST_ID` gets its `takclient@<hostname>` default here.
 */
config::Config build_config(const EnvLookup& env = system_env);

ClientOptions get_client_options();

std::optional<std::string> get_cot_url();
std::optional<std::string> get_pref_package();
std::optional<int> get_tak_proto();
/** \brief Raw `--set KEY=VALUE` arguments in command-line order. */
const std::vector<std::string>& get_overrides();

void register_options();

} // namespace takclient::client::client_opts
