/**
 * \file pipeline/Pacing.cpp
 * \brief Pacing mode selection and delay generation.
 * \ingroup pipeline_module
 */
#include "Pacing.hpp"
#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace takclient::pipeline {

const char* to_string(PacingMode mode) {
    switch (mode) {
        case PacingMode::Yield:        return "yield";
        case PacingMode::Fixed:        return "fixed";
        case PacingMode::DosAvoidance: return "dos";
    }
    return "unknown";
}

Pacing::Pacing(PacingMode mode, Duration max_delay, std::uint64_t seed)
    : mode_(mode), max_delay_(std::max(max_delay, Duration::zero())), rng_(seed) {}

namespace {

Pacing::Duration sleep_from(const config::Config& cfg, double fallback_seconds) {
    double seconds = cfg.get_double(config::keys::Sleep, fallback_seconds);
    if (seconds < 0) throw ConfigError("TAK_SLEEP must not be negative");
    return Pacing::Duration{static_cast<std::int64_t>(seconds * 1e6)};
}

} // namespace

Pacing Pacing::from_config(const config::Config& cfg) {
    std::string mode = cfg.get_or(config::keys::Pacing, "");
    for (auto& c : mode) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (mode == "yield") return Pacing(PacingMode::Yield);
    if (mode == "fixed") return Pacing(PacingMode::Fixed, sleep_from(cfg, 0));
    if (mode == "dos") return Pacing(PacingMode::DosAvoidance, sleep_from(cfg, config::defaults::SleepSeconds));
    if (!mode.empty()) throw ConfigError("Unknown TAK_PACING '" + mode + "' (expected yield, fixed or dos)");

    if (cfg.get_bool(config::keys::FtsCompat)) {
        return Pacing(PacingMode::DosAvoidance, sleep_from(cfg, config::defaults::SleepSeconds));
    }
    if (cfg.get(config::keys::Sleep).value_or("").empty()) return Pacing(PacingMode::Yield);
    return Pacing(PacingMode::Fixed, sleep_from(cfg, 0));
}

Pacing::Duration Pacing::next_delay() {
    Duration delay = kMinimumDelay;
    switch (mode_) {
        case PacingMode::Yield:
            break;
        case PacingMode::Fixed:
            delay = max_delay_;
            break;
        case PacingMode::DosAvoidance: {
            std::uniform_int_distribution<Duration::rep> dist(0, max_delay_.count());
            delay = Duration{dist(rng_)};
            break;
        }
    }
    return std::max(delay, kMinimumDelay);
}

std::string Pacing::describe() const {
    std::string s = to_string(mode_);
    if (mode_ != PacingMode::Yield) {
        s += " (max " + std::to_string(max_delay_.count() / 1000) + " ms)";
    }
    return s;
}

} // namespace takclient::pipeline
