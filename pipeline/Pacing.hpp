/**
 * \file pipeline/Pacing.hpp
 * \brief Delay applied by the transmit worker after each write.
 * \ingroup pipeline_module
 */
#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace takclient::pipeline {

enum class PacingMode {
    Yield,        ///< Minimum delay only
    Fixed,        ///< `TAK_SLEEP` seconds
    DosAvoidance  ///< Uniform random in [0, max]
};

const char* to_string(PacingMode mode);

class Pacing {
public:
    using Duration = std::chrono::microseconds;

    static constexpr Duration kMinimumDelay{1000};

    explicit Pacing(PacingMode mode = PacingMode::Yield, Duration max_delay = kMinimumDelay,
                    std::uint64_t seed = std::random_device{}());

    /**
     * \brief Mode from configuration.
     * \details `TAK_PACING` (`yield`, `fixed`, `dos`) wins. Otherwise `FTS_COMPAT`
     * selects DosAvoidance with max `TAK_SLEEP` (default 5 s), and a bare `TAK_SLEEP`
     * selects Fixed.
     * \throws ConfigError for an unknown mode or a negative sleep.
     */
    static Pacing from_config(const config::Config& cfg);

    /** \brief Delay to apply now; never below \ref kMinimumDelay. */
    Duration next_delay();

    PacingMode mode() const { return mode_; }
    Duration max_delay() const { return max_delay_; }
    std::string describe() const;

private:
    PacingMode mode_;
    Duration max_delay_;
    std::mt19937_64 rng_;
};

} // namespace takclient::pipeline
