/**
 * @file HostCapabilities.h
 * @brief Capability query injected into SparkSystem so simulation code never probes the host itself.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

/**
 * @class HostCapabilities
 * @brief What the hosting environment can afford. Queried whenever the population target is recomputed.
 */
class HostCapabilities {
public:
    virtual ~HostCapabilities() = default;
    /** @brief True on constrained hosts; selects the mobile population count. */
    virtual bool isLowPowerMode() const = 0;
    /** @brief Multiplier applied to the area-scaled population target (1.0 = no change). */
    virtual double populationDensityHint() const = 0;
};

/**
 * @class StaticCapabilities
 * @brief Fixed-value capabilities, decided once by the host at startup.
 */
class StaticCapabilities : public HostCapabilities {
public:
    StaticCapabilities() = default;
    StaticCapabilities(bool lowPower, double densityHint) : lowPower(lowPower), density(densityHint) {}

    bool isLowPowerMode() const override { return lowPower; }
    double populationDensityHint() const override { return density; }

private:
    bool lowPower{false};
    double density{1.0};
};
