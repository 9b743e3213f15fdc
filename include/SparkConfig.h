/**
 * @file SparkConfig.h
 * @brief Immutable tuning parameters for the spark simulation, plus startup override parsing.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>
#include <vector>

/**
 * @struct SparkConfig
 * @brief Named numeric parameters fixed at startup. Distances are viewport pixels, rates are per
 *        second and lifetimes are milliseconds.
 *
 * The engine copies the value at construction; later edits to the caller's instance have no effect.
 */
struct SparkConfig {
    // Population
    int   sparkCountDesktop{160};       /**< target population at the reference resolution */
    int   sparkCountMobile{70};         /**< target population at the reference resolution in low-power mode */
    int   populationMin{30};            /**< lower clamp for the computed target */
    int   populationMax{300};           /**< upper clamp for the computed target */
    float spawnRatePerSec{6.0f};        /**< spawn budget accrued per second */
    int   maxSpawnsPerFrame{4};         /**< hard cap on sparks created in one update */
    float spawnPadding{40.0f};          /**< keep new sparks this far from the viewport edge */

    // Interaction
    float interactionRadius{140.0f};    /**< max center distance for a connection; also the grid cell size */
    float transferRatePerSec{0.35f};    /**< fraction of giver surplus moved per second at full strength */
    float colorRatePerSec{0.6f};        /**< color step per second at full strength (squared) */
    int   maxInteractionsPerFrame{600}; /**< hard cap on resolved pairs per update */

    // Energy
    float energyDecayPerSec{0.03f};     /**< multiplicative decay applied as (1-rate)^dt */
    float energyFloor{0.25f};           /**< decay and transfer never take energy below this */

    // Appearance
    float baseRadiusMin{1.5f};
    float baseRadiusMax{3.5f};
    float glowMultiplier{6.0f};         /**< glow radius as a multiple of the core radius */
    float lineAlphaMax{0.35f};          /**< connection alpha at full strength and zero distance */
    float maxDpr{2.0f};                 /**< device pixel ratio clamp */

    // Flow particles
    int   maxFlowParticles{80};
    float flowParticleSpeed{160.0f};    /**< px/s along the giver->receiver segment */
    float flowSpawnRate{0.06f};         /**< spawn chance per 60fps frame at full strength */

    // Motion
    float maxSpeed{36.0f};              /**< px/s */
    float driftStrength{10.0f};         /**< px/s^2 amplitude of the sinusoidal drift */
    float damping{0.985f};              /**< velocity retained per 1/60 s */

    // Lifetime
    float lifetimeMin{14000.0f};
    float lifetimeMax{32000.0f};

    /**
     * @brief Replace non-finite values with defaults and clamp the rest into usable ranges.
     * @return One human-readable line per correction made (empty when the config was valid).
     */
    std::vector<std::string> validate();

    /**
     * @brief Set the field called @p name (camelCase, as declared above) from text.
     * @return false when the name is unknown or the value does not parse as a number.
     */
    bool set(const std::string& name, const std::string& value);

    /** @brief Read a field by name into @p out; false when the name is unknown. */
    bool get(const std::string& name, double& out) const;

    /** @brief Every settable field name, in declaration order. */
    static std::vector<std::string> fieldNames();

    /** @brief Environment variable consulted for @p name, e.g. interactionRadius -> SPARKS_INTERACTION_RADIUS. */
    static std::string envNameFor(const std::string& name);
};

/**
 * @brief Apply SPARKS_* environment overrides to @p cfg.
 * @return Warnings for variables that were present but malformed.
 */
std::vector<std::string> applyEnvironmentOverrides(SparkConfig& cfg);

/**
 * @brief Try to consume a `--name=value` or `--name value` config override at argv[idx].
 *
 * On success idx is left on the last consumed element. Arguments that do not name a config field
 * are left untouched and false is returned with @p warning empty; a known field with a bad value
 * returns false and fills @p warning.
 */
bool applyArgumentOverride(SparkConfig& cfg, int argc, char** argv, int& idx, std::string& warning);
