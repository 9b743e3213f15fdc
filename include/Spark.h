/**
 * @file Spark.h
 * @brief Declares the Spark class: one glowing particle with kinematics, energy, color and a finite life.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <memory>

#include "ColorMix.h"

struct SparkConfig;

/**
 * @class Spark
 * @brief A simulated particle owned by SparkSystem.
 *
 * Invariants maintained by every mutator:
 * - energy stays within [energyFloor*0.5, 1]
 * - after advance(), position lies in [0,width) x [0,height)
 * - id, polarity, seed, birth and lifetime never change after construction
 */
class Spark : public std::enable_shared_from_this<Spark> {
public:
    /** @brief Construction parameters; the engine fills these from its PRNG and config. */
    struct Init {
        uint64_t id{0};
        float x{0.0f}, y{0.0f};
        float vx{0.0f}, vy{0.0f};
        float baseRadius{2.0f};
        float energy{1.0f};
        float energyFloor{0.0f};
        Rgb color{};
        float polarity{0.5f};
        float seed{0.0f};
        double birthMs{0.0};
        float lifetimeMs{1000.0f};
    };

    static constexpr float FadeInMs = 500.0f;          /**< fade-in ramp length */
    static constexpr float FadeOutFraction = 0.25f;    /**< fade-out over the final quarter of life */
    static constexpr float RingDecayPerFrame = 0.92f;  /**< ring alpha retained per 1/60 s */

    explicit Spark(const Init& init);

    /**
     * @brief Advance one frame: drift, damping, speed clamp, integration, toroidal wrap, energy and
     *        ring decay, fade.
     * @return true while age < lifetime.
     */
    bool advance(double nowMs, float dt, const SparkConfig& cfg, float width, float height);

    /** @brief Wrap the current position into [0,width) x [0,height) without moving otherwise. */
    void wrapInto(float width, float height);

    // Identity and fixed traits
    uint64_t id() const { return ident; }
    float polarity() const { return pol; }
    float seed() const { return seedFeature; }
    double birthMs() const { return birth; }
    float lifetimeMs() const { return lifetime; }
    float baseRadius() const { return radius0; }

    // Kinematics
    float x() const { return px; }
    float y() const { return py; }
    float vx() const { return velx; }
    float vy() const { return vely; }
    float speed() const;

    // Energy
    float energy() const { return e; }
    float energyFloor() const { return eFloor; }
    /** @brief Set energy, clamped into [energyFloor*0.5, 1]. */
    void setEnergy(float v);
    /** @brief Energy that may be given away without dropping below the floor. */
    float surplusEnergy() const;

    // Color
    const Rgb& color() const { return col; }
    void setColor(const Rgb& c);

    // Visual feedback
    float ringAlpha() const { return ring; }
    /** @brief Raise ring alpha to at least @p v (never lowers it). */
    void raiseRing(float v);

    /** @brief Age in ms as of the last advance(). */
    double ageMs() const { return age; }
    float fadeIn() const { return fIn; }
    float fadeOut() const { return fOut; }
    /** @brief fadeIn() * fadeOut(), in [0,1]. */
    float fade() const { return fIn * fOut; }

    /** @brief Draw alpha: fade scaled by an energy-weighted brightness. */
    float alpha() const;
    /** @brief Core radius; swells slightly with energy. */
    float radius() const;
    /** @brief Glow halo radius. */
    float glowRadius(float glowMultiplier) const { return radius() * glowMultiplier; }

private:
    /** @brief Recompute fIn/fOut from the current age. */
    void updateFade();

    uint64_t ident;     /**< unique id, never reused by the owning engine */
    float px, py;       /**< position */
    float velx, vely;   /**< velocity (px/s) */
    float radius0;      /**< base radius */
    float e;            /**< energy */
    float eFloor;       /**< energy floor; hard minimum is eFloor*0.5 */
    Rgb col;            /**< current color */
    float pol;          /**< polarity in (0,1) */
    float seedFeature;  /**< drift phase seed in [0,1] */
    double birth;       /**< birth timestamp (ms) */
    float lifetime;     /**< lifetime (ms) */
    float ring{0.0f};   /**< ring alpha */
    double age{0.0};    /**< age (ms) at last advance */
    float fIn{0.0f};    /**< fade-in factor */
    float fOut{1.0f};   /**< fade-out factor */
};
