/**
 * @file SparkSystem.h
 * @brief Declares SparkSystem: the frame-driven engine that spawns, advances and couples sparks.
 *
 * The engine is single-threaded. The host calls update() once per display tick and then reads
 * snapshot() on the same thread; resize() may only be called between frames.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <unordered_set>
#include <vector>

#include "ColorMix.h"
#include "ConnectionLedger.h"
#include "FlowParticle.h"
#include "HostCapabilities.h"
#include "PolarityNetwork.h"
#include "Spark.h"
#include "SparkConfig.h"
#include "SpatialGrid.h"

/**
 * @class SparkSystem
 * @brief Owns the spark population, the connection ledger and the flow particles.
 *
 * Responsibilities:
 * - Population target from viewport area and host capabilities; rate-budgeted spawning
 * - Per-frame advance and culling (with immediate purge of dependent connections and flows)
 * - Grid-accelerated pair discovery under a hard per-frame interaction cap
 * - Energy/color transfer and flow particle spawning
 * - A read-only snapshot for the renderer
 */
class SparkSystem {
public:
    /** @brief Viewport in CSS pixels plus the device pixel ratio. */
    struct Viewport {
        float width{0.0f};
        float height{0.0f};
        float dpr{1.0f};
    };

    enum class State { Uninitialized, Seeded, Running };

    /**
     * @struct SparkSpawn
     * @brief Explicit placement for spawnSpark(). Negative values mean "draw at random".
     */
    struct SparkSpawn {
        float x{0.0f}, y{0.0f};
        float vx{0.0f}, vy{0.0f};
        float polarity{-1.0f};
        float energy{-1.0f};
        float baseRadius{-1.0f};
        float seed{-1.0f};
        float lifetimeMs{-1.0f};
        double birthMs{0.0};
        bool hasColor{false};
        Rgb color{};
    };

    // Snapshot element types consumed by the renderer
    struct SparkView { float x, y, radius, glowRadius, alpha, ringAlpha; Rgb color; uint64_t id; };
    struct ConnectionView { float ax, ay, bx, by; Rgb colorA, colorB; float strength, fade, alpha; };
    struct FlowView { float x, y; Rgb color; float alpha, size; };
    struct FrameSnapshot {
        std::vector<SparkView> sparks;
        std::vector<ConnectionView> connections;
        std::vector<FlowView> flows;
        float width{0.0f};
        float height{0.0f};
        float dpr{1.0f};
        uint64_t frame{0};
        int targetPopulation{0};
        int interactions{0};
    };

    // Engine constants
    static constexpr float MaxFrameDt = 0.1f;              /**< longer ticks are truncated, not queued */
    static constexpr float InitialFillRatio = 0.6f;        /**< share of the target pre-spawned by seed() */
    static constexpr float ActivationThreshold = 0.02f;    /**< strength above which energy flows */
    static constexpr float FlowVisibilityThreshold = 0.25f;/**< strength above which flow tokens may spawn */
    static constexpr float MaxColorStep = 0.2f;            /**< per-frame cap on the receiver color step */
    static constexpr float GiverTintShare = 0.25f;         /**< giver's reciprocal tint relative to the receiver step */
    static constexpr float FlowColorBlend = 0.3f;          /**< flow color = mix(giver, receiver, 0.3) */
    static constexpr float ReferenceWidth = 1920.0f;
    static constexpr float ReferenceHeight = 1080.0f;

    /** @brief Construct with a non-deterministic seed. A null @p caps behaves as StaticCapabilities{}. */
    SparkSystem(const SparkConfig& config, const Viewport& viewport,
                std::shared_ptr<const HostCapabilities> caps = nullptr);
    /** @brief Construct with an explicit PRNG seed (reproducible runs and tests). */
    SparkSystem(const SparkConfig& config, const Viewport& viewport,
                std::shared_ptr<const HostCapabilities> caps, uint32_t rngSeed);

    SparkSystem(const SparkSystem&) = delete;
    SparkSystem& operator=(const SparkSystem&) = delete;

    /** @brief Pre-spawn the initial population at @p nowMs. No-op unless Uninitialized. */
    void seed(double nowMs);

    /**
     * @brief Run one frame at monotonic time @p nowMs (milliseconds) and refresh the snapshot.
     *
     * Seeds implicitly on first use. The first frame after seeding has dt = 0.
     */
    void update(double nowMs);

    /** @brief Adopt a new viewport: resize the grid, recompute the target, wrap sparks into bounds. */
    void resize(const Viewport& viewport);

    /** @brief Insert one spark with explicit traits; returns it. Ignores the population target. */
    std::shared_ptr<Spark> spawnSpark(const SparkSpawn& spawn);

    /** @brief Latest snapshot; empty before the first update(). */
    const FrameSnapshot& snapshot() const { return snap; }

    // Queries
    State state() const { return st; }
    const SparkConfig& config() const { return cfg; }
    float width() const { return w; }
    float height() const { return h; }
    float dpr() const { return dprEff; }
    int targetPopulation() const { return target; }
    size_t population() const { return sparkList.size(); }
    const std::vector<std::shared_ptr<Spark>>& sparks() const { return sparkList; }
    const ConnectionLedger& connections() const { return ledger; }
    const std::vector<FlowParticle>& flows() const { return flowList; }
    uint64_t frameNumber() const { return frameNo; }
    float lastDt() const { return dtLast; }
    int interactionsLastFrame() const { return interactions; }
    const PolarityNetwork& polarityNetwork() const { return net; }

    /** @brief Area-scaled, capability-adjusted population target clamped to [populationMin, populationMax]. */
    static int computeTargetPopulation(const SparkConfig& cfg, float width, float height,
                                       const HostCapabilities& caps);

    /** @brief True when @p a is the giver for the pair (a, b): strictly higher polarity, ties to the smaller id. */
    static bool givesTo(const Spark& a, const Spark& b);

    /**
     * @brief Apply one frame of energy and color transfer from @p giver to @p receiver at @p strength.
     *
     * Moves clamp(strength*transferRate*dt, 0, 1) of the giver's surplus above its floor, limited to the
     * receiver's headroom, raises the giver's ring, and mixes colors both ways.
     * @return The energy moved (equal to the giver's loss and the receiver's gain).
     */
    static float applyTransfer(Spark& giver, Spark& receiver, float strength, float dt, const SparkConfig& cfg);

private:
    static SparkConfig validated(const SparkConfig& in);

    void spawnFromBudget(double nowMs, float dt);
    std::shared_ptr<Spark> spawnRandom(double nowMs);
    void advanceSparks(double nowMs, float dt);
    void purge(const std::unordered_set<uint64_t>& culled);
    void rebuildGrid();
    void resolveInteractions(float dt);
    void resolvePair(const std::shared_ptr<Spark>& a, const std::shared_ptr<Spark>& b, const PairKey& key, float dt);
    void decayInactive(float dt);
    void advanceFlows(float dt);
    void publishSnapshot();
    float rand01();

    const SparkConfig cfg;                         /**< validated copy, immutable */
    std::shared_ptr<const HostCapabilities> caps;  /**< injected host capabilities */
    float w, h;                                    /**< viewport (CSS px) */
    float dprEff{1.0f};                            /**< device pixel ratio clamped to maxDpr */

    std::mt19937 prng;                             /**< engine PRNG */
    PolarityNetwork net;                           /**< drawn from prng at construction */

    SpatialGrid grid;                              /**< rebuilt every frame */
    ConnectionLedger ledger;                       /**< pair key -> smoothed strength */
    std::vector<std::shared_ptr<Spark>> sparkList; /**< live population, spawn order */
    std::vector<FlowParticle> flowList;            /**< live flow tokens */

    State st{State::Uninitialized};
    uint64_t nextId{1};                            /**< ids are never reused within this engine */
    uint64_t frameNo{0};
    double lastMs{0.0};
    bool haveLast{false};
    float dtLast{0.0f};
    float spawnBudget{0.0f};
    int target{0};
    int interactions{0};

    // Per-frame scratch, kept to avoid reallocation
    std::vector<Spark*> neighborScratch;
    std::unordered_set<PairKey, PairKeyHash> processed;

    FrameSnapshot snap;
};
