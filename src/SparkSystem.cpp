/**
 * @file SparkSystem.cpp
 * @brief SparkSystem implementation: spawning, per-frame advance, pair resolution and snapshots.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SparkSystem.h"
#include "Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <string>

namespace {
inline float clampf(float v, float lo, float hi) { return std::max(lo, std::min(hi, v)); }

// Ember palette new sparks are drawn from
const std::array<Rgb, 6> kPalette = {{
    {232.0f, 93.0f, 4.0f},    // burnt orange
    {255.0f, 214.0f, 10.0f},  // gold
    {250.0f, 163.0f, 7.0f},   // amber
    {220.0f, 47.0f, 2.0f},    // ember red
    {255.0f, 186.0f, 8.0f},   // saffron
    {255.0f, 240.0f, 200.0f}, // white-hot
}};

const StaticCapabilities kDefaultCaps{};

const int StatsEveryFrames = 300;
}

/** @copydoc SparkSystem::SparkSystem(const SparkConfig&, const Viewport&, std::shared_ptr<const HostCapabilities>) */
SparkSystem::SparkSystem(const SparkConfig& config, const Viewport& viewport,
                         std::shared_ptr<const HostCapabilities> caps_)
    : SparkSystem(config, viewport, std::move(caps_), std::random_device{}()) {}

/** @copydoc SparkSystem::SparkSystem(const SparkConfig&, const Viewport&, std::shared_ptr<const HostCapabilities>, uint32_t) */
SparkSystem::SparkSystem(const SparkConfig& config, const Viewport& viewport,
                         std::shared_ptr<const HostCapabilities> caps_, uint32_t rngSeed)
    : cfg(validated(config)), caps(std::move(caps_)),
      w(std::max(0.0f, viewport.width)), h(std::max(0.0f, viewport.height)),
      prng(rngSeed), net(prng),
      grid(cfg.interactionRadius, w, h) {
    resize(viewport);
    ledger.reserve((size_t)std::max(64, cfg.populationMax * 4));
}

SparkConfig SparkSystem::validated(const SparkConfig& in) {
    SparkConfig out = in;
    for (const auto& note : out.validate()) Logger::warn("SparkSystem config corrected: " + note);
    return out;
}

int SparkSystem::computeTargetPopulation(const SparkConfig& cfg, float width, float height,
                                         const HostCapabilities& caps) {
    if (!(width > 0.0f) || !(height > 0.0f)) return 0;
    const int base = caps.isLowPowerMode() ? cfg.sparkCountMobile : cfg.sparkCountDesktop;
    double density = caps.populationDensityHint();
    if (!std::isfinite(density) || density < 0.0) density = 1.0;
    const double areaRatio = ((double)width * (double)height) / ((double)ReferenceWidth * (double)ReferenceHeight);
    long scaled = std::lround((double)base * areaRatio * density);
    if (scaled < cfg.populationMin) scaled = cfg.populationMin;
    if (scaled > cfg.populationMax) scaled = cfg.populationMax;
    return (int)scaled;
}

bool SparkSystem::givesTo(const Spark& a, const Spark& b) {
    if (a.polarity() != b.polarity()) return a.polarity() > b.polarity();
    return a.id() < b.id();
}

float SparkSystem::applyTransfer(Spark& giver, Spark& receiver, float strength, float dt, const SparkConfig& cfg) {
    strength = clampf(strength, 0.0f, 1.0f);
    dt = std::max(0.0f, dt);

    // Energy: a share of the giver's surplus, never more than the receiver can hold
    const float frac = clampf(strength * cfg.transferRatePerSec * dt, 0.0f, 1.0f);
    float moved = frac * giver.surplusEnergy();
    moved = std::min(moved, std::max(0.0f, 1.0f - receiver.energy()));
    if (moved > 0.0f) {
        giver.setEnergy(giver.energy() - moved);
        receiver.setEnergy(receiver.energy() + moved);
    }

    giver.raiseRing(strength * 0.5f);

    // Color: receiver leans toward the giver; the giver picks up a quarter-strength tint back
    const float step = std::min(MaxColorStep, strength * strength * cfg.colorRatePerSec * dt);
    if (step > 0.0f) {
        const Rgb giverBefore = giver.color();
        const Rgb receiverBefore = receiver.color();
        receiver.setColor(colormix::mix(receiverBefore, giverBefore, step));
        giver.setColor(colormix::mix(giverBefore, receiverBefore, step * GiverTintShare));
    }
    return moved;
}

void SparkSystem::seed(double nowMs) {
    if (st != State::Uninitialized) return;
    const int count = (int)std::lround((double)target * InitialFillRatio);
    for (int i = 0; i < count; ++i) spawnRandom(nowMs);
    lastMs = nowMs;
    haveLast = true;
    st = State::Seeded;
    Logger::info("SparkSystem::seed: sparks=" + std::to_string(sparkList.size()) +
                 " target=" + std::to_string(target) +
                 " viewport=" + std::to_string((int)w) + "x" + std::to_string((int)h));
}

void SparkSystem::update(double nowMs) {
    if (st == State::Uninitialized) seed(nowMs);

    float dt = 0.0f;
    if (haveLast) dt = (float)((nowMs - lastMs) / 1000.0);
    if (!(dt > 0.0f)) dt = 0.0f;
    if (dt > MaxFrameDt) dt = MaxFrameDt;
    lastMs = nowMs;
    haveLast = true;
    dtLast = dt;
    ++frameNo;

    spawnFromBudget(nowMs, dt);
    advanceSparks(nowMs, dt);
    rebuildGrid();
    resolveInteractions(dt);
    decayInactive(dt);
    advanceFlows(dt);
    publishSnapshot();
    st = State::Running;

    if (frameNo % StatsEveryFrames == 0 && Logger::enabled(Logger::Level::Debug)) {
        Logger::debug("SparkSystem frame=" + std::to_string(frameNo) +
                      " sparks=" + std::to_string(sparkList.size()) + "/" + std::to_string(target) +
                      " connections=" + std::to_string(ledger.size()) +
                      " flows=" + std::to_string(flowList.size()) +
                      " interactions=" + std::to_string(interactions));
    }
}

void SparkSystem::resize(const Viewport& viewport) {
    w = std::max(0.0f, std::isfinite(viewport.width) ? viewport.width : 0.0f);
    h = std::max(0.0f, std::isfinite(viewport.height) ? viewport.height : 0.0f);
    float dpr = std::isfinite(viewport.dpr) && viewport.dpr > 0.0f ? viewport.dpr : 1.0f;
    dprEff = std::min(dpr, cfg.maxDpr);
    grid.resize(w, h);
    target = computeTargetPopulation(cfg, w, h, caps ? *caps : kDefaultCaps);
    for (auto& s : sparkList) s->wrapInto(w, h);
    Logger::info("SparkSystem::resize: viewport=" + std::to_string((int)w) + "x" + std::to_string((int)h) +
                 " dpr=" + std::to_string(dprEff) + " target=" + std::to_string(target));
}

std::shared_ptr<Spark> SparkSystem::spawnSpark(const SparkSpawn& spawn) {
    std::uniform_real_distribution<float> radiusDist(cfg.baseRadiusMin, cfg.baseRadiusMax);
    std::uniform_real_distribution<float> lifeDist(cfg.lifetimeMin, cfg.lifetimeMax);

    Spark::Init init;
    init.id = nextId++;
    init.x = spawn.x;
    init.y = spawn.y;
    init.vx = spawn.vx;
    init.vy = spawn.vy;
    init.baseRadius = spawn.baseRadius > 0.0f ? spawn.baseRadius : radiusDist(prng);
    init.energy = spawn.energy >= 0.0f ? spawn.energy : 0.6f + 0.4f * rand01();
    init.energyFloor = cfg.energyFloor;
    if (spawn.hasColor) {
        init.color = spawn.color;
    } else {
        std::uniform_int_distribution<size_t> pick(0, kPalette.size() - 1);
        const Rgb& base = kPalette[pick(prng)];
        std::uniform_real_distribution<float> jitter(-12.0f, 12.0f);
        init.color = Rgb{base.r + jitter(prng), base.g + jitter(prng), base.b + jitter(prng)};
    }
    init.seed = spawn.seed >= 0.0f ? std::min(1.0f, spawn.seed) : rand01();
    init.polarity = spawn.polarity >= 0.0f ? std::min(1.0f, spawn.polarity)
                                           : net.scoreAtSpawn(spawn.x, spawn.y, w, h, init.seed);
    init.birthMs = spawn.birthMs;
    init.lifetimeMs = spawn.lifetimeMs > 0.0f ? spawn.lifetimeMs : lifeDist(prng);

    auto s = std::make_shared<Spark>(init);
    s->wrapInto(w, h);
    sparkList.push_back(s);
    return s;
}

std::shared_ptr<Spark> SparkSystem::spawnRandom(double nowMs) {
    // Keep new sparks off the edges when the viewport is big enough for the padding
    const float padX = (w > 2.0f * cfg.spawnPadding) ? cfg.spawnPadding : 0.0f;
    const float padY = (h > 2.0f * cfg.spawnPadding) ? cfg.spawnPadding : 0.0f;
    std::uniform_real_distribution<float> xDist(padX, std::max(padX, w - padX));
    std::uniform_real_distribution<float> yDist(padY, std::max(padY, h - padY));
    std::uniform_real_distribution<float> ang(0.0f, 6.28318530718f);
    std::uniform_real_distribution<float> spd(0.2f * cfg.maxSpeed, 0.6f * cfg.maxSpeed);

    SparkSpawn p;
    p.x = xDist(prng);
    p.y = yDist(prng);
    const float theta = ang(prng);
    const float speed = spd(prng);
    p.vx = std::cos(theta) * speed;
    p.vy = std::sin(theta) * speed;
    p.birthMs = nowMs;
    return spawnSpark(p);
}

void SparkSystem::spawnFromBudget(double nowMs, float dt) {
    const float cap = (float)cfg.maxSpawnsPerFrame;
    spawnBudget = std::min(cap, spawnBudget + cfg.spawnRatePerSec * dt);
    int spawned = 0;
    while (spawnBudget >= 1.0f && spawned < cfg.maxSpawnsPerFrame) {
        spawnBudget -= 1.0f;
        if ((int)sparkList.size() >= target) continue; // the target only gates new spawns
        spawnRandom(nowMs);
        ++spawned;
    }
}

void SparkSystem::advanceSparks(double nowMs, float dt) {
    std::unordered_set<uint64_t> culled;
    size_t write = 0;
    for (size_t i = 0; i < sparkList.size(); ++i) {
        auto& s = sparkList[i];
        if (!s->advance(nowMs, dt, cfg, w, h)) {
            culled.insert(s->id());
            continue;
        }
        if (write != i) sparkList[write] = std::move(s);
        ++write;
    }
    sparkList.resize(write);
    if (!culled.empty()) purge(culled);
}

void SparkSystem::purge(const std::unordered_set<uint64_t>& culled) {
    ledger.eraseIf([&](const PairKey& k, const Connection&) {
        return culled.count(k.lo) != 0 || culled.count(k.hi) != 0;
    });
    flowList.erase(std::remove_if(flowList.begin(), flowList.end(), [&](const FlowParticle& f) {
        return culled.count(f.giver()) != 0 || culled.count(f.receiver()) != 0;
    }), flowList.end());
}

void SparkSystem::rebuildGrid() {
    grid.clear();
    for (auto& s : sparkList) grid.insert(*s);
}

void SparkSystem::resolveInteractions(float dt) {
    interactions = 0;
    processed.clear();
    const int cap = cfg.maxInteractionsPerFrame;
    if (cap <= 0) return;
    for (auto& s : sparkList) {
        if (interactions >= cap) break;
        neighborScratch.clear();
        grid.neighborsOf(*s, neighborScratch);
        for (Spark* other : neighborScratch) {
            PairKey key = PairKey::of(s->id(), other->id());
            if (!processed.insert(key).second) continue;
            if (interactions >= cap) break;
            ++interactions;
            resolvePair(s, other->shared_from_this(), key, dt);
        }
    }
}

void SparkSystem::resolvePair(const std::shared_ptr<Spark>& a, const std::shared_ptr<Spark>& b,
                              const PairKey& key, float dt) {
    const float dx = b->x() - a->x();
    const float dy = b->y() - a->y();
    const float d2 = dx * dx + dy * dy;
    if (!(d2 > 0.0f)) return; // coincident sparks have no direction
    const float dist = std::sqrt(d2);
    if (dist >= cfg.interactionRadius) return;

    const float weight = ConnectionLedger::targetWeight(dist, cfg.interactionRadius);
    Connection& c = ledger.obtain(key, a, b);
    c.strength = ConnectionLedger::approach(c.strength, weight, dt);
    c.activeFrame = frameNo;
    const float strength = c.strength;

    if (strength <= ActivationThreshold) return;
    const bool aGives = givesTo(*a, *b);
    const std::shared_ptr<Spark>& giver = aGives ? a : b;
    const std::shared_ptr<Spark>& receiver = aGives ? b : a;
    applyTransfer(*giver, *receiver, strength, dt, cfg);

    if (strength > FlowVisibilityThreshold && (int)flowList.size() < cfg.maxFlowParticles) {
        const float chance = strength * cfg.flowSpawnRate * dt * 60.0f;
        if (rand01() < chance) {
            flowList.emplace_back(giver, receiver,
                                  colormix::mix(giver->color(), receiver->color(), FlowColorBlend));
        }
    }
}

void SparkSystem::decayInactive(float dt) {
    ledger.forEach([&](const PairKey&, Connection& c) {
        if (c.activeFrame != frameNo) c.strength = ConnectionLedger::fade(c.strength, dt);
    });
    ledger.eraseIf([&](const PairKey&, const Connection& c) {
        if (c.a.expired() || c.b.expired()) return true;
        return c.activeFrame != frameNo && c.strength <= 0.0f;
    });
}

void SparkSystem::advanceFlows(float dt) {
    flowList.erase(std::remove_if(flowList.begin(), flowList.end(), [&](FlowParticle& f) {
        return !f.update(dt, cfg.flowParticleSpeed);
    }), flowList.end());
}

void SparkSystem::publishSnapshot() {
    snap.sparks.clear();
    snap.connections.clear();
    snap.flows.clear();
    snap.width = w;
    snap.height = h;
    snap.dpr = dprEff;
    snap.frame = frameNo;
    snap.targetPopulation = target;
    snap.interactions = interactions;

    snap.sparks.reserve(sparkList.size());
    for (const auto& s : sparkList) {
        snap.sparks.push_back(SparkView{s->x(), s->y(), s->radius(), s->glowRadius(cfg.glowMultiplier),
                                        s->alpha(), s->ringAlpha(), s->color(), s->id()});
    }

    snap.connections.reserve(ledger.size());
    ledger.forEach([&](const PairKey&, const Connection& c) {
        auto a = c.a.lock();
        auto b = c.b.lock();
        if (!a || !b || c.strength <= 0.0f) return;
        const float dx = b->x() - a->x();
        const float dy = b->y() - a->y();
        const float dist = std::sqrt(dx * dx + dy * dy);
        const float fade = clampf(1.0f - dist / cfg.interactionRadius, 0.0f, 1.0f);
        const float alpha = c.strength * fade * cfg.lineAlphaMax;
        snap.connections.push_back(ConnectionView{a->x(), a->y(), b->x(), b->y(), a->color(), b->color(),
                                                  c.strength, fade, alpha});
    });

    snap.flows.reserve(flowList.size());
    for (const auto& f : flowList) {
        float x = 0.0f, y = 0.0f;
        if (!f.position(x, y)) continue;
        snap.flows.push_back(FlowView{x, y, f.color(), f.alpha(), f.size()});
    }
}

float SparkSystem::rand01() {
    std::uniform_real_distribution<float> d(0.0f, 1.0f);
    return d(prng);
}
