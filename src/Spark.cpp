/**
 * @file Spark.cpp
 * @brief Spark implementation: per-frame kinematics and lifecycle.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Spark.h"
#include "SparkConfig.h"

#include <algorithm>
#include <cmath>

namespace {
constexpr float TwoPi = 6.28318530718f;

inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

/** @brief Wrap @p v into [0,extent); extent <= 0 collapses to 0. */
inline float wrapAxis(float v, float extent) {
    if (!(extent > 0.0f)) return 0.0f;
    if (!std::isfinite(v)) return 0.0f;
    v = std::fmod(v, extent);
    if (v < 0.0f) v += extent;
    // fmod of a tiny negative value plus extent can round up to extent itself
    if (v >= extent) v = 0.0f;
    return v;
}
}

/** @copydoc Spark::Spark */
Spark::Spark(const Init& init)
    : ident(init.id), px(init.x), py(init.y), velx(init.vx), vely(init.vy),
      radius0(init.baseRadius), e(1.0f), eFloor(clamp01(init.energyFloor)), col(init.color),
      pol(init.polarity), seedFeature(clamp01(init.seed)), birth(init.birthMs),
      lifetime(std::max(1.0f, init.lifetimeMs)) {
    setEnergy(init.energy);
    setColor(init.color);
    updateFade();
}

/** @copydoc Spark::advance */
bool Spark::advance(double nowMs, float dt, const SparkConfig& cfg, float width, float height) {
    if (!(dt >= 0.0f)) dt = 0.0f;
    age = std::max(0.0, nowMs - birth);

    // Smooth drift: two slow sinusoids, phase-offset per spark so neighbors don't move in lockstep
    const float phase = seedFeature * TwoPi;
    const float t = (float)(nowMs * 0.001);
    const float ax = std::sin(t * 0.7f + phase) * cfg.driftStrength;
    const float ay = std::cos(t * 0.9f + phase * 1.3f) * cfg.driftStrength;
    velx += ax * dt;
    vely += ay * dt;

    // Damping expressed per 1/60 s so decay per real second is frame-rate independent
    const float damp = std::pow(cfg.damping, dt * 60.0f);
    velx *= damp;
    vely *= damp;

    const float sp = speed();
    if (sp > cfg.maxSpeed && sp > 0.0f) {
        const float k = cfg.maxSpeed / sp;
        velx *= k;
        vely *= k;
    }

    px += velx * dt;
    py += vely * dt;
    wrapInto(width, height);

    // Energy decays toward the floor, never past it
    float decayed = e * std::pow(1.0f - cfg.energyDecayPerSec, dt);
    if (decayed < eFloor) decayed = std::min(e, eFloor);
    setEnergy(decayed);

    ring *= std::pow(RingDecayPerFrame, dt * 60.0f);
    if (ring < 1e-4f) ring = 0.0f;

    updateFade();
    return age < (double)lifetime;
}

void Spark::wrapInto(float width, float height) {
    px = wrapAxis(px, width);
    py = wrapAxis(py, height);
}

float Spark::speed() const {
    return std::sqrt(velx * velx + vely * vely);
}

void Spark::setEnergy(float v) {
    if (!std::isfinite(v)) v = eFloor;
    e = std::max(eFloor * 0.5f, std::min(1.0f, v));
}

float Spark::surplusEnergy() const {
    return std::max(0.0f, e - eFloor);
}

void Spark::setColor(const Rgb& c) {
    auto ch = [](float v) { return std::isfinite(v) ? std::max(0.0f, std::min(255.0f, v)) : 0.0f; };
    col = Rgb{ch(c.r), ch(c.g), ch(c.b)};
}

void Spark::raiseRing(float v) {
    ring = std::max(ring, clamp01(v));
}

float Spark::alpha() const {
    return clamp01(fade() * (0.35f + 0.65f * e));
}

float Spark::radius() const {
    return radius0 * (0.8f + 0.4f * e);
}

void Spark::updateFade() {
    const double fadeOutStart = (double)lifetime * (1.0 - FadeOutFraction);
    fIn = clamp01((float)(age / FadeInMs));
    if (age <= fadeOutStart) {
        fOut = 1.0f;
    } else {
        fOut = clamp01((float)(((double)lifetime - age) / ((double)lifetime * FadeOutFraction)));
    }
}
