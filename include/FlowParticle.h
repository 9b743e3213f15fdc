/**
 * @file FlowParticle.h
 * @brief Short-lived token travelling from an energy giver to its receiver.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstdint>
#include <memory>

#include "ColorMix.h"

class Spark;

/**
 * @class FlowParticle
 * @brief Interpolates along the live giver->receiver segment; retires at t >= 1 or when an endpoint is gone.
 */
class FlowParticle {
public:
    FlowParticle(const std::shared_ptr<Spark>& giver, const std::shared_ptr<Spark>& receiver, const Rgb& color);

    /**
     * @brief Advance progress by (speed / max(1, distance)) * dt and refresh alpha.
     * @return false once progress reached 1 or either endpoint expired.
     */
    bool update(float dt, float speed);

    /** @brief Position on the current giver->receiver segment; false if an endpoint expired. */
    bool position(float& x, float& y) const;

    /** @brief True when either endpoint is @p id (used by the engine to retire tokens of culled sparks). */
    bool references(uint64_t id) const { return id == giverId || id == receiverId; }

    float progress() const { return t; }
    float alpha() const { return a; }
    /** @brief Draw size in px; shrinks as the token fades. */
    float size() const { return 1.0f + 1.5f * a; }
    const Rgb& color() const { return col; }
    uint64_t giver() const { return giverId; }
    uint64_t receiver() const { return receiverId; }

private:
    std::weak_ptr<Spark> from;
    std::weak_ptr<Spark> to;
    uint64_t giverId;
    uint64_t receiverId;
    Rgb col;
    float t{0.0f};
    float a{1.0f};
};
