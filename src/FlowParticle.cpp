/**
 * @file FlowParticle.cpp
 * @brief FlowParticle travel along the live giver-receiver segment.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "FlowParticle.h"
#include "Spark.h"

#include <algorithm>
#include <cmath>

FlowParticle::FlowParticle(const std::shared_ptr<Spark>& giver, const std::shared_ptr<Spark>& receiver,
                           const Rgb& color)
    : from(giver), to(receiver),
      giverId(giver ? giver->id() : 0), receiverId(receiver ? receiver->id() : 0), col(color) {}

bool FlowParticle::update(float dt, float speed) {
    auto g = from.lock();
    auto r = to.lock();
    if (!g || !r) return false;
    float dx = r->x() - g->x();
    float dy = r->y() - g->y();
    float dist = std::max(1.0f, std::sqrt(dx * dx + dy * dy));
    t += (speed / dist) * std::max(0.0f, dt);
    a = std::max(0.0f, std::min(1.0f, 1.0f - t));
    return t < 1.0f;
}

bool FlowParticle::position(float& x, float& y) const {
    auto g = from.lock();
    auto r = to.lock();
    if (!g || !r) return false;
    float k = std::min(1.0f, t);
    x = g->x() + (r->x() - g->x()) * k;
    y = g->y() + (r->y() - g->y()) * k;
    return true;
}
