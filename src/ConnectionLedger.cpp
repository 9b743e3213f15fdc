/**
 * @file ConnectionLedger.cpp
 * @brief Connection strength filters and the flat pair-keyed map behind the ledger.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "ConnectionLedger.h"
#include "Spark.h"

#include <algorithm>

float ConnectionLedger::targetWeight(float distance, float radius) {
    if (!(radius > 0.0f) || !(distance < radius)) return 0.0f;
    if (distance <= 0.0f) return 1.0f;
    float t = 1.0f - distance / radius;
    return t * t * (3.0f - 2.0f * t);
}

float ConnectionLedger::approach(float strength, float target, float dt) {
    float k = std::max(0.0f, std::min(1.0f, SmoothingPerSec * dt));
    float s = strength + (target - strength) * k;
    return std::max(0.0f, std::min(1.0f, s));
}

float ConnectionLedger::fade(float strength, float dt) {
    float s = strength - FadePerSec * std::max(0.0f, dt);
    // Float residue from repeated frame steps must not keep a link alive another frame
    return s < FadeResidue ? 0.0f : s;
}

Connection* ConnectionLedger::find(const PairKey& k) {
    size_t i = locate(k);
    return i == SIZE_MAX ? nullptr : &vals[i];
}

const Connection* ConnectionLedger::find(const PairKey& k) const {
    size_t i = locate(k);
    return i == SIZE_MAX ? nullptr : &vals[i];
}

Connection& ConnectionLedger::obtain(const PairKey& k, const std::shared_ptr<Spark>& a,
                                     const std::shared_ptr<Spark>& b, bool* created) {
    bool inserted = false;
    size_t i = findOrInsert(k, inserted);
    Connection& c = vals[i];
    if (inserted) {
        // Store endpoints in key order so c.a always has the smaller id
        bool aIsLo = a && a->id() == k.lo;
        c.a = aIsLo ? a : b;
        c.b = aIsLo ? b : a;
        c.strength = 0.0f;
        c.activeFrame = 0;
    }
    if (created) *created = inserted;
    return c;
}

bool ConnectionLedger::erase(const PairKey& k) {
    size_t i = locate(k);
    if (i == SIZE_MAX) return false;
    state[i] = Tomb;
    keys[i] = {};
    vals[i] = Connection{};
    --used;
    ++tombs;
    return true;
}

void ConnectionLedger::clear() {
    std::fill(state.begin(), state.end(), (uint8_t)Empty);
    std::fill(vals.begin(), vals.end(), Connection{});
    used = 0;
    tombs = 0;
}

void ConnectionLedger::reserve(size_t n) {
    size_t need = n * 2; // load factor ~0.5
    if (capacity >= need) return;
    size_t cap = 64;
    while (cap < need) cap <<= 1;
    rehash(cap);
}

size_t ConnectionLedger::locate(const PairKey& k) const {
    if (capacity == 0) return SIZE_MAX;
    size_t i = PairKeyHash{}(k) & (capacity - 1);
    for (size_t probes = 0; probes < capacity; ++probes) {
        if (state[i] == Empty) return SIZE_MAX;
        if (state[i] == Used && keys[i] == k) return i;
        i = (i + 1) & (capacity - 1);
    }
    return SIZE_MAX;
}

size_t ConnectionLedger::findOrInsert(const PairKey& k, bool& inserted) {
    inserted = false;
    // Tombstones count toward load so probe chains always reach an empty slot
    if ((used + tombs + 1) * 2 >= capacity) {
        size_t newCap = capacity ? capacity : 64;
        while ((used + 1) * 2 >= newCap) newCap <<= 1;
        rehash(newCap);
    }
    size_t i = PairKeyHash{}(k) & (capacity - 1);
    size_t firstTomb = SIZE_MAX;
    for (;;) {
        if (state[i] == Empty) break;
        if (state[i] == Used && keys[i] == k) return i;
        if (state[i] == Tomb && firstTomb == SIZE_MAX) firstTomb = i;
        i = (i + 1) & (capacity - 1);
    }
    // Key absent: reuse the earliest tombstone on the chain, otherwise the empty slot
    if (firstTomb != SIZE_MAX) {
        i = firstTomb;
        --tombs;
    }
    keys[i] = k;
    vals[i] = Connection{};
    state[i] = Used;
    ++used;
    inserted = true;
    return i;
}

void ConnectionLedger::rehash(size_t newCap) {
    std::vector<PairKey> oldK = std::move(keys);
    std::vector<Connection> oldV = std::move(vals);
    std::vector<uint8_t> oldS = std::move(state);
    size_t oldCap = capacity;
    capacity = newCap;
    used = 0;
    tombs = 0;
    keys.assign(capacity, PairKey{});
    vals.assign(capacity, Connection{});
    state.assign(capacity, (uint8_t)Empty);
    for (size_t i = 0; i < oldCap; ++i) {
        if (oldS[i] != Used) continue;
        size_t j = PairKeyHash{}(oldK[i]) & (capacity - 1);
        while (state[j] == Used) j = (j + 1) & (capacity - 1);
        keys[j] = oldK[i];
        vals[j] = std::move(oldV[i]);
        state[j] = Used;
        ++used;
    }
}
