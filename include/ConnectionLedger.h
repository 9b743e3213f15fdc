/**
 * @file ConnectionLedger.h
 * @brief Sparse pair-keyed store of smoothed spark-to-spark connection strengths.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

class Spark;

/**
 * @struct PairKey
 * @brief Unordered pair of spark ids in canonical order (lo < hi), so key(a,b) == key(b,a).
 */
struct PairKey {
    uint64_t lo{0};
    uint64_t hi{0};

    static PairKey of(uint64_t a, uint64_t b) { return a < b ? PairKey{a, b} : PairKey{b, a}; }
    bool operator==(const PairKey& o) const { return lo == o.lo && hi == o.hi; }
    bool operator!=(const PairKey& o) const { return !(*this == o); }
};

/** @brief 64-bit mix of both ids (splitmix finalizer). */
struct PairKeyHash {
    size_t operator()(const PairKey& k) const {
        uint64_t x = k.lo * 0x9E3779B185EBCA87ULL ^ k.hi;
        x ^= (x >> 33);
        x *= 0xff51afd7ed558ccdULL;
        x ^= (x >> 33);
        x *= 0xc4ceb9fe1a85ec53ULL;
        x ^= (x >> 33);
        return (size_t)x;
    }
};

/**
 * @struct Connection
 * @brief Persisted proximity relationship between two sparks.
 *
 * Endpoints are observed, not owned; a connection whose endpoint expired is pruned by the engine.
 */
struct Connection {
    std::weak_ptr<Spark> a;   /**< endpoint with the smaller id */
    std::weak_ptr<Spark> b;   /**< endpoint with the larger id */
    float strength{0.0f};     /**< smoothed closeness in [0,1] */
    uint64_t activeFrame{0};  /**< last frame number in which the pair was resolved within range */
};

/**
 * @class ConnectionLedger
 * @brief Open-addressing hash map PairKey -> Connection (linear probing, tombstones, load factor <= 0.5).
 *
 * References returned by find()/obtain() stay valid until the next insertion.
 */
class ConnectionLedger {
public:
    /** @brief First-order approach rate toward the target weight (1/s). */
    static constexpr float SmoothingPerSec = 6.0f;
    /** @brief Linear decay rate of connections not resolved this frame (1/s). */
    static constexpr float FadePerSec = 4.0f;
    /** @brief Faded strengths below this snap to 0. */
    static constexpr float FadeResidue = 1e-6f;

    /**
     * @brief Smoothstep closeness: 1 at distance 0, 0 at and beyond @p radius.
     */
    static float targetWeight(float distance, float radius);

    /**
     * @brief Move @p strength toward @p target by min(1, SmoothingPerSec*dt) of the gap, clamped to [0,1].
     *
     * With dt < 1/SmoothingPerSec the result never crosses the target.
     */
    static float approach(float strength, float target, float dt);

    /** @brief Strength after one inactive frame: linear fade, floored at 0. */
    static float fade(float strength, float dt);

    /** @brief Lookup; nullptr if absent. */
    Connection* find(const PairKey& k);
    const Connection* find(const PairKey& k) const;

    /**
     * @brief Return the connection for @p k, creating it with strength 0 and endpoints @p a / @p b
     *        (assigned in key order) when absent.
     */
    Connection& obtain(const PairKey& k, const std::shared_ptr<Spark>& a, const std::shared_ptr<Spark>& b,
                       bool* created = nullptr);

    /** @brief Remove @p k; false if absent. */
    bool erase(const PairKey& k);

    /** @brief Remove every entry for which @p pred(key, connection) is true; returns the count removed. */
    template <class Pred>
    size_t eraseIf(Pred&& pred) {
        std::vector<PairKey> doomed;
        for (size_t i = 0; i < capacity; ++i) {
            if (state[i] == Used && pred(keys[i], vals[i])) doomed.push_back(keys[i]);
        }
        for (const auto& k : doomed) erase(k);
        return doomed.size();
    }

    template <class F>
    void forEach(F&& f) {
        for (size_t i = 0; i < capacity; ++i) if (state[i] == Used) f(keys[i], vals[i]);
    }

    template <class F>
    void forEach(F&& f) const {
        for (size_t i = 0; i < capacity; ++i) if (state[i] == Used) f(keys[i], vals[i]);
    }

    void clear();
    void reserve(size_t n);
    size_t size() const { return used; }
    bool empty() const { return used == 0; }

private:
    enum : uint8_t { Empty = 0, Used = 1, Tomb = 2 };

    /** @brief Slot index holding @p k, or SIZE_MAX. */
    size_t locate(const PairKey& k) const;
    /** @brief Slot index for @p k, inserting a default entry if needed. */
    size_t findOrInsert(const PairKey& k, bool& inserted);
    void rehash(size_t newCap);

    size_t used{0};
    size_t tombs{0};
    size_t capacity{0};
    std::vector<PairKey> keys;
    std::vector<Connection> vals;
    std::vector<uint8_t> state;
};
