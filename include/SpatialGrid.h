/**
 * @file SpatialGrid.h
 * @brief Uniform spatial hash grid rebuilt every frame for neighbor discovery.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <cstddef>
#include <vector>

class Spark;

/**
 * @class SpatialGrid
 * @brief Buckets sparks into square cells of the interaction radius.
 *
 * The grid holds raw, non-owning pointers valid only until the next clear(); it is never updated
 * incrementally because a fast spark can cross more than one cell per frame.
 */
class SpatialGrid {
public:
    SpatialGrid(float cellSize, float width, float height);

    /** @brief Re-dimension for a new viewport; drops current contents. */
    void resize(float width, float height);
    /** @brief Empty every cell, keeping bucket capacity for the next rebuild. */
    void clear();
    /** @brief Bucket @p s by its current position (positions outside the grid clamp to edge cells). */
    void insert(Spark& s);

    /**
     * @brief Append to @p out every spark in the 3x3 block of cells around @p s, excluding @p s.
     *
     * No cross-cell deduplication is performed; callers resolve each pair by key.
     */
    void neighborsOf(const Spark& s, std::vector<Spark*>& out) const;

    int columns() const { return cols; }
    int rows() const { return rowsN; }
    float cellSize() const { return cell; }
    /** @brief Number of sparks inserted since the last clear(). */
    size_t size() const { return count; }
    /** @brief Cell coordinates for a point, clamped into the grid. */
    void cellOf(float x, float y, int& cx, int& cy) const;

private:
    float cell;                              /**< cell edge length */
    int cols{1};                             /**< cells across */
    int rowsN{1};                            /**< cells down */
    size_t count{0};                         /**< inserted sparks */
    std::vector<std::vector<Spark*>> cells;  /**< row-major buckets */
};
