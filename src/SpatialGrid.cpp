/**
 * @file SpatialGrid.cpp
 * @brief Bucket storage and 3x3 neighbor queries for SpatialGrid.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SpatialGrid.h"
#include "Spark.h"

#include <algorithm>
#include <cmath>

SpatialGrid::SpatialGrid(float cellSize, float width, float height)
    : cell(std::max(1.0f, cellSize)) {
    resize(width, height);
}

void SpatialGrid::resize(float width, float height) {
    cols = std::max(1, (int)std::ceil(std::max(0.0f, width) / cell));
    rowsN = std::max(1, (int)std::ceil(std::max(0.0f, height) / cell));
    cells.assign((size_t)cols * (size_t)rowsN, std::vector<Spark*>{});
    count = 0;
}

void SpatialGrid::clear() {
    for (auto& c : cells) c.clear();
    count = 0;
}

void SpatialGrid::cellOf(float x, float y, int& cx, int& cy) const {
    cx = std::isfinite(x) ? (int)std::floor(x / cell) : 0;
    cy = std::isfinite(y) ? (int)std::floor(y / cell) : 0;
    if (cx < 0) cx = 0;
    if (cx >= cols) cx = cols - 1;
    if (cy < 0) cy = 0;
    if (cy >= rowsN) cy = rowsN - 1;
}

void SpatialGrid::insert(Spark& s) {
    int cx, cy;
    cellOf(s.x(), s.y(), cx, cy);
    cells[(size_t)cy * (size_t)cols + (size_t)cx].push_back(&s);
    ++count;
}

void SpatialGrid::neighborsOf(const Spark& s, std::vector<Spark*>& out) const {
    int cx, cy;
    cellOf(s.x(), s.y(), cx, cy);
    for (int dy = -1; dy <= 1; ++dy) {
        int ny = cy + dy;
        if (ny < 0 || ny >= rowsN) continue;
        for (int dx = -1; dx <= 1; ++dx) {
            int nx = cx + dx;
            if (nx < 0 || nx >= cols) continue;
            for (Spark* other : cells[(size_t)ny * (size_t)cols + (size_t)nx]) {
                if (other != &s) out.push_back(other);
            }
        }
    }
}
