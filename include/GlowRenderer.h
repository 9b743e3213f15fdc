/**
 * @file GlowRenderer.h
 * @brief Terminal rendering of SparkSystem snapshots: a character-cell glow field drawn with ncurses.
 *
 * GlowField does the rasterization and has no curses dependency; GlowRenderer only paints cells.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <ncurses.h>
#include <string>
#include <vector>

#include "ColorMix.h"
#include "SparkSystem.h"

/**
 * @class GlowField
 * @brief Accumulates glow, connection lines and flow tokens of a snapshot into a cols x rows grid.
 */
class GlowField {
public:
    /** @brief One rendered character cell. */
    struct Cell {
        char glyph{' '};
        short colorPair{0}; /**< 0 = default colors */
        bool bold{false};
    };

    /** @brief Intensity ramp used for pure glow cells, dimmest first. */
    static constexpr const char* Ramp = " .,:;=+%#";

    /** @brief Resample @p snap onto a @p cols x @p rows grid (viewport scaled to fit). */
    void rasterize(const SparkSystem::FrameSnapshot& snap, int cols, int rows);

    int columns() const { return cols; }
    int rows() const { return rowsN; }
    const Cell& at(int x, int y) const { return cells[(size_t)y * (size_t)cols + (size_t)x]; }
    /** @brief Accumulated light at (x,y), clamped to [0,1]. */
    float intensityAt(int x, int y) const;

    /** @brief Glyph for a glow intensity in [0,1] (values outside are clamped). */
    static char glyphFor(float intensity);
    /** @brief Nearest of the 8 base curses colors, as a color pair id in 2..8 (black is never chosen). */
    static short colorPairFor(const Rgb& c);

private:
    /** @brief Per-cell accumulators before glyph selection. */
    struct Accum {
        float glow{0.0f};
        float core{0.0f};
        float line{0.0f};
        float flow{0.0f};
        float r{0.0f}, g{0.0f}, b{0.0f}, wsum{0.0f};
        char lineGlyph{' '};
    };

    void addLight(int cx, int cy, float amount, const Rgb& c);
    void splatSpark(const SparkSystem::SparkView& s, float sx, float sy);
    void traceConnection(const SparkSystem::ConnectionView& c, float sx, float sy);

    int cols{0};
    int rowsN{0};
    std::vector<Accum> acc;
    std::vector<Cell> cells;
};

/**
 * @class GlowRenderer
 * @brief Paints a GlowField and a status line into an ncurses window. A null window makes every call a no-op.
 */
class GlowRenderer {
public:
    /** @brief Host-side values shown on the status line. */
    struct Status {
        double fps{0.0};
        bool paused{false};
        bool lowPower{false};
    };

    explicit GlowRenderer(WINDOW* win = nullptr) : win(win) {}

    /** @brief Initialize curses color pairs 1..16 (9..16 are drawn bold). Safe without color support. */
    static void initColors();

    void setWindow(WINDOW* w) { win = w; }
    /** @brief Rasterize @p snap over the window minus its last row and paint it. */
    void draw(const SparkSystem::FrameSnapshot& snap);
    /** @brief Draw the bottom status line. */
    void drawStatusLine(const SparkSystem::FrameSnapshot& snap, const Status& status);
    /** @brief Format the status text (exposed for tests). */
    static std::string statusText(const SparkSystem::FrameSnapshot& snap, const Status& status);

private:
    WINDOW* win{nullptr};
    GlowField field;
};
