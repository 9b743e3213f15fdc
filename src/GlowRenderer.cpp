/**
 * @file GlowRenderer.cpp
 * @brief Glow field rasterization and ncurses painting of spark snapshots.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GlowRenderer.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace {
inline float clamp01(float v) { return std::max(0.0f, std::min(1.0f, v)); }

constexpr float CoreGlyphThreshold = 0.35f;
constexpr float FlowGlyphThreshold = 0.25f;
constexpr float LineGlyphThreshold = 0.08f;
constexpr float BoldThreshold = 0.6f;

struct PairRef { float r, g, b; short pair; };
// Normalized reference hues for curses pairs 2..8 (red, green, yellow, blue, magenta, cyan, white)
const std::array<PairRef, 7> kPairRefs = {{
    {1.0f, 0.0f, 0.0f, 2},
    {0.0f, 1.0f, 0.0f, 3},
    {1.0f, 1.0f, 0.0f, 4},
    {0.0f, 0.0f, 1.0f, 5},
    {1.0f, 0.0f, 1.0f, 6},
    {0.0f, 1.0f, 1.0f, 7},
    {1.0f, 1.0f, 1.0f, 8},
}};

char slopeGlyph(float dx, float dy) {
    float ax = std::fabs(dx), ay = std::fabs(dy);
    if (ay < 0.4f * ax) return '-';
    if (ax < 0.4f * ay) return '|';
    // Screen rows grow downward
    return (dx * dy > 0.0f) ? '\\' : '/';
}
}

char GlowField::glyphFor(float intensity) {
    const int n = (int)std::strlen(Ramp);
    int idx = (int)(clamp01(intensity) * (float)(n - 1) + 0.5f);
    if (idx < 0) idx = 0;
    if (idx > n - 1) idx = n - 1;
    return Ramp[idx];
}

short GlowField::colorPairFor(const Rgb& c) {
    float m = std::max(c.r, std::max(c.g, c.b));
    if (!(m > 0.0f)) return 8;
    float r = c.r / m, g = c.g / m, b = c.b / m;
    short best = 8;
    float bestD = 1e9f;
    for (const auto& ref : kPairRefs) {
        float d = (r - ref.r) * (r - ref.r) + (g - ref.g) * (g - ref.g) + (b - ref.b) * (b - ref.b);
        if (d < bestD) { bestD = d; best = ref.pair; }
    }
    return best;
}

float GlowField::intensityAt(int x, int y) const {
    if (x < 0 || y < 0 || x >= cols || y >= rowsN) return 0.0f;
    return clamp01(acc[(size_t)y * (size_t)cols + (size_t)x].glow);
}

void GlowField::addLight(int cx, int cy, float amount, const Rgb& c) {
    if (cx < 0 || cy < 0 || cx >= cols || cy >= rowsN || !(amount > 0.0f)) return;
    Accum& a = acc[(size_t)cy * (size_t)cols + (size_t)cx];
    a.glow += amount;
    a.r += c.r * amount;
    a.g += c.g * amount;
    a.b += c.b * amount;
    a.wsum += amount;
}

void GlowField::splatSpark(const SparkSystem::SparkView& s, float sx, float sy) {
    const float cx = s.x * sx;
    const float cy = s.y * sy;
    const float rx = std::max(0.5f, s.glowRadius * sx);
    const float ry = std::max(0.5f, s.glowRadius * sy);
    const int x0 = std::max(0, (int)std::floor(cx - rx));
    const int x1 = std::min(cols - 1, (int)std::ceil(cx + rx));
    const int y0 = std::max(0, (int)std::floor(cy - ry));
    const int y1 = std::min(rowsN - 1, (int)std::ceil(cy + ry));
    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            const float nx = ((float)x + 0.5f - cx) / rx;
            const float ny = ((float)y + 0.5f - cy) / ry;
            const float nd = std::sqrt(nx * nx + ny * ny);
            if (nd >= 1.0f) continue;
            const float falloff = (1.0f - nd) * (1.0f - nd);
            float light = s.alpha * falloff * 0.8f;
            // Transfer ring: a faint band around the halo middle
            if (s.ringAlpha > 0.05f && nd > 0.45f && nd < 0.75f) light += s.ringAlpha * 0.4f;
            addLight(x, y, light, s.color);
        }
    }
    const int ix = (int)std::floor(cx);
    const int iy = (int)std::floor(cy);
    if (ix >= 0 && iy >= 0 && ix < cols && iy < rowsN) {
        acc[(size_t)iy * (size_t)cols + (size_t)ix].core += s.alpha;
        addLight(ix, iy, s.alpha, s.color);
    }
}

void GlowField::traceConnection(const SparkSystem::ConnectionView& c, float sx, float sy) {
    const float ax = c.ax * sx, ay = c.ay * sy;
    const float bx = c.bx * sx, by = c.by * sy;
    const float dx = bx - ax, dy = by - ay;
    const int steps = std::max(1, (int)std::ceil(std::max(std::fabs(dx), std::fabs(dy))));
    const char glyph = slopeGlyph(dx, dy);
    // Connection alpha tops out near 0.35; rescale so full-strength links read clearly
    const float vis = clamp01(c.alpha * 2.5f);
    for (int i = 0; i <= steps; ++i) {
        const float t = (float)i / (float)steps;
        const int x = (int)std::floor(ax + dx * t);
        const int y = (int)std::floor(ay + dy * t);
        if (x < 0 || y < 0 || x >= cols || y >= rowsN) continue;
        Accum& a = acc[(size_t)y * (size_t)cols + (size_t)x];
        if (vis > a.line) {
            a.line = vis;
            a.lineGlyph = glyph;
        }
        addLight(x, y, vis * 0.25f, colormix::mix(c.colorA, c.colorB, t));
    }
}

void GlowField::rasterize(const SparkSystem::FrameSnapshot& snap, int cols_, int rows_) {
    cols = std::max(0, cols_);
    rowsN = std::max(0, rows_);
    acc.assign((size_t)cols * (size_t)rowsN, Accum{});
    cells.assign((size_t)cols * (size_t)rowsN, Cell{});
    if (cols == 0 || rowsN == 0 || !(snap.width > 0.0f) || !(snap.height > 0.0f)) return;

    const float sx = (float)cols / snap.width;
    const float sy = (float)rowsN / snap.height;

    for (const auto& c : snap.connections) traceConnection(c, sx, sy);
    for (const auto& s : snap.sparks) splatSpark(s, sx, sy);
    for (const auto& f : snap.flows) {
        const int x = (int)std::floor(f.x * sx);
        const int y = (int)std::floor(f.y * sy);
        if (x < 0 || y < 0 || x >= cols || y >= rowsN) continue;
        Accum& a = acc[(size_t)y * (size_t)cols + (size_t)x];
        a.flow = std::max(a.flow, f.alpha);
        addLight(x, y, f.alpha * 0.5f, f.color);
    }

    for (size_t i = 0; i < acc.size(); ++i) {
        const Accum& a = acc[i];
        Cell& cell = cells[i];
        const float glow = clamp01(a.glow);
        if (a.flow > FlowGlyphThreshold) {
            cell.glyph = '*';
            cell.bold = true;
        } else if (a.core > CoreGlyphThreshold) {
            cell.glyph = a.core > BoldThreshold ? '@' : 'o';
            cell.bold = a.core > BoldThreshold;
        } else if (a.line > LineGlyphThreshold && a.line >= glow * 0.8f) {
            cell.glyph = a.lineGlyph;
            cell.bold = a.line > BoldThreshold;
        } else {
            cell.glyph = glyphFor(glow);
            cell.bold = glow > BoldThreshold;
        }
        if (cell.glyph != ' ' && a.wsum > 0.0f) {
            cell.colorPair = colorPairFor(Rgb{a.r / a.wsum, a.g / a.wsum, a.b / a.wsum});
        }
    }
}

void GlowRenderer::initColors() {
    if (!has_colors()) return;
    start_color();
    use_default_colors();
    // 1..8 map to the standard colors; 9..16 repeat them and are drawn with A_BOLD
    const short base[8] = {COLOR_BLACK, COLOR_RED, COLOR_GREEN, COLOR_YELLOW,
                           COLOR_BLUE, COLOR_MAGENTA, COLOR_CYAN, COLOR_WHITE};
    for (short i = 0; i < 8; ++i) {
        init_pair((short)(i + 1), base[i], -1);
        init_pair((short)(i + 9), base[i], -1);
    }
}

void GlowRenderer::draw(const SparkSystem::FrameSnapshot& snap) {
    if (!win) return;
    int rows, cols;
    getmaxyx(win, rows, cols);
    const int fieldRows = rows - 1; // last row is the status line
    if (fieldRows < 1 || cols < 1) return;
    field.rasterize(snap, cols, fieldRows);
    werase(win);
    for (int y = 0; y < fieldRows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const GlowField::Cell& c = field.at(x, y);
            if (c.glyph == ' ') continue;
            short pair = c.colorPair;
            if (c.bold && pair > 0) pair = (short)(pair + 8);
            if (c.bold) wattron(win, A_BOLD);
            if (pair > 0) wattron(win, COLOR_PAIR(pair));
            mvwaddch(win, y, x, (chtype)(unsigned char)c.glyph);
            if (pair > 0) wattroff(win, COLOR_PAIR(pair));
            if (c.bold) wattroff(win, A_BOLD);
        }
    }
    wnoutrefresh(win);
}

std::string GlowRenderer::statusText(const SparkSystem::FrameSnapshot& snap, const Status& status) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
                  " Sparks: %zu/%d  Links: %zu  Flows: %zu  Pairs: %d  %.0f fps%s  %s | [p]ause  [r]estart  [q]uit",
                  snap.sparks.size(), snap.targetPopulation, snap.connections.size(), snap.flows.size(),
                  snap.interactions, status.fps, status.lowPower ? "  low-power" : "",
                  status.paused ? "PAUSED" : "RUNNING");
    return std::string(buf);
}

void GlowRenderer::drawStatusLine(const SparkSystem::FrameSnapshot& snap, const Status& status) {
    if (!win) return;
    int rows, cols;
    getmaxyx(win, rows, cols);
    if (rows < 1 || cols < 1) return;
    const int y = rows - 1;
    std::string text = statusText(snap, status);
    if ((int)text.size() > cols) text.resize((size_t)cols);
    wmove(win, y, 0);
    wclrtoeol(win);
    wattron(win, A_REVERSE);
    mvwaddnstr(win, y, 0, text.c_str(), cols);
    wattroff(win, A_REVERSE);
    wnoutrefresh(win);
}
