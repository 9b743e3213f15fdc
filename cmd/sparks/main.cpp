/**
 * @file main.cpp
 * @brief Sparks entry point: parses overrides, drives SparkSystem from a steady clock and renders the
 *        glow field with ncurses.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <ncurses.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include "GlowRenderer.h"
#include "HostCapabilities.h"
#include "Logger.h"
#include "SparkConfig.h"
#include "SparkSystem.h"

static volatile sig_atomic_t g_stop = 0;
static volatile sig_atomic_t g_needs_full_redraw = 0;
static bool g_curses_inited = false;

static void onStopSignal(int) { g_stop = 1; }

static void installHandler(int sig, void (*fn)(int)) {
    struct sigaction sa{};
    sa.sa_handler = fn;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(sig, &sa, nullptr);
}

static void closeCurses() {
    if (!g_curses_inited) return;
    endwin();
    g_curses_inited = false;
}

/** @brief Terminal modes the frame loop relies on: raw keys, no echo, hidden cursor, non-blocking getch. */
static void applyCursesModes() {
    cbreak();
    noecho();
    curs_set(0);
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    timeout(0);
    GlowRenderer::initColors();
    g_curses_inited = true;
}

static void onSuspend(int);

// Resume after ^Z: re-arm suspend, restore the saved tty and force a full repaint
static void onResume(int) {
    installHandler(SIGTSTP, onSuspend);
    reset_prog_mode();
    applyCursesModes();
    clearok(stdscr, TRUE);
    refresh();
    g_needs_full_redraw = 1;
}

// ^Z: hand the tty back to the shell, then stop with the default action
static void onSuspend(int) {
    if (g_curses_inited) def_prog_mode();
    closeCurses();
    installHandler(SIGTSTP, SIG_DFL);
    raise(SIGTSTP);
}

static bool parseFloat(const char* s, float& out) {
    if (!s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    out = static_cast<float>(v);
    return true;
}

// "8x16" -> 8, 16
static bool parseCellPx(const char* s, float& cw, float& ch) {
    if (!s) return false;
    const char* x = std::strchr(s, 'x');
    if (!x) return false;
    float a, b;
    std::string left(s, (size_t)(x - s));
    if (!parseFloat(left.c_str(), a) || !parseFloat(x + 1, b)) return false;
    if (!(a > 0.0f) || !(b > 0.0f)) return false;
    cw = a; ch = b;
    return true;
}

static void printUsage(const char* argv0) {
    std::printf("usage: %s [--low-power] [--density=F] [--cell-px=WxH] [--fps=N] [--<field>=value ...]\n", argv0);
    std::printf("fields (also settable as SPARKS_<FIELD> environment variables):\n");
    SparkConfig defaults;
    for (const auto& name : SparkConfig::fieldNames()) {
        double v = 0.0;
        defaults.get(name, v);
        std::printf("  --%-24s default %g   (%s)\n", name.c_str(), v, SparkConfig::envNameFor(name).c_str());
    }
}

/** @brief Terminal size expressed as a pixel viewport (status line excluded). */
static SparkSystem::Viewport viewportFor(int rows, int cols, float cellW, float cellH) {
    SparkSystem::Viewport vp;
    vp.width = (float)std::max(1, cols) * cellW;
    vp.height = (float)std::max(1, rows - 1) * cellH;
    vp.dpr = 1.0f;
    return vp;
}

int main(int argc, char** argv) {
    Logger::initFromArgv0((argc > 0) ? argv[0] : "sparks");
    Logger::info("sparks starting");
    std::set_terminate([]{
        try {
            auto ep = std::current_exception();
            if (ep) {
                try { std::rethrow_exception(ep); }
                catch (const std::exception& e) { Logger::logException("std::terminate (sparks)", e); }
                catch (...) { Logger::logUnknownException("std::terminate (sparks)"); }
            } else {
                Logger::error("std::terminate (sparks): no active exception");
            }
        } catch (...) {}
        closeCurses();
        Logger::shutdown();
        std::_Exit(1);
    });
    try {
    // Configuration: defaults, then SPARKS_* env, then command line
    SparkConfig cfg;
    for (const auto& w : applyEnvironmentOverrides(cfg)) Logger::warn(w);

    bool lowPower = false;
    float density = 1.0f;
    float cellW = 8.0f, cellH = 16.0f;
    float fps = 60.0f;
    float tmp;
    if (const char* e = std::getenv("SPARKS_LOW_POWER")) lowPower = (std::strcmp(e, "0") != 0);

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        std::string warning;
        if (a == "-h" || a == "--help") {
            printUsage(argv[0]);
            Logger::shutdown();
            return 0;
        } else if (a == "--low-power") {
            lowPower = true;
        } else if (a.rfind("--density=", 0) == 0) {
            if (parseFloat(a.c_str() + std::strlen("--density="), tmp) && tmp > 0.0f) density = tmp;
            else Logger::warn("ignoring " + a);
        } else if (a.rfind("--cell-px=", 0) == 0) {
            if (!parseCellPx(a.c_str() + std::strlen("--cell-px="), cellW, cellH)) Logger::warn("ignoring " + a);
        } else if (a.rfind("--fps=", 0) == 0) {
            if (parseFloat(a.c_str() + std::strlen("--fps="), tmp) && tmp >= 1.0f && tmp <= 240.0f) fps = tmp;
            else Logger::warn("ignoring " + a);
        } else if (applyArgumentOverride(cfg, argc, argv, i, warning)) {
            continue;
        } else if (!warning.empty()) {
            Logger::warn(warning);
        } else {
            Logger::warn("unknown argument: " + a);
        }
    }

    installHandler(SIGINT, onStopSignal);
    installHandler(SIGTERM, onStopSignal);
    installHandler(SIGTSTP, onSuspend);
    installHandler(SIGCONT, onResume);

    initscr();
    std::atexit(closeCurses);
    applyCursesModes();

    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    if (rows < 2 || cols < 1) {
        closeCurses();
        Logger::error("terminal too small: " + std::to_string(cols) + "x" + std::to_string(rows));
        Logger::shutdown();
        return 1;
    }

    auto caps = std::make_shared<StaticCapabilities>(lowPower, (double)density);
    auto makeSystem = [&](int r, int c) {
        return std::make_unique<SparkSystem>(cfg, viewportFor(r, c, cellW, cellH), caps);
    };
    std::unique_ptr<SparkSystem> system = makeSystem(rows, cols);
    GlowRenderer renderer(stdscr);
    Logger::info("sparks viewport " + std::to_string(cols) + "x" + std::to_string(rows) +
                 " cells, target population " + std::to_string(system->targetPopulation()));

    using namespace std::chrono;
    const auto frameBudget = duration_cast<steady_clock::duration>(duration<double>(1.0 / fps));
    const auto start = steady_clock::now();
    auto last = start;
    double simMs = 0.0;   // simulation clock; frozen while paused
    double fpsEstimate = 0.0;
    bool paused = false;
    bool done = false;

    system->seed(simMs);
    while (!done) {
        auto frameStart = steady_clock::now();
        double realDeltaMs = duration<double, std::milli>(frameStart - last).count();
        last = frameStart;
        if (realDeltaMs > 0.0) {
            double inst = 1000.0 / realDeltaMs;
            fpsEstimate = (fpsEstimate <= 0.0) ? inst : fpsEstimate * 0.9 + inst * 0.1;
        }
        if (g_stop) done = true;

        int ch = getch();
        switch (ch) {
            case 'q': case 'Q':
                Logger::info("quit requested"); done = true; break;
            case 'p': case 'P': case ' ':
                paused = !paused; Logger::info(std::string("paused = ") + (paused ? "true" : "false")); break;
            case 'r': case 'R':
                getmaxyx(stdscr, rows, cols);
                system = makeSystem(rows, cols);
                system->seed(simMs);
                Logger::info("restart requested");
                break;
            case KEY_RESIZE:
                g_needs_full_redraw = 1;
                break;
            default:
                break;
        }
        if (g_needs_full_redraw) {
            getmaxyx(stdscr, rows, cols);
            system->resize(viewportFor(rows, cols, cellW, cellH));
            clearok(stdscr, TRUE);
            g_needs_full_redraw = 0;
        }

        if (!paused) {
            simMs += realDeltaMs;
            system->update(simMs);
        }
        GlowRenderer::Status status;
        status.fps = paused ? 0.0 : fpsEstimate;
        status.paused = paused;
        status.lowPower = lowPower;
        renderer.draw(system->snapshot());
        renderer.drawStatusLine(system->snapshot(), status);
        doupdate();

        auto elapsed = steady_clock::now() - frameStart;
        if (elapsed < frameBudget) std::this_thread::sleep_for(frameBudget - elapsed);
    }

    closeCurses();
    Logger::info("sparks terminating after " + std::to_string(system->frameNumber()) + " frames");
    Logger::shutdown();
    return 0;
    } catch (const std::exception& e) {
        closeCurses();
        Logger::logException("unhandled exception (sparks)", e);
        Logger::shutdown();
        return 2;
    } catch (...) {
        closeCurses();
        Logger::logUnknownException("unhandled exception (sparks)");
        Logger::shutdown();
        return 2;
    }
}
