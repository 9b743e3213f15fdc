/**
 * @file Logger.cpp
 * @brief Session-bracketed file logging with level filtering.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Logger.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <mutex>
#include <unistd.h>

namespace {
std::mutex g_logMtx;
std::ofstream g_log;
bool g_inited = false;
std::atomic<int> g_level{static_cast<int>(Logger::Level::Info)};
std::chrono::steady_clock::time_point g_sessionStart;

std::string commandName(const char* argv0) {
    std::string p = argv0 ? std::string(argv0) : std::string();
    size_t pos = p.find_last_of("/\\");
    std::string base = (pos == std::string::npos) ? p : p.substr(pos + 1);
    return base.empty() ? std::string("sparks") : base;
}

// Wall clock with milliseconds, followed by seconds since the session started.
// Frame-level messages are easier to line up against the uptime than the wall clock.
std::string stamp() {
    using namespace std::chrono;
    const auto wall = system_clock::now();
    const std::time_t t = system_clock::to_time_t(wall);
    const long ms = (long)(duration_cast<milliseconds>(wall.time_since_epoch()).count() % 1000);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tmv);
    const double up = g_inited ? duration<double>(steady_clock::now() - g_sessionStart).count() : 0.0;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s.%03ld +%.3fs", date, ms, up);
    return std::string(buf);
}

bool parseLevel(const char* s, Logger::Level& out) {
    if (!s) return false;
    std::string v(s);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug") out = Logger::Level::Debug;
    else if (v == "info") out = Logger::Level::Info;
    else if (v == "warn" || v == "warning") out = Logger::Level::Warn;
    else if (v == "error") out = Logger::Level::Error;
    else if (v == "none" || v == "off") out = Logger::Level::None;
    else return false;
    return true;
}

void setLevelFromEnv() {
    Logger::Level lvl;
    // Project-specific variable wins over the generic one.
    if (parseLevel(std::getenv("SPARKS_LOG_LEVEL"), lvl) || parseLevel(std::getenv("LOG_LEVEL"), lvl)) {
        g_level.store((int)lvl);
    }
}

const char* levelName(Logger::Level lvl) {
    switch (lvl) {
        case Logger::Level::Debug: return "DEBUG";
        case Logger::Level::Info:  return "INFO";
        case Logger::Level::Warn:  return "WARN";
        case Logger::Level::Error: return "ERROR";
        default:                   return "NONE";
    }
}
}

void Logger::initFromArgv0(const char* argv0) {
    init("./" + commandName(argv0) + ".log");
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_inited) return;
    // Append so earlier sessions survive; each session is bracketed by marker lines.
    g_log.open(filename, std::ios::out | std::ios::app);
    if (!g_log.is_open()) return;
    g_inited = true;
    g_sessionStart = std::chrono::steady_clock::now();
    setLevelFromEnv();
    g_log << "===== session start " << stamp() << " pid " << (long)::getpid()
          << " level " << levelName((Level)g_level.load()) << " =====" << '\n';
    g_log.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited) return;
    g_log << "===== session end   " << stamp() << " =====" << std::endl;
    g_log.close();
    g_inited = false;
}

bool Logger::isOpen() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    return g_inited;
}

bool Logger::enabled(Level lvl) {
    return lvl != Level::None && (int)lvl >= g_level.load();
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    if (!enabled(lvl)) return;
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_inited || !g_log.is_open()) return;
    g_log << stamp() << " [" << levelName(lvl) << "] " << msg << '\n';
    if (lvl >= Level::Warn) g_log.flush();
}

void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }
void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setLevel(Level lvl) { g_level.store((int)lvl); }
Logger::Level Logger::level() { return (Level)g_level.load(); }
