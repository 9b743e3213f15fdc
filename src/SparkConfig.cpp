/**
 * @file SparkConfig.cpp
 * @brief Field table, validation and override parsing for SparkConfig.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "SparkConfig.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstdint>

namespace {

struct FieldDesc {
    const char* name;
    float SparkConfig::* f; // exactly one of f / i is set
    int SparkConfig::* i;
};

const std::vector<FieldDesc>& fieldTable() {
    static const std::vector<FieldDesc> table = {
        {"sparkCountDesktop",       nullptr, &SparkConfig::sparkCountDesktop},
        {"sparkCountMobile",        nullptr, &SparkConfig::sparkCountMobile},
        {"populationMin",           nullptr, &SparkConfig::populationMin},
        {"populationMax",           nullptr, &SparkConfig::populationMax},
        {"spawnRatePerSec",         &SparkConfig::spawnRatePerSec, nullptr},
        {"maxSpawnsPerFrame",       nullptr, &SparkConfig::maxSpawnsPerFrame},
        {"spawnPadding",            &SparkConfig::spawnPadding, nullptr},
        {"interactionRadius",       &SparkConfig::interactionRadius, nullptr},
        {"transferRatePerSec",      &SparkConfig::transferRatePerSec, nullptr},
        {"colorRatePerSec",         &SparkConfig::colorRatePerSec, nullptr},
        {"maxInteractionsPerFrame", nullptr, &SparkConfig::maxInteractionsPerFrame},
        {"energyDecayPerSec",       &SparkConfig::energyDecayPerSec, nullptr},
        {"energyFloor",             &SparkConfig::energyFloor, nullptr},
        {"baseRadiusMin",           &SparkConfig::baseRadiusMin, nullptr},
        {"baseRadiusMax",           &SparkConfig::baseRadiusMax, nullptr},
        {"glowMultiplier",          &SparkConfig::glowMultiplier, nullptr},
        {"lineAlphaMax",            &SparkConfig::lineAlphaMax, nullptr},
        {"maxDpr",                  &SparkConfig::maxDpr, nullptr},
        {"maxFlowParticles",        nullptr, &SparkConfig::maxFlowParticles},
        {"flowParticleSpeed",       &SparkConfig::flowParticleSpeed, nullptr},
        {"flowSpawnRate",           &SparkConfig::flowSpawnRate, nullptr},
        {"maxSpeed",                &SparkConfig::maxSpeed, nullptr},
        {"driftStrength",           &SparkConfig::driftStrength, nullptr},
        {"damping",                 &SparkConfig::damping, nullptr},
        {"lifetimeMin",             &SparkConfig::lifetimeMin, nullptr},
        {"lifetimeMax",             &SparkConfig::lifetimeMax, nullptr},
    };
    return table;
}

const FieldDesc* findField(const std::string& name) {
    for (const auto& d : fieldTable()) if (name == d.name) return &d;
    return nullptr;
}

bool parseNumber(const char* s, double& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(s, &end);
    if (end == s || errno != 0) return false;
    while (*end && std::isspace((unsigned char)*end)) ++end;
    if (*end != '\0') return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

// Clamp helpers record a correction line whenever they change a value.
void clampFloat(float& v, float lo, float hi, float fallback, const char* name, std::vector<std::string>& notes) {
    float before = v;
    if (!std::isfinite(v)) v = fallback;
    v = std::max(lo, std::min(hi, v));
    if (v != before) notes.push_back(std::string(name) + ": " + std::to_string(before) + " -> " + std::to_string(v));
}

void clampInt(int& v, int lo, int hi, const char* name, std::vector<std::string>& notes) {
    int before = v;
    v = std::max(lo, std::min(hi, v));
    if (v != before) notes.push_back(std::string(name) + ": " + std::to_string(before) + " -> " + std::to_string(v));
}

}

std::vector<std::string> SparkConfig::validate() {
    const SparkConfig d{};
    std::vector<std::string> notes;
    clampInt(populationMin, 0, 100000, "populationMin", notes);
    clampInt(populationMax, populationMin, 100000, "populationMax", notes);
    clampInt(sparkCountDesktop, 0, 100000, "sparkCountDesktop", notes);
    clampInt(sparkCountMobile, 0, 100000, "sparkCountMobile", notes);
    clampFloat(spawnRatePerSec, 0.0f, 10000.0f, d.spawnRatePerSec, "spawnRatePerSec", notes);
    clampInt(maxSpawnsPerFrame, 0, 100000, "maxSpawnsPerFrame", notes);
    clampFloat(spawnPadding, 0.0f, 1.0e6f, d.spawnPadding, "spawnPadding", notes);
    clampFloat(interactionRadius, 1.0f, 1.0e6f, d.interactionRadius, "interactionRadius", notes);
    clampFloat(transferRatePerSec, 0.0f, 1000.0f, d.transferRatePerSec, "transferRatePerSec", notes);
    clampFloat(colorRatePerSec, 0.0f, 1000.0f, d.colorRatePerSec, "colorRatePerSec", notes);
    clampInt(maxInteractionsPerFrame, 0, 10000000, "maxInteractionsPerFrame", notes);
    clampFloat(energyDecayPerSec, 0.0f, 0.999f, d.energyDecayPerSec, "energyDecayPerSec", notes);
    clampFloat(energyFloor, 0.0f, 1.0f, d.energyFloor, "energyFloor", notes);
    clampFloat(baseRadiusMin, 0.1f, 1000.0f, d.baseRadiusMin, "baseRadiusMin", notes);
    clampFloat(baseRadiusMax, baseRadiusMin, 1000.0f, d.baseRadiusMax, "baseRadiusMax", notes);
    clampFloat(glowMultiplier, 1.0f, 100.0f, d.glowMultiplier, "glowMultiplier", notes);
    clampFloat(lineAlphaMax, 0.0f, 1.0f, d.lineAlphaMax, "lineAlphaMax", notes);
    clampFloat(maxDpr, 1.0f, 8.0f, d.maxDpr, "maxDpr", notes);
    clampInt(maxFlowParticles, 0, 100000, "maxFlowParticles", notes);
    clampFloat(flowParticleSpeed, 1.0f, 1.0e6f, d.flowParticleSpeed, "flowParticleSpeed", notes);
    clampFloat(flowSpawnRate, 0.0f, 1000.0f, d.flowSpawnRate, "flowSpawnRate", notes);
    clampFloat(maxSpeed, 0.0f, 1.0e6f, d.maxSpeed, "maxSpeed", notes);
    clampFloat(driftStrength, 0.0f, 1.0e6f, d.driftStrength, "driftStrength", notes);
    clampFloat(damping, 0.0f, 1.0f, d.damping, "damping", notes);
    clampFloat(lifetimeMin, 1.0f, 1.0e9f, d.lifetimeMin, "lifetimeMin", notes);
    clampFloat(lifetimeMax, lifetimeMin, 1.0e9f, d.lifetimeMax, "lifetimeMax", notes);
    return notes;
}

bool SparkConfig::set(const std::string& name, const std::string& value) {
    const FieldDesc* fd = findField(name);
    if (!fd) return false;
    double v = 0.0;
    if (!parseNumber(value.c_str(), v)) return false;
    if (fd->f) {
        this->*(fd->f) = (float)v;
    } else {
        if (v < (double)INT32_MIN || v > (double)INT32_MAX) return false;
        this->*(fd->i) = (int)std::lround(v);
    }
    return true;
}

bool SparkConfig::get(const std::string& name, double& out) const {
    const FieldDesc* fd = findField(name);
    if (!fd) return false;
    out = fd->f ? (double)(this->*(fd->f)) : (double)(this->*(fd->i));
    return true;
}

std::vector<std::string> SparkConfig::fieldNames() {
    std::vector<std::string> names;
    names.reserve(fieldTable().size());
    for (const auto& d : fieldTable()) names.emplace_back(d.name);
    return names;
}

std::string SparkConfig::envNameFor(const std::string& name) {
    std::string out = "SPARKS_";
    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (std::isupper((unsigned char)c) && i > 0) out += '_';
        out += (char)std::toupper((unsigned char)c);
    }
    return out;
}

std::vector<std::string> applyEnvironmentOverrides(SparkConfig& cfg) {
    std::vector<std::string> warnings;
    for (const auto& name : SparkConfig::fieldNames()) {
        std::string env = SparkConfig::envNameFor(name);
        const char* v = std::getenv(env.c_str());
        if (!v) continue;
        if (!cfg.set(name, v)) warnings.push_back("ignoring " + env + "='" + v + "': not a number");
    }
    return warnings;
}

bool applyArgumentOverride(SparkConfig& cfg, int argc, char** argv, int& idx, std::string& warning) {
    warning.clear();
    if (idx < 0 || idx >= argc || !argv[idx]) return false;
    std::string a(argv[idx]);
    if (a.rfind("--", 0) != 0) return false;
    std::string body = a.substr(2);
    std::string name, value;
    bool inlineValue = false;
    size_t eq = body.find('=');
    if (eq != std::string::npos) {
        name = body.substr(0, eq);
        value = body.substr(eq + 1);
        inlineValue = true;
    } else {
        name = body;
    }
    if (!findField(name)) return false;
    if (!inlineValue) {
        if (idx + 1 >= argc || !argv[idx + 1]) {
            warning = "missing value for --" + name;
            return false;
        }
        value = argv[idx + 1];
    }
    if (!cfg.set(name, value)) {
        warning = "ignoring --" + name + "='" + value + "': not a number";
        if (!inlineValue) ++idx;
        return false;
    }
    if (!inlineValue) ++idx;
    return true;
}
