/**
 * @file EngineConfig.cpp
 * @brief Config parsing: environment overrides first, then command-line flags, each value validated.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "EngineConfig.h"
#include "Logger.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace {
long long parseInteger(const std::string& text, long long lo, long long hi, const char* what) {
    if (text.empty()) throw ConfigError(std::string(what) + ": empty value");
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno != 0) {
        throw ConfigError(std::string(what) + ": not an integer '" + text + "'");
    }
    if (v < lo || v > hi) {
        throw ConfigError(std::string(what) + ": " + text + " outside [" + std::to_string(lo) + "," +
                          std::to_string(hi) + "]");
    }
    return v;
}

bool parseBool(const std::string& text, const char* what) {
    std::string v(text);
    for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError(std::string(what) + ": not a boolean '" + text + "'");
}

struct Option {
    const char* env;        /**< environment variable, or nullptr */
    const char* longFlag;   /**< "--name" */
    const char* shortFlag;  /**< "-x", or nullptr */
    bool takesValue;        /**< false for switches such as --flush-on-stop */
    std::function<void(EngineConfig&, const std::string&)> apply;
};

const std::vector<Option>& options() {
    static const std::vector<Option> table = {
        {"SANDGLASS_QUANTUM", "--quantum", "-q", true, [](EngineConfig& c, const std::string& v) {
             c.quantumSeconds = static_cast<std::uint32_t>(parseInteger(v, 1, 86400, "quantum"));
         }},
        {"SANDGLASS_MAX_PER_TICK", "--max-per-tick", "-m", true, [](EngineConfig& c, const std::string& v) {
             c.maxPerTick = static_cast<std::size_t>(parseInteger(v, 1, 4096, "max-per-tick"));
         }},
        {"SANDGLASS_SPAWN_POLICY", "--policy", "-p", true, [](EngineConfig& c, const std::string& v) {
             auto p = parseSpawnPolicy(v);
             if (!p) throw ConfigError("policy: unknown spawn policy '" + v + "'");
             c.spawnPolicy = *p;
         }},
        {"SANDGLASS_SEED", "--seed", "-s", true, [](EngineConfig& c, const std::string& v) {
             c.seed = static_cast<std::uint32_t>(parseInteger(v, 0, 0xFFFFFFFFLL, "seed"));
         }},
        {"SANDGLASS_PHYSICS_MS", "--physics-ms", nullptr, true, [](EngineConfig& c, const std::string& v) {
             c.physicsMs = static_cast<int>(parseInteger(v, 1, 2000, "physics-ms"));
         }},
        {"SANDGLASS_SPAWN_MS", "--spawn-ms", nullptr, true, [](EngineConfig& c, const std::string& v) {
             // one pulse accounts whole tracked seconds
             long long ms = parseInteger(v, 1000, 60000, "spawn-ms");
             if (ms % 1000 != 0) throw ConfigError("spawn-ms: " + v + " is not a whole number of seconds");
             c.spawnMs = static_cast<int>(ms);
         }},
        {"SANDGLASS_FPS", "--fps", nullptr, true, [](EngineConfig& c, const std::string& v) {
             c.targetFps = static_cast<int>(parseInteger(v, 1, 240, "fps"));
         }},
        {"SANDGLASS_FLUSH_ON_STOP", "--flush-on-stop", nullptr, false, [](EngineConfig& c, const std::string& v) {
             c.flushOnStop = v.empty() ? true : parseBool(v, "flush-on-stop");
         }},
        {"SANDGLASS_BRAILLE", "--no-braille", nullptr, false, [](EngineConfig& c, const std::string& v) {
             // The flag form switches braille off; the env form states the value directly.
             c.braille = v.empty() ? false : parseBool(v, "braille");
         }},
    };
    return table;
}

void applyChecked(EngineConfig& cfg, const Option& opt, const std::string& value,
                  std::vector<std::string>* warnings) {
    try {
        opt.apply(cfg, value);
    } catch (const ConfigError& e) {
        Logger::warn(std::string("config: ") + e.what() + " (keeping previous value)");
        if (warnings) warnings->push_back(e.what());
    }
}

void reject(const std::string& msg, std::vector<std::string>* warnings) {
    Logger::warn("config: " + msg);
    if (warnings) warnings->push_back(msg);
}
}

EngineConfig parseConfig(int argc, const char* const* argv, const EnvLookup& env,
                         std::vector<std::string>* warnings) {
    EngineConfig cfg;

    if (env) {
        for (const auto& opt : options()) {
            const char* v = env(opt.env);
            if (!v) continue;
            if (!opt.takesValue && *v == '\0') continue;
            applyChecked(cfg, opt, v, warnings);
        }
    }

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i] ? argv[i] : "");
        bool matched = false;
        for (const auto& opt : options()) {
            const std::string longFlag(opt.longFlag);
            if (a == longFlag || (opt.shortFlag && a == opt.shortFlag)) {
                matched = true;
                if (!opt.takesValue) {
                    applyChecked(cfg, opt, std::string(), warnings);
                } else if (i + 1 < argc) {
                    applyChecked(cfg, opt, argv[++i], warnings);
                } else {
                    reject(a + ": missing value", warnings);
                }
                break;
            }
            if (opt.takesValue && a.rfind(longFlag + "=", 0) == 0) {
                matched = true;
                applyChecked(cfg, opt, a.substr(longFlag.size() + 1), warnings);
                break;
            }
        }
        if (!matched) reject("unknown argument '" + a + "'", warnings);
    }
    return cfg;
}

EngineConfig loadConfig(int argc, const char* const* argv) {
    return parseConfig(argc, argv, [](const char* name) -> const char* { return std::getenv(name); });
}

std::string describeConfig(const EngineConfig& cfg) {
    std::ostringstream oss;
    oss << "quantum=" << cfg.quantumSeconds << "s"
        << " maxPerTick=" << cfg.maxPerTick
        << " policy=" << spawnPolicyName(cfg.spawnPolicy)
        << " seed=" << cfg.seed
        << " physicsMs=" << cfg.physicsMs
        << " spawnMs=" << cfg.spawnMs
        << " fps=" << cfg.targetFps
        << " flushOnStop=" << (cfg.flushOnStop ? "true" : "false")
        << " braille=" << (cfg.braille ? "true" : "false");
    return oss.str();
}
