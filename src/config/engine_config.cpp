// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <limits>

namespace sortie::config {

namespace {

template <typename T>
void readUnsigned(const ConfigMap& map, const std::string& section, const std::string& key,
                  T& out) {
    auto raw = lookup(map, section, key);
    if (raw.empty())
        return;
    try {
        auto v = std::stoull(raw);
        if (v > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            spdlog::warn("[config] {}.{}={} out of range; keeping {}", section, key, raw, out);
            return;
        }
        out = static_cast<T>(v);
    } catch (const std::exception&) {
        spdlog::warn("[config] {}.{}='{}' is not a number; keeping {}", section, key, raw, out);
    }
}

template <typename Rep, typename Period>
void readDuration(const ConfigMap& map, const std::string& section, const std::string& key,
                  std::chrono::duration<Rep, Period>& out) {
    auto count = static_cast<unsigned long long>(out.count());
    readUnsigned(map, section, key, count);
    out = std::chrono::duration<Rep, Period>(static_cast<Rep>(count));
}

} // namespace

void applyConfigMap(const ConfigMap& map, SortieConfig& config) {
    if (auto v = lookup(map, "server", "listen_address"); !v.empty())
        config.server.listenAddress = v;
    readUnsigned(map, "server", "port", config.server.port);
    readUnsigned(map, "server", "worker_threads", config.server.workerThreads);
    readUnsigned(map, "server", "max_connections", config.server.maxConnections);

    readDuration(map, "engine", "link_timeout_seconds", config.engine.linkTimeout);
    readUnsigned(map, "engine", "dead_after_missed_beacons", config.engine.deadAfterMissedBeacons);
    readDuration(map, "engine", "sweep_interval_ms", config.engine.sweepInterval);
    readDuration(map, "engine", "default_beacon_interval_seconds",
                 config.engine.defaultBeaconInterval);
    readDuration(map, "engine", "default_jitter_seconds", config.engine.defaultJitter);

    if (auto v = lookup(map, "storage", "database_path"); !v.empty())
        config.storage.databasePath = expand_tilde(v);

    if (auto v = lookup(map, "catalog", "abilities_path"); !v.empty())
        config.catalog.abilitiesPath = expand_tilde(v);
    if (auto v = lookup(map, "catalog", "profiles_path"); !v.empty())
        config.catalog.profilesPath = expand_tilde(v);

    if (auto v = lookup(map, "logging", "level"); !v.empty())
        config.logging.level = v;
    if (auto v = lookup(map, "logging", "file"); !v.empty())
        config.logging.file = expand_tilde(v);
    readUnsigned(map, "logging", "max_size_mb", config.logging.maxSizeMb);
    readUnsigned(map, "logging", "max_files", config.logging.maxFiles);

    if (config.engine.deadAfterMissedBeacons == 0) {
        spdlog::warn("[config] engine.dead_after_missed_beacons must be >= 1; using 1");
        config.engine.deadAfterMissedBeacons = 1;
    }
    if (config.server.workerThreads == 0) {
        spdlog::warn("[config] server.worker_threads was 0; coercing to 1");
        config.server.workerThreads = 1;
    }
}

void applyEnvironment(SortieConfig& config) {
    if (const char* db = std::getenv("SORTIE_DATABASE")) {
        config.storage.databasePath = expand_tilde(db);
    }
    if (const char* level = std::getenv("SORTIE_LOG_LEVEL")) {
        config.logging.level = level;
    }
}

Result<SortieConfig> loadConfig(const std::filesystem::path& path, bool required) {
    SortieConfig config;
    applyEnvironment(config);

    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        if (required) {
            return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
        }
        spdlog::debug("[config] no config file at '{}', using defaults", path.string());
        return config;
    }

    auto parsed = parseConfigFile(path);
    if (!parsed) {
        return parsed.error();
    }
    applyConfigMap(parsed.value(), config);
    spdlog::info("[config] loaded {}", path.string());
    return config;
}

} // namespace sortie::config
