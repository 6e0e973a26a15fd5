// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <sortie/config/config_helpers.h>

namespace sortie::config {

struct ServerSettings {
    std::string listenAddress{"127.0.0.1"};
    uint16_t port{8888};
    std::size_t workerThreads{2};
    std::size_t maxConnections{256};
};

struct EngineSettings {
    std::chrono::seconds linkTimeout{300};
    uint32_t deadAfterMissedBeacons{3};
    std::chrono::milliseconds sweepInterval{1000};
    std::chrono::seconds defaultBeaconInterval{60};
    std::chrono::seconds defaultJitter{0};
};

struct StorageSettings {
    // Empty path keeps all state in memory.
    std::filesystem::path databasePath;
};

struct CatalogSettings {
    std::filesystem::path abilitiesPath;
    std::filesystem::path profilesPath;
};

struct LoggingSettings {
    std::string level{"info"};
    std::filesystem::path file;
    std::size_t maxSizeMb{10};
    std::size_t maxFiles{5};
};

struct SortieConfig {
    ServerSettings server;
    EngineSettings engine;
    StorageSettings storage;
    CatalogSettings catalog;
    LoggingSettings logging;
};

// Overlay values from a parsed config file onto `config`. Malformed numbers are logged and the
// previous value is kept.
void applyConfigMap(const ConfigMap& map, SortieConfig& config);

// Overlay SORTIE_DATABASE / SORTIE_LOG_LEVEL when they are set in the environment.
void applyEnvironment(SortieConfig& config);

// Load defaults <- environment <- file. A missing file is not an error when `required` is false.
Result<SortieConfig> loadConfig(const std::filesystem::path& path, bool required);

} // namespace sortie::config
