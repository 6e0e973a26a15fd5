// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/config/config_helpers.h>
#include <sortie/config/engine_config.h>
#include <sortie/engine/operation_manager.h>
#include <sortie/loader/catalog_loader.h>
#include <sortie/server/beacon_server.h>
#include <sortie/server/request_dispatcher.h>
#include <sortie/server/server_lifecycle_fsm.h>
#include <sortie/server/sweep_scheduler.h>
#include <sortie/storage/sqlite_journal.h>
#include <sortie/version.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#if !defined(_WIN32)
#include <execinfo.h>
#endif

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void log_fatal(const char* what) {
    try {
        spdlog::critical("FATAL: {}", what);
        spdlog::critical("Aborting after fatal error");
    } catch (const std::exception&) {
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void fatal_signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
#if !defined(_WIN32)
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
#endif
    spdlog::default_logger()->flush();
    std::_Exit(128 + signo);
}

void stop_signal_handler(int) {
    g_stopRequested = 1;
}

void setup_signal_handlers() {
    std::signal(SIGSEGV, fatal_signal_handler);
    std::signal(SIGABRT, fatal_signal_handler);
    std::signal(SIGINT, stop_signal_handler);
    std::signal(SIGTERM, stop_signal_handler);
#if !defined(_WIN32)
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

void setup_logging(const sortie::config::LoggingSettings& logging) {
    try {
        if (!logging.file.empty()) {
            std::error_code ec;
            if (logging.file.has_parent_path())
                std::filesystem::create_directories(logging.file.parent_path(), ec);
            const size_t max_size = logging.maxSizeMb * 1024 * 1024;
            auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file.string(), max_size, logging.maxFiles);
            spdlog::set_default_logger(std::make_shared<spdlog::logger>("sortied", sink));
            spdlog::flush_on(spdlog::level::info);
            spdlog::info("Log rotation enabled: {} (max {}MB x {} files)", logging.file.string(),
                         logging.maxSizeMb, logging.maxFiles);
        } else {
            spdlog::set_default_logger(spdlog::stdout_color_mt("sortied"));
        }
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Failed to configure logging (" << e.what() << "); using default logger\n";
    }

    if (logging.level == "trace") {
        spdlog::set_level(spdlog::level::trace);
    } else if (logging.level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (logging.level == "info") {
        spdlog::set_level(spdlog::level::info);
    } else if (logging.level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (logging.level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::warn("Unknown log level '{}'; using info", logging.level);
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    setup_signal_handlers();

    CLI::App app{"sortied - adversary emulation operation server"};
    app.set_version_flag("--version", SORTIE_VERSION_LONG_STRING);

    std::string configPath;
    std::string listenAddress;
    uint16_t port = 0;
    std::string databasePath;
    std::string abilitiesPath;
    std::string profilesPath;
    std::string logLevel;
    std::string logFile;
    std::size_t workers = 0;

    app.add_option("--config", configPath, "Configuration file path");
    auto* listenOpt = app.add_option("--listen", listenAddress, "Address to listen on");
    auto* portOpt = app.add_option("--port", port, "TCP port (0 picks a free port)");
    auto* dbOpt = app.add_option("--database", databasePath,
                                 "SQLite journal path (omit to keep state in memory)");
    auto* abilitiesOpt =
        app.add_option("--abilities", abilitiesPath, "Ability JSON file or directory");
    auto* profilesOpt =
        app.add_option("--profiles", profilesPath, "Adversary profile JSON file or directory");
    auto* levelOpt =
        app.add_option("--log-level", logLevel, "Log level (trace/debug/info/warn/error)");
    auto* logFileOpt = app.add_option("--log-file", logFile, "Log file path (default: stdout)");
    auto* workersOpt = app.add_option("--workers", workers, "Number of I/O worker threads");

    CLI11_PARSE(app, argc, argv);

    // Precedence: CLI > config file > environment > built-in default.
    auto resolvedPath = sortie::config::get_config_path(configPath);
    auto loaded = sortie::config::loadConfig(resolvedPath, !configPath.empty());
    if (!loaded) {
        std::cerr << "Failed to load configuration: " << loaded.error().message << "\n";
        return 1;
    }
    auto config = std::move(loaded).value();

    if (listenOpt->count() > 0)
        config.server.listenAddress = listenAddress;
    if (portOpt->count() > 0)
        config.server.port = port;
    if (dbOpt->count() > 0)
        config.storage.databasePath = sortie::config::expand_tilde(databasePath);
    if (abilitiesOpt->count() > 0)
        config.catalog.abilitiesPath = sortie::config::expand_tilde(abilitiesPath);
    if (profilesOpt->count() > 0)
        config.catalog.profilesPath = sortie::config::expand_tilde(profilesPath);
    if (levelOpt->count() > 0)
        config.logging.level = logLevel;
    if (logFileOpt->count() > 0)
        config.logging.file = sortie::config::expand_tilde(logFile);
    if (workersOpt->count() > 0 && workers > 0)
        config.server.workerThreads = workers;

    setup_logging(config.logging);
    spdlog::info("sortied {} starting", SORTIE_VERSION_STRING);

    try {
        std::shared_ptr<const sortie::engine::AbilityCatalog> catalog;
        if (config.catalog.abilitiesPath.empty()) {
            spdlog::warn("No abilities configured; operations will have nothing to schedule");
            catalog = std::make_shared<const sortie::engine::AbilityCatalog>();
        } else {
            auto c = sortie::loader::loadCatalog(config.catalog.abilitiesPath);
            if (!c) {
                spdlog::error("Failed to load abilities: {}", c.error().message);
                return 1;
            }
            catalog = c.value();
        }

        std::vector<sortie::engine::AdversaryProfile> profiles;
        if (!config.catalog.profilesPath.empty()) {
            auto p = sortie::loader::loadProfiles(config.catalog.profilesPath);
            if (!p) {
                spdlog::error("Failed to load profiles: {}", p.error().message);
                return 1;
            }
            profiles = std::move(p).value();
            if (auto v = sortie::loader::validateProfiles(*catalog, profiles); !v) {
                spdlog::error("Invalid profiles: {}", v.error().message);
                return 1;
            }
        }
        spdlog::info("Loaded {} abilities and {} profiles", catalog->size(), profiles.size());

        std::unique_ptr<sortie::storage::SqliteJournal> sqliteJournal;
        sortie::engine::NullJournal nullJournal;
        sortie::engine::OperationJournal* journal = &nullJournal;
        if (!config.storage.databasePath.empty()) {
            auto j = sortie::storage::SqliteJournal::open(config.storage.databasePath.string());
            if (!j) {
                spdlog::error("Failed to open journal {}: {}",
                              config.storage.databasePath.string(), j.error().message);
                return 1;
            }
            sqliteJournal = std::move(j).value();
            journal = sqliteJournal.get();
            auto schema = sqliteJournal->schemaVersion();
            spdlog::info("Journal: {} (schema v{})", config.storage.databasePath.string(),
                         schema ? schema.value() : -1);
        } else {
            spdlog::info("Journal: disabled (state kept in memory)");
        }

        sortie::engine::ManagerOptions options;
        options.linkTimeout = config.engine.linkTimeout;
        options.deadAfterMissedBeacons = config.engine.deadAfterMissedBeacons;
        options.defaultBeaconInterval = config.engine.defaultBeaconInterval;
        options.defaultJitter = config.engine.defaultJitter;
        sortie::engine::OperationManager manager(catalog, std::move(profiles), *journal, options);

        if (sqliteJournal) {
            auto agents = sqliteJournal->loadAgents();
            if (!agents) {
                spdlog::warn("Could not restore agents: {}", agents.error().message);
            } else {
                manager.restoreAgents(std::move(agents).value());
            }
        }

        sortie::server::ServerLifecycleFsm lifecycle;
        sortie::server::RequestDispatcher dispatcher(manager, &lifecycle);

        sortie::server::BeaconServer::Config serverConfig;
        serverConfig.listenAddress = config.server.listenAddress;
        serverConfig.port = config.server.port;
        serverConfig.maxConnections = config.server.maxConnections;
        serverConfig.workerThreads = config.server.workerThreads;
        sortie::server::BeaconServer server(serverConfig, dispatcher, &lifecycle);

        if (auto r = server.start(); !r) {
            spdlog::error("Failed to start server: {}", r.error().message);
            return 1;
        }

        sortie::server::SweepScheduler sweeper(server.ioContext().get_executor(), manager,
                                               config.engine.sweepInterval);
        if (auto r = sweeper.start(); !r) {
            spdlog::error("Failed to start sweeper: {}", r.error().message);
            (void)server.stop();
            return 1;
        }

        while (!g_stopRequested && server.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown requested");
        sweeper.stop();
        if (auto r = server.stop(); !r) {
            spdlog::warn("Server stop: {}", r.error().message);
        }
        spdlog::info("sortied stopped");
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("sortied error: {}", e.what());
        return 1;
    }
}
