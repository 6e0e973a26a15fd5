// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/ipc/client.h>
#include <sortie/version.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

namespace {

using nlohmann::json;
using namespace sortie;

json countsToJson(const std::map<std::string, uint64_t>& counts) {
    json out = json::object();
    for (const auto& [name, n] : counts)
        out[name] = n;
    return out;
}

json summaryToJson(const ipc::OperationSummary& s) {
    json out{{"id", s.id},
             {"name", s.name},
             {"profile", s.profileId},
             {"group", s.group},
             {"state", s.state},
             {"created", core::formatTimestamp(core::fromEpochMillis(s.createdMs))},
             {"links", countsToJson(s.linkCounts)},
             {"frontier", s.frontierSize},
             {"facts", s.factCount}};
    if (!s.stateReason.empty())
        out["reason"] = s.stateReason;
    if (s.finishedMs)
        out["finished"] = core::formatTimestamp(core::fromEpochMillis(*s.finishedMs));
    json agents = json::array();
    for (const auto& a : s.agents) {
        agents.push_back({{"id", a.agentId},
                          {"state", a.state},
                          {"last_seen", core::formatTimestamp(core::fromEpochMillis(a.lastSeenMs))},
                          {"links", countsToJson(a.links)}});
    }
    out["agents"] = std::move(agents);
    json blocked = json::array();
    for (const auto& b : s.blocked) {
        json entry{{"ability", b.abilityId}, {"agent", b.agentId}, {"missing", b.missingFacts}};
        if (!b.waitingOnPhase.empty())
            entry["waiting_on_phase"] = b.waitingOnPhase;
        blocked.push_back(std::move(entry));
    }
    out["blocked"] = std::move(blocked);
    return out;
}

std::string formatCounts(const std::map<std::string, uint64_t>& counts) {
    std::string out;
    for (const auto& [name, n] : counts) {
        if (!out.empty())
            out += " ";
        out += name + "=" + std::to_string(n);
    }
    return out.empty() ? "-" : out;
}

void printSummary(const ipc::OperationSummary& s) {
    std::cout << s.id << "  " << s.name << "  [" << s.state << "]";
    if (!s.stateReason.empty())
        std::cout << " (" << s.stateReason << ")";
    std::cout << "\n  profile: " << s.profileId;
    if (!s.group.empty())
        std::cout << "  group: " << s.group;
    std::cout << "\n  links:   " << formatCounts(s.linkCounts) << "\n"
              << "  facts:   " << s.factCount << "  frontier: " << s.frontierSize << "\n";
    for (const auto& a : s.agents) {
        std::cout << "  agent " << a.agentId << " [" << a.state << "] " << formatCounts(a.links)
                  << "\n";
    }
    for (const auto& b : s.blocked) {
        std::cout << "  blocked " << b.abilityId << " on " << b.agentId;
        if (!b.waitingOnPhase.empty())
            std::cout << " waiting on phase '" << b.waitingOnPhase << "'";
        if (!b.missingFacts.empty()) {
            std::cout << " missing:";
            for (const auto& f : b.missingFacts)
                std::cout << " " << f;
        }
        std::cout << "\n";
    }
}

int fail(const Error& err) {
    std::cerr << "Error: " << err.message << " (" << errorToString(err.code) << ")\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);
    spdlog::set_pattern("[%H:%M:%S] [%l] %v");

    CLI::App app{"sortie-ctl - operate a sortied server"};
    app.set_version_flag("--version", SORTIE_VERSION_STRING);
    app.require_subcommand(1);

    ipc::ClientConfig clientConfig;
    int timeoutMs = static_cast<int>(clientConfig.requestTimeout.count());
    bool jsonOutput = false;
    bool verbose = false;
    app.add_option("--host", clientConfig.host, "Server address")->capture_default_str();
    app.add_option("--port", clientConfig.port, "Server port")->capture_default_str();
    app.add_option("--timeout", timeoutMs, "Request timeout in milliseconds")
        ->capture_default_str();
    app.add_flag("--json", jsonOutput, "Output as JSON");
    app.add_flag("-v,--verbose", verbose, "Debug logging");

    // ping
    auto* ping = app.add_subcommand("ping", "Check that the server answers");

    // start
    ipc::StartOperationRequest startReq;
    std::vector<std::string> seedArgs;
    uint32_t linkTimeout = 0;
    auto* start = app.add_subcommand("start", "Start an operation");
    start->add_option("name", startReq.name, "Operation name")->required();
    start->add_option("-p,--profile", startReq.profileId, "Adversary profile id")->required();
    start->add_option("-g,--group", startReq.group, "Agent group (default: all agents)");
    start->add_option("-f,--fact", seedArgs, "Seed fact key=value (repeatable)");
    auto* linkTimeoutOpt =
        start->add_option("--link-timeout", linkTimeout, "Per-link timeout in seconds");

    std::string operationId;
    auto* cancel = app.add_subcommand("cancel", "Cancel a running operation");
    cancel->add_option("operation", operationId, "Operation id")->required();
    auto* resume = app.add_subcommand("resume", "Resume an errored operation");
    resume->add_option("operation", operationId, "Operation id")->required();
    auto* status = app.add_subcommand("status", "Show one operation");
    status->add_option("operation", operationId, "Operation id")->required();
    auto* archive = app.add_subcommand("archive", "Archive a finished or cancelled operation");
    archive->add_option("operation", operationId, "Operation id")->required();
    auto* list = app.add_subcommand("list", "List operations");

    // Agent-side requests, for exercising the protocol by hand.
    ipc::BeaconRequest beaconReq;
    uint32_t interval = 0;
    uint32_t jitter = 0;
    auto* beacon = app.add_subcommand("beacon", "Send one agent beacon and print instructions");
    beacon->add_option("--agent", beaconReq.agentId, "Agent id (omit on first contact)");
    beacon->add_option("--platform", beaconReq.platform, "Agent platform")->required();
    beacon->add_option("--hostname", beaconReq.hostname, "Agent hostname");
    beacon->add_option("--group", beaconReq.group, "Agent group");
    beacon->add_option("-e,--executor", beaconReq.executors, "Supported executor (repeatable)");
    auto* intervalOpt = beacon->add_option("--interval", interval, "Beacon interval seconds");
    auto* jitterOpt = beacon->add_option("--jitter", jitter, "Beacon jitter seconds");

    ipc::ResultReport reportReq;
    std::string outputFile;
    bool failed = false;
    int32_t exitCode = 0;
    auto* report = app.add_subcommand("report", "Report the result of one link");
    report->add_option("--agent", reportReq.agentId, "Agent id")->required();
    report->add_option("--link", reportReq.linkId, "Link id")->required();
    auto* outputOpt = report->add_option("--output", reportReq.output, "Command output");
    auto* outputFileOpt =
        report->add_option("--output-file", outputFile, "Read command output from a file");
    outputOpt->excludes(outputFileOpt);
    report->add_flag("--failed", failed, "Mark the execution as failed");
    auto* exitOpt = report->add_option("--exit-code", exitCode, "Process exit code");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        spdlog::set_level(spdlog::level::debug);
    clientConfig.requestTimeout = std::chrono::milliseconds(timeoutMs);
    ipc::SortieClient client(clientConfig);

    if (ping->parsed()) {
        auto r = client.call(ipc::PingRequest{std::chrono::steady_clock::now()});
        if (!r)
            return fail(r.error());
        if (jsonOutput)
            std::cout << json{{"version", r.value().serverVersion}}.dump(2) << "\n";
        else
            std::cout << "pong from sortied " << r.value().serverVersion << "\n";
        return 0;
    }

    if (start->parsed()) {
        for (const auto& arg : seedArgs) {
            auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Error: seed fact '" << arg << "' is not key=value\n";
                return 2;
            }
            startReq.seedFacts.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
        }
        if (linkTimeoutOpt->count() > 0)
            startReq.linkTimeoutSeconds = linkTimeout;
        auto r = client.call(startReq);
        if (!r)
            return fail(r.error());
        if (jsonOutput)
            std::cout << json{{"operation_id", r.value().operationId}}.dump(2) << "\n";
        else
            std::cout << r.value().operationId << "\n";
        return 0;
    }

    auto printSuccess = [&](const Result<ipc::SuccessResponse>& r) {
        if (!r)
            return fail(r.error());
        if (jsonOutput)
            std::cout << json{{"message", r.value().message}}.dump(2) << "\n";
        else
            std::cout << r.value().message << "\n";
        return 0;
    };

    if (cancel->parsed())
        return printSuccess(client.call(ipc::CancelOperationRequest{operationId}));
    if (resume->parsed())
        return printSuccess(client.call(ipc::ResumeOperationRequest{operationId}));
    if (archive->parsed())
        return printSuccess(client.call(ipc::ArchiveOperationRequest{operationId}));

    if (status->parsed()) {
        auto r = client.call(ipc::OperationStatusRequest{operationId});
        if (!r)
            return fail(r.error());
        if (jsonOutput)
            std::cout << summaryToJson(r.value().operation).dump(2) << "\n";
        else
            printSummary(r.value().operation);
        return 0;
    }

    if (list->parsed()) {
        auto r = client.call(ipc::ListOperationsRequest{});
        if (!r)
            return fail(r.error());
        if (jsonOutput) {
            json out = json::array();
            for (const auto& s : r.value().operations)
                out.push_back(summaryToJson(s));
            std::cout << out.dump(2) << "\n";
        } else if (r.value().operations.empty()) {
            std::cout << "no operations\n";
        } else {
            for (const auto& s : r.value().operations)
                std::cout << s.id << "  " << s.state << "  " << s.name << "  "
                          << formatCounts(s.linkCounts) << "\n";
        }
        return 0;
    }

    if (beacon->parsed()) {
        if (intervalOpt->count() > 0)
            beaconReq.beaconIntervalSeconds = interval;
        if (jitterOpt->count() > 0)
            beaconReq.jitterSeconds = jitter;
        auto r = client.call(beaconReq);
        if (!r)
            return fail(r.error());
        const auto& reply = r.value();
        if (jsonOutput) {
            json instructions = json::array();
            for (const auto& in : reply.instructions) {
                instructions.push_back({{"link_id", in.linkId},
                                        {"operation_id", in.operationId},
                                        {"executor", in.executor},
                                        {"command", in.command},
                                        {"timeout_seconds", in.timeoutSeconds}});
            }
            std::cout << json{{"agent_id", reply.agentId},
                              {"sleep_seconds", reply.sleepSeconds},
                              {"instructions", std::move(instructions)}}
                             .dump(2)
                      << "\n";
        } else {
            std::cout << "agent " << reply.agentId << ": " << reply.instructions.size()
                      << " instruction(s), sleep " << reply.sleepSeconds << "s\n";
            for (const auto& in : reply.instructions) {
                std::cout << "  " << in.linkId << " [" << in.executor << "] " << in.command
                          << "\n";
            }
        }
        return 0;
    }

    if (report->parsed()) {
        if (outputFileOpt->count() > 0) {
            std::ifstream in(outputFile, std::ios::binary);
            if (!in) {
                std::cerr << "Error: cannot read " << outputFile << "\n";
                return 2;
            }
            reportReq.output.assign(std::istreambuf_iterator<char>(in),
                                    std::istreambuf_iterator<char>());
        }
        reportReq.success = !failed;
        if (exitOpt->count() > 0)
            reportReq.exitCode = exitCode;
        auto r = client.call(reportReq);
        if (!r)
            return fail(r.error());
        const auto& ack = r.value();
        if (jsonOutput) {
            json out{{"disposition", ipc::dispositionName(ack.disposition)}};
            if (!ack.reason.empty())
                out["reason"] = ack.reason;
            std::cout << out.dump(2) << "\n";
        } else {
            std::cout << ipc::dispositionName(ack.disposition);
            if (!ack.reason.empty())
                std::cout << ": " << ack.reason;
            std::cout << "\n";
        }
        return ack.disposition == ipc::Disposition::Rejected ? 3 : 0;
    }

    return 0;
}
