// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

// Trait-driven serializer: one ProtoBinding specialization per wire type.
#include <sortie/ipc/envelope.pb.h>
#include <sortie/ipc/proto_serializer.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <concepts>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <google/protobuf/repeated_field.h>

namespace sortie::ipc {

using Envelope = pb::Envelope;

namespace {

void to_kv_pairs(const std::vector<std::pair<std::string, std::string>>& in,
                 google::protobuf::RepeatedPtrField<pb::KvPair>* out) {
    out->Clear();
    for (const auto& [k, v] : in) {
        auto* kv = out->Add();
        kv->set_key(k);
        kv->set_value(v);
    }
}

std::vector<std::pair<std::string, std::string>>
from_kv_pairs(const google::protobuf::RepeatedPtrField<pb::KvPair>& in) {
    std::vector<std::pair<std::string, std::string>> out;
    out.reserve(static_cast<size_t>(in.size()));
    for (const auto& kv : in)
        out.emplace_back(kv.key(), kv.value());
    return out;
}

void set_string_list(const std::vector<std::string>& in,
                     google::protobuf::RepeatedPtrField<std::string>* out) {
    out->Clear();
    for (const auto& s : in)
        out->Add(std::string{s});
}

std::vector<std::string>
get_string_list(const google::protobuf::RepeatedPtrField<std::string>& in) {
    return std::vector<std::string>(in.begin(), in.end());
}

void set_counts(const std::map<std::string, uint64_t>& in,
                google::protobuf::RepeatedPtrField<pb::LinkCount>* out) {
    out->Clear();
    for (const auto& [status, count] : in) {
        auto* c = out->Add();
        c->set_status(status);
        c->set_count(count);
    }
}

std::map<std::string, uint64_t>
get_counts(const google::protobuf::RepeatedPtrField<pb::LinkCount>& in) {
    std::map<std::string, uint64_t> out;
    for (const auto& c : in)
        out[c.status()] = c.count();
    return out;
}

void set_summary(pb::OperationSummary* o, const OperationSummary& s) {
    o->set_id(s.id);
    o->set_name(s.name);
    o->set_profile_id(s.profileId);
    o->set_group(s.group);
    o->set_state(s.state);
    o->set_state_reason(s.stateReason);
    o->set_created_ms(s.createdMs);
    if (s.finishedMs)
        o->set_finished_ms(*s.finishedMs);
    set_counts(s.linkCounts, o->mutable_link_counts());
    for (const auto& a : s.agents) {
        auto* pa = o->add_agents();
        pa->set_agent_id(a.agentId);
        pa->set_state(a.state);
        pa->set_last_seen_ms(a.lastSeenMs);
        set_counts(a.links, pa->mutable_links());
    }
    for (const auto& b : s.blocked) {
        auto* pbk = o->add_blocked();
        pbk->set_ability_id(b.abilityId);
        pbk->set_agent_id(b.agentId);
        set_string_list(b.missingFacts, pbk->mutable_missing_facts());
        pbk->set_waiting_on_phase(b.waitingOnPhase);
    }
    o->set_frontier_size(s.frontierSize);
    o->set_fact_count(s.factCount);
}

OperationSummary get_summary(const pb::OperationSummary& i) {
    OperationSummary s;
    s.id = i.id();
    s.name = i.name();
    s.profileId = i.profile_id();
    s.group = i.group();
    s.state = i.state();
    s.stateReason = i.state_reason();
    s.createdMs = i.created_ms();
    if (i.has_finished_ms())
        s.finishedMs = i.finished_ms();
    s.linkCounts = get_counts(i.link_counts());
    for (const auto& pa : i.agents()) {
        AgentEntry a;
        a.agentId = pa.agent_id();
        a.state = pa.state();
        a.lastSeenMs = pa.last_seen_ms();
        a.links = get_counts(pa.links());
        s.agents.push_back(std::move(a));
    }
    for (const auto& pbk : i.blocked()) {
        BlockedEntry b;
        b.abilityId = pbk.ability_id();
        b.agentId = pbk.agent_id();
        b.missingFacts = get_string_list(pbk.missing_facts());
        b.waitingOnPhase = pbk.waiting_on_phase();
        s.blocked.push_back(std::move(b));
    }
    s.frontierSize = i.frontier_size();
    s.factCount = i.fact_count();
    return s;
}

} // namespace

// Primary template for per-type protobuf bindings. Specialize for each supported type.
template <typename T, typename = void> struct ProtoBinding;

template <typename T>
concept HasProtoBinding = requires(Envelope& e, const Envelope& ce, const T& t) {
    { ProtoBinding<T>::set(e, t) } -> std::same_as<void>;
    { ProtoBinding<T>::case_v } -> std::convertible_to<Envelope::PayloadCase>;
    { ProtoBinding<T>::get(ce) } -> std::same_as<T>;
};

// --------------------------- Requests ---------------------------
template <> struct ProtoBinding<BeaconRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kBeaconRequest;
    static void set(Envelope& env, const BeaconRequest& r) {
        auto* o = env.mutable_beacon_request();
        o->set_agent_id(r.agentId);
        o->set_platform(r.platform);
        o->set_hostname(r.hostname);
        o->set_group(r.group);
        set_string_list(r.executors, o->mutable_executors());
        if (r.beaconIntervalSeconds)
            o->set_beacon_interval_seconds(*r.beaconIntervalSeconds);
        if (r.jitterSeconds)
            o->set_jitter_seconds(*r.jitterSeconds);
    }
    static BeaconRequest get(const Envelope& env) {
        const auto& i = env.beacon_request();
        BeaconRequest r;
        r.agentId = i.agent_id();
        r.platform = i.platform();
        r.hostname = i.hostname();
        r.group = i.group();
        r.executors = get_string_list(i.executors());
        if (i.has_beacon_interval_seconds())
            r.beaconIntervalSeconds = i.beacon_interval_seconds();
        if (i.has_jitter_seconds())
            r.jitterSeconds = i.jitter_seconds();
        return r;
    }
};

template <> struct ProtoBinding<ResultReport> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kResultReport;
    static void set(Envelope& env, const ResultReport& r) {
        auto* o = env.mutable_result_report();
        o->set_agent_id(r.agentId);
        o->set_link_id(r.linkId);
        o->set_output(r.output);
        o->set_success(r.success);
        if (r.exitCode)
            o->set_exit_code(*r.exitCode);
    }
    static ResultReport get(const Envelope& env) {
        const auto& i = env.result_report();
        ResultReport r;
        r.agentId = i.agent_id();
        r.linkId = i.link_id();
        r.output = i.output();
        r.success = i.success();
        if (i.has_exit_code())
            r.exitCode = i.exit_code();
        return r;
    }
};

template <> struct ProtoBinding<StartOperationRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kStartOperationRequest;
    static void set(Envelope& env, const StartOperationRequest& r) {
        auto* o = env.mutable_start_operation_request();
        o->set_name(r.name);
        o->set_profile_id(r.profileId);
        o->set_group(r.group);
        to_kv_pairs(r.seedFacts, o->mutable_seed_facts());
        if (r.linkTimeoutSeconds)
            o->set_link_timeout_seconds(*r.linkTimeoutSeconds);
    }
    static StartOperationRequest get(const Envelope& env) {
        const auto& i = env.start_operation_request();
        StartOperationRequest r;
        r.name = i.name();
        r.profileId = i.profile_id();
        r.group = i.group();
        r.seedFacts = from_kv_pairs(i.seed_facts());
        if (i.has_link_timeout_seconds())
            r.linkTimeoutSeconds = i.link_timeout_seconds();
        return r;
    }
};

template <> struct ProtoBinding<CancelOperationRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kCancelOperationRequest;
    static void set(Envelope& env, const CancelOperationRequest& r) {
        env.mutable_cancel_operation_request()->set_operation_id(r.operationId);
    }
    static CancelOperationRequest get(const Envelope& env) {
        return CancelOperationRequest{env.cancel_operation_request().operation_id()};
    }
};

template <> struct ProtoBinding<ResumeOperationRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kResumeOperationRequest;
    static void set(Envelope& env, const ResumeOperationRequest& r) {
        env.mutable_resume_operation_request()->set_operation_id(r.operationId);
    }
    static ResumeOperationRequest get(const Envelope& env) {
        return ResumeOperationRequest{env.resume_operation_request().operation_id()};
    }
};

template <> struct ProtoBinding<ArchiveOperationRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kArchiveOperationRequest;
    static void set(Envelope& env, const ArchiveOperationRequest& r) {
        env.mutable_archive_operation_request()->set_operation_id(r.operationId);
    }
    static ArchiveOperationRequest get(const Envelope& env) {
        return ArchiveOperationRequest{env.archive_operation_request().operation_id()};
    }
};

template <> struct ProtoBinding<OperationStatusRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kOperationStatusRequest;
    static void set(Envelope& env, const OperationStatusRequest& r) {
        env.mutable_operation_status_request()->set_operation_id(r.operationId);
    }
    static OperationStatusRequest get(const Envelope& env) {
        return OperationStatusRequest{env.operation_status_request().operation_id()};
    }
};

template <> struct ProtoBinding<ListOperationsRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kListOperationsRequest;
    static void set(Envelope& env, const ListOperationsRequest&) {
        env.mutable_list_operations_request();
    }
    static ListOperationsRequest get(const Envelope&) { return ListOperationsRequest{}; }
};

template <> struct ProtoBinding<PingRequest> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kPingRequest;
    static void set(Envelope& env, const PingRequest& pr) {
        auto* ping = env.mutable_ping_request();
        ping->set_timestamp_ns(static_cast<uint64_t>(pr.timestamp.time_since_epoch().count()));
    }
    static PingRequest get(const Envelope& env) {
        PingRequest pr{};
        pr.timestamp = std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(env.ping_request().timestamp_ns()));
        return pr;
    }
};

// --------------------------- Responses ---------------------------
template <> struct ProtoBinding<BeaconResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kBeaconResponse;
    static void set(Envelope& env, const BeaconResponse& r) {
        auto* o = env.mutable_beacon_response();
        o->set_agent_id(r.agentId);
        o->set_sleep_seconds(r.sleepSeconds);
        for (const auto& in : r.instructions) {
            auto* pi = o->add_instructions();
            pi->set_link_id(in.linkId);
            pi->set_operation_id(in.operationId);
            pi->set_command(in.command);
            pi->set_executor(in.executor);
            pi->set_timeout_seconds(in.timeoutSeconds);
        }
    }
    static BeaconResponse get(const Envelope& env) {
        const auto& i = env.beacon_response();
        BeaconResponse r;
        r.agentId = i.agent_id();
        r.sleepSeconds = i.sleep_seconds();
        r.instructions.reserve(static_cast<size_t>(i.instructions_size()));
        for (const auto& pi : i.instructions()) {
            Instruction in;
            in.linkId = pi.link_id();
            in.operationId = pi.operation_id();
            in.command = pi.command();
            in.executor = pi.executor();
            in.timeoutSeconds = pi.timeout_seconds();
            r.instructions.push_back(std::move(in));
        }
        return r;
    }
};

template <> struct ProtoBinding<ResultAck> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kResultAck;
    static void set(Envelope& env, const ResultAck& r) {
        auto* o = env.mutable_result_ack();
        switch (r.disposition) {
            case Disposition::Accepted:
                o->set_disposition(pb::DISPOSITION_ACCEPTED);
                break;
            case Disposition::Duplicate:
                o->set_disposition(pb::DISPOSITION_DUPLICATE);
                break;
            case Disposition::Rejected:
                o->set_disposition(pb::DISPOSITION_REJECTED);
                break;
        }
        o->set_reason(r.reason);
    }
    static ResultAck get(const Envelope& env) {
        const auto& i = env.result_ack();
        ResultAck r;
        switch (i.disposition()) {
            case pb::DISPOSITION_DUPLICATE:
                r.disposition = Disposition::Duplicate;
                break;
            case pb::DISPOSITION_REJECTED:
                r.disposition = Disposition::Rejected;
                break;
            default:
                r.disposition = Disposition::Accepted;
                break;
        }
        r.reason = i.reason();
        return r;
    }
};

template <> struct ProtoBinding<StartOperationResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kStartOperationResponse;
    static void set(Envelope& env, const StartOperationResponse& r) {
        env.mutable_start_operation_response()->set_operation_id(r.operationId);
    }
    static StartOperationResponse get(const Envelope& env) {
        return StartOperationResponse{env.start_operation_response().operation_id()};
    }
};

template <> struct ProtoBinding<OperationStatusResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kOperationStatusResponse;
    static void set(Envelope& env, const OperationStatusResponse& r) {
        set_summary(env.mutable_operation_status_response()->mutable_operation(), r.operation);
    }
    static OperationStatusResponse get(const Envelope& env) {
        return OperationStatusResponse{get_summary(env.operation_status_response().operation())};
    }
};

template <> struct ProtoBinding<ListOperationsResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kListOperationsResponse;
    static void set(Envelope& env, const ListOperationsResponse& r) {
        auto* o = env.mutable_list_operations_response();
        for (const auto& s : r.operations)
            set_summary(o->add_operations(), s);
    }
    static ListOperationsResponse get(const Envelope& env) {
        ListOperationsResponse r;
        for (const auto& s : env.list_operations_response().operations())
            r.operations.push_back(get_summary(s));
        return r;
    }
};

template <> struct ProtoBinding<SuccessResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kSuccessResponse;
    static void set(Envelope& env, const SuccessResponse& r) {
        env.mutable_success_response()->set_message(r.message);
    }
    static SuccessResponse get(const Envelope& env) {
        return SuccessResponse{env.success_response().message()};
    }
};

template <> struct ProtoBinding<PongResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kPongResponse;
    static void set(Envelope& env, const PongResponse& pr) {
        auto* pong = env.mutable_pong_response();
        pong->set_server_time_ns(static_cast<uint64_t>(pr.serverTime.time_since_epoch().count()));
        pong->set_server_version(pr.serverVersion);
    }
    static PongResponse get(const Envelope& env) {
        PongResponse pr{};
        pr.serverTime = std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(env.pong_response().server_time_ns()));
        pr.serverVersion = env.pong_response().server_version();
        return pr;
    }
};

template <> struct ProtoBinding<ErrorResponse> {
    static constexpr Envelope::PayloadCase case_v = Envelope::kError;
    static void set(Envelope& env, const ErrorResponse& er) {
        auto* pe = env.mutable_error();
        pe->set_code(static_cast<uint32_t>(er.code));
        pe->set_message(er.message);
    }
    static ErrorResponse get(const Envelope& env) {
        ErrorResponse er{};
        er.code = static_cast<ErrorCode>(env.error().code());
        er.message = env.error().message();
        return er;
    }
};

namespace {

template <typename Variant> Result<void> encode_variant_into(Envelope& env, const Variant& v) {
    bool encoded = false;
    std::visit(
        [&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (HasProtoBinding<T>) {
                ProtoBinding<T>::set(env, x);
                encoded = true;
            }
        },
        v);
    if (!encoded) {
        return Error{ErrorCode::InvalidArgument, "Unsupported message type for proto"};
    }
    return Result<void>();
}

template <typename T> Request request_of(const Envelope& env) {
    return Request{std::in_place_type<T>, ProtoBinding<T>::get(env)};
}

template <typename T> Response response_of(const Envelope& env) {
    return Response{std::in_place_type<T>, ProtoBinding<T>::get(env)};
}

Result<Envelope> build_envelope(const Message& msg) {
    Envelope env;
    env.set_version(PROTOCOL_VERSION);
    env.set_request_id(msg.requestId);

    if (std::holds_alternative<Request>(msg.payload)) {
        const auto& req = std::get<Request>(msg.payload);
        spdlog::trace("encode_payload: request type={} request_id={}", getRequestName(req),
                      msg.requestId);
        auto r = encode_variant_into(env, req);
        if (!r)
            return r.error();
    } else {
        const auto& res = std::get<Response>(msg.payload);
        spdlog::trace("encode_payload: response type={} request_id={}", getResponseName(res),
                      msg.requestId);
        auto r = encode_variant_into(env, res);
        if (!r)
            return r.error();
    }
    return env;
}

} // namespace

Result<void> ProtoSerializer::encode_payload_into(const Message& msg,
                                                  std::vector<uint8_t>& buffer) {
    auto env_result = build_envelope(msg);
    if (!env_result)
        return env_result.error();

    Envelope env = std::move(env_result).value();
    const auto size = env.ByteSizeLong();
    if (size > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidData, "Serialized payload exceeds MAX_MESSAGE_SIZE"};
    }

    const auto base = buffer.size();
    buffer.resize(base + static_cast<std::size_t>(size));
    if (!env.SerializeToArray(buffer.data() + base, static_cast<int>(size))) {
        buffer.resize(base);
        return Error{ErrorCode::SerializationError, "Failed to serialize protobuf Envelope"};
    }
    return Result<void>();
}

Result<std::vector<uint8_t>> ProtoSerializer::encode_payload(const Message& msg) {
    std::vector<uint8_t> out;
    auto res = encode_payload_into(msg, out);
    if (!res)
        return res.error();
    return out;
}

Result<Message> ProtoSerializer::decode_payload(const uint8_t* data, std::size_t size) {
    if (size > MAX_MESSAGE_SIZE) {
        return Error{ErrorCode::InvalidData, "Payload exceeds MAX_MESSAGE_SIZE"};
    }
    Envelope env;
    if (!env.ParseFromArray(data, static_cast<int>(size))) {
        return Error{ErrorCode::SerializationError, "Failed to parse protobuf Envelope"};
    }
    spdlog::trace("decode_payload: payload_case={} request_id={} size={}B",
                  static_cast<int>(env.payload_case()), env.request_id(), size);

    Message m;
    m.version = env.version();
    m.timestamp = std::chrono::steady_clock::now();
    m.requestId = env.request_id();

    switch (env.payload_case()) {
        case Envelope::kBeaconRequest:
            m.payload = request_of<BeaconRequest>(env);
            break;
        case Envelope::kResultReport:
            m.payload = request_of<ResultReport>(env);
            break;
        case Envelope::kStartOperationRequest:
            m.payload = request_of<StartOperationRequest>(env);
            break;
        case Envelope::kCancelOperationRequest:
            m.payload = request_of<CancelOperationRequest>(env);
            break;
        case Envelope::kResumeOperationRequest:
            m.payload = request_of<ResumeOperationRequest>(env);
            break;
        case Envelope::kOperationStatusRequest:
            m.payload = request_of<OperationStatusRequest>(env);
            break;
        case Envelope::kListOperationsRequest:
            m.payload = request_of<ListOperationsRequest>(env);
            break;
        case Envelope::kArchiveOperationRequest:
            m.payload = request_of<ArchiveOperationRequest>(env);
            break;
        case Envelope::kPingRequest:
            m.payload = request_of<PingRequest>(env);
            break;

        case Envelope::kBeaconResponse:
            m.payload = response_of<BeaconResponse>(env);
            break;
        case Envelope::kResultAck:
            m.payload = response_of<ResultAck>(env);
            break;
        case Envelope::kStartOperationResponse:
            m.payload = response_of<StartOperationResponse>(env);
            break;
        case Envelope::kOperationStatusResponse:
            m.payload = response_of<OperationStatusResponse>(env);
            break;
        case Envelope::kListOperationsResponse:
            m.payload = response_of<ListOperationsResponse>(env);
            break;
        case Envelope::kSuccessResponse:
            m.payload = response_of<SuccessResponse>(env);
            break;
        case Envelope::kPongResponse:
            m.payload = response_of<PongResponse>(env);
            break;
        case Envelope::kError:
            m.payload = response_of<ErrorResponse>(env);
            break;
        case Envelope::PAYLOAD_NOT_SET:
        default:
            return Error{ErrorCode::InvalidData, "Unsupported or empty Envelope payload"};
    }
    return m;
}

} // namespace sortie::ipc
