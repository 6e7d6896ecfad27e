// FlowTypes.cpp
//
// String conversions for the shared enums and value helpers.
#include "FlowTypes.hpp"
#include <fmt/core.h>

namespace GraphFlow {

const char* toString(PortDirection d) {
    return d == PortDirection::Input ? "input" : "output";
}

const char* toString(PortKind k) {
    return k == PortKind::Data ? "data" : "exec";
}

const char* toString(ConnValidType v) {
    switch (v) {
        case ConnValidType::Valid: return "VALID";
        case ConnValidType::SameNode: return "SAME_NODE";
        case ConnValidType::SameIo: return "SAME_IO";
        case ConnValidType::IoMismatch: return "IO_MISMATCH";
        case ConnValidType::DiffAlgType: return "DIFF_ALG_TYPE";
        case ConnValidType::DataMismatch: return "DATA_MISMATCH";
        case ConnValidType::InputTaken: return "INPUT_TAKEN";
        case ConnValidType::AlreadyConnected: return "ALREADY_CONNECTED";
        case ConnValidType::AlreadyDisconnected: return "ALREADY_DISCONNECTED";
        case ConnValidType::ExecutionInProgress: return "EXECUTION_IN_PROGRESS";
    }
    return "UNKNOWN";
}

const char* toString(FlowAlg alg) {
    switch (alg) {
        case FlowAlg::Manual: return "manual";
        case FlowAlg::Data: return "data";
        case FlowAlg::DataOpt: return "data-opt";
        case FlowAlg::Exec: return "exec";
    }
    return "data";
}

const char* toString(GraphState s) {
    switch (s) {
        case GraphState::Stopped: return "STOPPED";
        case GraphState::Playing: return "PLAYING";
        case GraphState::Paused: return "PAUSED";
    }
    return "STOPPED";
}

const char* toString(GraphActionResponse r) {
    switch (r) {
        case GraphActionResponse::NoGraph: return "NO_GRAPH";
        case GraphActionResponse::NotAllowed: return "NOT_ALLOWED";
        case GraphActionResponse::Success: return "SUCCESS";
    }
    return "NOT_ALLOWED";
}

PortKind portKindFromString(const std::string& s) {
    if (s == "data") return PortKind::Data;
    if (s == "exec") return PortKind::Exec;
    throw std::invalid_argument("Unknown port kind: " + s);
}

std::optional<FlowAlg> flowAlgFromString(const std::string& s) {
    if (s == "manual") return FlowAlg::Manual;
    if (s == "data") return FlowAlg::Data;
    if (s == "data-opt" || s == "data opt") return FlowAlg::DataOpt;
    if (s == "exec") return FlowAlg::Exec;
    return std::nullopt;
}

std::string valueToString(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "none";
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<int>(v)) return fmt::format("{}", std::get<int>(v));
    if (std::holds_alternative<float>(v)) return fmt::format("{:g}", std::get<float>(v));
    if (std::holds_alternative<double>(v)) return fmt::format("{:g}", std::get<double>(v));
    return std::get<std::string>(v);
}

std::optional<double> valueAsDouble(const Value& v) {
    if (std::holds_alternative<int>(v)) return static_cast<double>(std::get<int>(v));
    if (std::holds_alternative<float>(v)) return static_cast<double>(std::get<float>(v));
    if (std::holds_alternative<double>(v)) return std::get<double>(v);
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? 1.0 : 0.0;
    return std::nullopt;
}

} // namespace GraphFlow
