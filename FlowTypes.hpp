// FlowTypes.hpp
//
// Shared vocabulary of the GraphFlow engine: the value variant carried on
// data ports, port/connection enums, algorithm modes and the player's state
// and response codes. Everything here is plain data so that headers further
// up the stack (ports, nodes, executors, players) can agree on it cheaply.
#pragma once
#include <variant>
#include <string>
#include <stdexcept>
#include <optional>
#include <cstdint>

namespace GraphFlow {

// Scalar value that can flow on data ports. monostate is "no value yet".
using Value = std::variant<std::monostate, bool, int, float, double, std::string>;
using GlobalId = std::uint64_t;

// Thrown for programming errors and rejected operations (foreign ports,
// topology changes during an execution, cyclic optimized triggers, ...).
class FlowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class PortDirection { Input, Output };

// Data ports carry values, exec ports carry trigger signals only.
enum class PortKind { Data, Exec };

enum class ConnValidType {
    Valid,
    SameNode,
    SameIo,
    IoMismatch,
    DiffAlgType,
    DataMismatch,
    InputTaken,
    AlreadyConnected,
    AlreadyDisconnected,
    ExecutionInProgress
};

enum class FlowAlg { Manual, Data, DataOpt, Exec };

enum class GraphState { Stopped, Playing, Paused };

enum class GraphActionResponse { NoGraph, NotAllowed, Success };

const char* toString(PortDirection d);
const char* toString(PortKind k);
const char* toString(ConnValidType v);
const char* toString(FlowAlg alg);
const char* toString(GraphState s);
const char* toString(GraphActionResponse r);

// "data" / "exec"; throws std::invalid_argument on anything else
PortKind portKindFromString(const std::string& s);
// "manual", "data", "data-opt" (or "data opt"), "exec"
std::optional<FlowAlg> flowAlgFromString(const std::string& s);

// Human readable rendering used by logs and the CLI
std::string valueToString(const Value& v);
// Numeric view of a value; nullopt for strings and empty values
std::optional<double> valueAsDouble(const Value& v);

} // namespace GraphFlow
