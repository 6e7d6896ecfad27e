// Port.cpp
#include "Port.hpp"
#include "Node.hpp"
#include "TypeRegistry.hpp"

namespace GraphFlow {

int Port::index() const {
    return isInput() ? node->inputIndex(*this) : node->outputIndex(*this);
}

ConnValidType checkValidConn(const Port& out, const Port& inp, const TypeRegistry& types) {
    if (out.node == inp.node) return ConnValidType::SameNode;
    if (out.direction == inp.direction) return ConnValidType::SameIo;
    if (!out.isOutput()) return ConnValidType::IoMismatch;
    if (out.kind != inp.kind) return ConnValidType::DiffAlgType;
    if (out.isData() && !types.accepts(inp.allowedData, out.allowedData)) return ConnValidType::DataMismatch;
    return ConnValidType::Valid;
}

} // namespace GraphFlow
