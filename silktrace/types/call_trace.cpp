/*
   Copyright 2022 The Silktrace Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "call_trace.hpp"

#include <silkworm/common/util.hpp>

#include <silktrace/common/util.hpp>

namespace silktrace {

std::string to_string(CallKind kind) {
    switch (kind) {
        case CallKind::kCall: return "call";
        case CallKind::kStaticCall: return "staticcall";
        case CallKind::kDelegateCall: return "delegatecall";
        case CallKind::kCallCode: return "callcode";
        case CallKind::kCreate: return "create";
        case CallKind::kCreate2: return "create2";
        default: return "call";
    }
}

std::optional<CallKind> call_kind_from_string(std::string_view name) {
    if (name == "call") {
        return CallKind::kCall;
    }
    if (name == "staticcall") {
        return CallKind::kStaticCall;
    }
    if (name == "delegatecall") {
        return CallKind::kDelegateCall;
    }
    if (name == "callcode") {
        return CallKind::kCallCode;
    }
    if (name == "create") {
        return CallKind::kCreate;
    }
    if (name == "create2") {
        return CallKind::kCreate2;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& out, CallKind kind) {
    out << to_string(kind);
    return out;
}

std::ostream& operator<<(std::ostream& out, const CallEvent& event) {
    out << "depth: " << event.depth;
    out << " kind: " << event.kind;
    out << " sender: " << event.sender;
    out << " destination: " << event.destination;
    out << " input: " << silkworm::to_hex(event.input);
    if (event.gas) {
        out << " gas: " << *event.gas;
    }
    out << " value: " << intx::to_string(event.value);
    return out;
}

std::ostream& operator<<(std::ostream& out, const ReturnEvent& event) {
    out << "status_code: " << event.status_code;
    out << " gas_left: " << event.gas_left;
    out << " output: " << silkworm::to_hex(event.output);
    return out;
}

std::ostream& operator<<(std::ostream& out, const CallNode& node) {
    out << "depth: " << node.depth;
    out << " kind: " << node.kind;
    out << " from: " << node.from;
    out << " to: " << node.to;
    out << " status_code: " << node.status_code;
    out << " gas_left: " << node.gas_left;
    out << " #calls: " << node.calls.size();
    return out;
}

} // namespace silktrace
