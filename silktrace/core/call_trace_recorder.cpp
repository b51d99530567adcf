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

#include "call_trace_recorder.hpp"

#include <utility>

#include <intx/intx.hpp>

#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>

namespace silktrace::core {

CallKind call_kind_of(const evmc_message& msg) noexcept {
    bool in_static_mode = (msg.flags & evmc_flags::EVMC_STATIC) != 0;
    switch (msg.kind) {
        case evmc_call_kind::EVMC_CALL:
            return in_static_mode ? CallKind::kStaticCall : CallKind::kCall;
        case evmc_call_kind::EVMC_DELEGATECALL:
            return CallKind::kDelegateCall;
        case evmc_call_kind::EVMC_CALLCODE:
            return CallKind::kCallCode;
        case evmc_call_kind::EVMC_CREATE:
            return CallKind::kCreate;
        case evmc_call_kind::EVMC_CREATE2:
            return CallKind::kCreate2;
    }
    return CallKind::kCall;
}

void CallTraceRecorder::on_execution_start(const evmc_message& msg) noexcept {
    CallEvent call;
    call.depth = msg.depth;
    call.sender = evmc::address{msg.sender};
    call.destination = evmc::address{msg.recipient};
    if (msg.input_size > 0) {
        call.input = silkworm::Bytes{msg.input_data, msg.input_size};
    }
    call.kind = call_kind_of(msg);
    if (msg.gas >= 0) {
        call.gas = static_cast<uint64_t>(msg.gas);
    }
    call.value = intx::be::load<intx::uint256>(msg.value);

    SILKTRACE_DEBUG << "CallTraceRecorder::on_execution_start: " << call << "\n";

    calls_.push_back(std::move(call));
}

void CallTraceRecorder::on_execution_end(const evmc_result& result) noexcept {
    ReturnEvent ret;
    if (result.output_size > 0) {
        ret.output = silkworm::Bytes{result.output_data, result.output_size};
    }
    ret.status_code = static_cast<int32_t>(result.status_code);
    ret.gas_left = result.gas_left;

    SILKTRACE_DEBUG << "CallTraceRecorder::on_execution_end: " << ret << "\n";

    returns_.push_back(std::move(ret));
}

} // namespace silktrace::core
