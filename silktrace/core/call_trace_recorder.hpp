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

#ifndef SILKTRACE_CORE_CALL_TRACE_RECORDER_HPP_
#define SILKTRACE_CORE_CALL_TRACE_RECORDER_HPP_

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <silktrace/types/call_trace.hpp>

namespace silktrace::core {

CallKind call_kind_of(const evmc_message& msg) noexcept;

// Collects the call and return events of one transaction from the EVM frame hooks, in execution order
class CallTraceRecorder {
public:
    explicit CallTraceRecorder(CallEvents& calls, ReturnEvents& returns) : calls_(calls), returns_(returns) {}

    CallTraceRecorder(const CallTraceRecorder&) = delete;
    CallTraceRecorder& operator=(const CallTraceRecorder&) = delete;

    void on_execution_start(const evmc_message& msg) noexcept;
    void on_execution_end(const evmc_result& result) noexcept;

private:
    CallEvents& calls_;
    ReturnEvents& returns_;
};

} // namespace silktrace::core

#endif  // SILKTRACE_CORE_CALL_TRACE_RECORDER_HPP_
