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
#include "call_trace_output.hpp"

#include <system_error>

#include <silktrace/common/log.hpp>
#include <silktrace/core/internal_transactions.hpp>
#include <silktrace/core/receipts.hpp>
#include <silktrace/json/types.hpp>

namespace silktrace::commands {

bool is_valid_output(const std::string& output) {
    return output == kCallStackOutput || output == kInternalTransactionsOutput;
}

nlohmann::json make_call_trace_output(const nlohmann::json& trace, const std::string& output, std::size_t max_internal_calls) {
    if (!is_valid_output(output)) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "unknown output: " + output};
    }
    if (!trace.is_object() || !trace.contains("calls") || !trace.contains("returns")) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "trace must hold calls and returns arrays"};
    }

    const auto calls = trace["calls"].get<CallEvents>();
    const auto returns = trace["returns"].get<ReturnEvents>();
    SILKTRACE_INFO << "make_call_trace_output #calls: " << calls.size() << " #returns: " << returns.size() << "\n";

    const auto call_stack = core::make_call_stack(calls, returns, max_internal_calls);
    if (output == kCallStackOutput) {
        return call_stack ? nlohmann::json(*call_stack) : nlohmann::json{};
    }
    return core::make_internal_transactions(call_stack);
}

} // namespace silktrace::commands
