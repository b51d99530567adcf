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
#ifndef SILKTRACE_COMMANDS_CALL_TRACE_OUTPUT_HPP_
#define SILKTRACE_COMMANDS_CALL_TRACE_OUTPUT_HPP_

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

#include <silktrace/common/constants.hpp>

namespace silktrace::commands {

//! True if \p output names one of the call trace output shapes: callstack or internal
bool is_valid_output(const std::string& output);

//! Rebuild the call trace held in \p trace ({"calls": [...], "returns": [...]}) and render it in the \p output shape.
//! Throws std::system_error for an unknown output, bad hex or quantities, or a malformed or oversize trace.
//! Throws nlohmann::json::exception if the trace has the wrong JSON structure.
nlohmann::json make_call_trace_output(const nlohmann::json& trace, const std::string& output,
                                      std::size_t max_internal_calls = kDefaultMaxInternalCalls);

} // namespace silktrace::commands

#endif  // SILKTRACE_COMMANDS_CALL_TRACE_OUTPUT_HPP_
