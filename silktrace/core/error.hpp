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

#ifndef SILKTRACE_CORE_ERROR_HPP_
#define SILKTRACE_CORE_ERROR_HPP_

#include <system_error>

namespace silktrace {

// Malformed internal call trace conditions
enum class TraceError {
    // value 0 reserved for no error
    nonzero_root_depth = 1,
    depth_skipped,
    multiple_roots,
    missing_return,
    unconsumed_return,
    too_many_calls,
};

std::error_code make_error_code(TraceError errc);

const std::error_category& trace_category() noexcept;

} // namespace silktrace

namespace std {

template<>
struct is_error_code_enum<silktrace::TraceError> : true_type {};

} // namespace std

#endif  // SILKTRACE_CORE_ERROR_HPP_
