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

#ifndef SILKTRACE_COMMON_CONSTANTS_HPP_
#define SILKTRACE_COMMON_CONSTANTS_HPP_

#include <cstddef>
#include <cstdint>

namespace silktrace {

constexpr const char* kCallPathSeparator{"_"};
constexpr const char* kRootCallPath{"call_0"};

constexpr const char* kCallStackOutput{"callstack"};
constexpr const char* kInternalTransactionsOutput{"internal"};

// upper bound on internal calls served for a single transaction
constexpr const std::size_t kDefaultMaxInternalCalls{10000};

constexpr const int32_t kInvalidRequestErrorCode{-32600};
constexpr const int32_t kMethodNotFoundErrorCode{-32601};
constexpr const int32_t kInvalidParamsErrorCode{-32602};
constexpr const int32_t kServerErrorCode{100};

} // namespace silktrace

#endif  // SILKTRACE_COMMON_CONSTANTS_HPP_
