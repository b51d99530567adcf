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

#ifndef SILKTRACE_CORE_CALL_TREE_HPP_
#define SILKTRACE_CORE_CALL_TREE_HPP_

#include <cstddef>
#include <optional>

#include <silktrace/core/error.hpp>
#include <silktrace/types/call_trace.hpp>

namespace silktrace::core {

//! Rebuild the nested internal call tree of one transaction from its flat call and return sequences.
//! Returns std::nullopt when the transaction made no calls at all.
//! Throws std::system_error holding a TraceError code if the sequences are not a well-formed trace.
std::optional<CallNode> build_call_tree(const CallEvents& calls, const ReturnEvents& returns);

//! Number of calls in the tree rooted at \p root, root included
std::size_t count_calls(const CallNode& root);

} // namespace silktrace::core

#endif  // SILKTRACE_CORE_CALL_TREE_HPP_
