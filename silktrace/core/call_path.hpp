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

#ifndef SILKTRACE_CORE_CALL_PATH_HPP_
#define SILKTRACE_CORE_CALL_PATH_HPP_

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <silktrace/types/call_trace.hpp>

namespace silktrace::core {

struct LabeledCall {
    std::string call_path;
    const CallNode* node{nullptr};
};

typedef std::vector<LabeledCall> LabeledCalls;

//! Path of the \p index-th call made by the call labelled \p parent_path, e.g. staticcall_0_1_1
std::string make_call_path(CallKind kind, std::string_view parent_path, std::size_t index);

//! Ordinal chain of a path without its kind prefix, e.g. 0_1_1 for staticcall_0_1_1
std::string_view call_path_ordinals(std::string_view call_path);

//! Label every call in the tree in pre-order. The root is always call_0.
//! Labels point into the tree, which must outlive them.
LabeledCalls label_call_tree(const CallNode& root);

} // namespace silktrace::core

#endif  // SILKTRACE_CORE_CALL_PATH_HPP_
