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

#include "call_path.hpp"

#include <stack>
#include <utility>

#include <silktrace/common/constants.hpp>
#include <silktrace/common/log.hpp>

namespace silktrace::core {

std::string_view call_path_ordinals(std::string_view call_path) {
    const auto separator = call_path.find(kCallPathSeparator);
    if (separator == std::string_view::npos) {
        return {};
    }
    return call_path.substr(separator + 1);
}

std::string make_call_path(CallKind kind, std::string_view parent_path, std::size_t index) {
    std::string call_path{to_string(kind)};
    call_path.append(kCallPathSeparator);
    call_path.append(call_path_ordinals(parent_path));
    call_path.append(kCallPathSeparator);
    call_path.append(std::to_string(index));
    return call_path;
}

LabeledCalls label_call_tree(const CallNode& root) {
    LabeledCalls labeled_calls;

    std::stack<LabeledCall> pending;
    pending.push(LabeledCall{kRootCallPath, &root});
    while (!pending.empty()) {
        auto labeled_call = std::move(pending.top());
        pending.pop();

        const auto& calls = labeled_call.node->calls;
        // reverse push keeps siblings in execution order when popped
        for (std::size_t i{calls.size()}; i > 0; --i) {
            const auto& call = calls[i - 1];
            pending.push(LabeledCall{make_call_path(call.kind, labeled_call.call_path, i - 1), &call});
        }

        SILKTRACE_TRACE << "label_call_tree " << labeled_call.call_path << " " << *labeled_call.node << "\n";
        labeled_calls.push_back(std::move(labeled_call));
    }

    return labeled_calls;
}

} // namespace silktrace::core
