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

#include "call_tree.hpp"

#include <stack>
#include <string>
#include <system_error>

#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>

namespace silktrace::core {

static CallNode make_call_node(const CallEvent& call) {
    CallNode node;
    node.depth = call.depth;
    node.from = call.sender;
    node.to = call.destination;
    node.input = call.input;
    node.kind = call.kind;
    node.gas = call.gas;
    node.value = call.value;
    return node;
}

std::optional<CallNode> build_call_tree(const CallEvents& calls, const ReturnEvents& returns) {
    SILKTRACE_DEBUG << "build_call_tree #calls: " << calls.size() << " #returns: " << returns.size() << "\n";

    if (calls.empty()) {
        if (!returns.empty()) {
            throw std::system_error{make_error_code(TraceError::unconsumed_return), "no calls but " + std::to_string(returns.size()) + " returns"};
        }
        return std::nullopt;
    }

    std::optional<CallNode> root;
    // Every node on the stack is the last child of the node below it, so appending to the top never moves them
    std::stack<CallNode*> open_calls;
    std::size_t next_return{0};

    const auto resolve_top = [&]() {
        if (next_return == returns.size()) {
            throw std::system_error{make_error_code(TraceError::missing_return), "open calls: " + std::to_string(open_calls.size())};
        }
        CallNode* node = open_calls.top();
        open_calls.pop();

        const auto& ret = returns[next_return++];
        node->output = ret.output;
        node->status_code = ret.status_code;
        node->gas_left = ret.gas_left;
        SILKTRACE_TRACE << "build_call_tree resolved " << *node << "\n";
    };

    for (std::size_t index{0}; index < calls.size(); ++index) {
        const auto& call = calls[index];
        SILKTRACE_TRACE << "build_call_tree call[" << index << "] " << call << "\n";

        if (index == 0) {
            if (call.depth != 0) {
                throw std::system_error{make_error_code(TraceError::nonzero_root_depth), "depth: " + std::to_string(call.depth)};
            }
            root = make_call_node(call);
            open_calls.push(&root.value());
            continue;
        }

        const auto top_depth = open_calls.top()->depth;
        if (call.depth > top_depth + 1) {
            throw std::system_error{make_error_code(TraceError::depth_skipped),
                "call[" + std::to_string(index) + "] depth: " + std::to_string(call.depth) + " open depth: " + std::to_string(top_depth)};
        }

        // close calls until the top is the direct caller
        while (call.depth <= open_calls.top()->depth) {
            if (open_calls.size() == 1) {
                throw std::system_error{make_error_code(TraceError::multiple_roots), "call[" + std::to_string(index) + "]"};
            }
            resolve_top();
        }

        auto& caller = *open_calls.top();
        caller.calls.push_back(make_call_node(call));
        open_calls.push(&caller.calls.back());
    }

    while (!open_calls.empty()) {
        resolve_top();
    }

    if (next_return != returns.size()) {
        throw std::system_error{make_error_code(TraceError::unconsumed_return),
            std::to_string(returns.size() - next_return) + " returns left"};
    }

    return root;
}

std::size_t count_calls(const CallNode& root) {
    std::size_t count{0};
    std::stack<const CallNode*> pending;
    pending.push(&root);
    while (!pending.empty()) {
        const CallNode* node = pending.top();
        pending.pop();
        ++count;
        for (const auto& call : node->calls) {
            pending.push(&call);
        }
    }
    return count;
}

} // namespace silktrace::core
