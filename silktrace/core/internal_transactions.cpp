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

#include "internal_transactions.hpp"

#include <utility>

#include <silktrace/common/log.hpp>

namespace silktrace::core {

uint64_t gas_used(const CallNode& node) {
    if (!node.gas) {
        return 0;
    }
    const auto gas = *node.gas;
    if (node.gas_left < 0 || static_cast<uint64_t>(node.gas_left) > gas) {
        SILKTRACE_WARN << "gas_used gas_left: " << node.gas_left << " out of range for gas: " << gas << "\n";
        return 0;
    }
    return gas - static_cast<uint64_t>(node.gas_left);
}

InternalTransactions make_internal_transactions(const LabeledCalls& labeled_calls) {
    InternalTransactions internal_transactions;
    internal_transactions.reserve(labeled_calls.size());
    for (const auto& labeled_call : labeled_calls) {
        const auto& node = *labeled_call.node;
        InternalTransaction itx;
        itx.call_path = labeled_call.call_path;
        itx.from = node.from;
        itx.to = node.to;
        itx.gas = node.gas;
        itx.value = node.value;
        itx.input = node.input;
        itx.status = node.status_code;
        itx.gas_used = gas_used(node);
        itx.output = node.output;
        internal_transactions.push_back(std::move(itx));
    }
    return internal_transactions;
}

InternalTransactions make_internal_transactions(const std::optional<CallNode>& root) {
    if (!root) {
        return {};
    }
    return make_internal_transactions(label_call_tree(*root));
}

} // namespace silktrace::core
