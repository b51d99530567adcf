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

#include "receipts.hpp"

#include <string>
#include <system_error>

#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>
#include <silktrace/core/call_tree.hpp>
#include <silktrace/core/error.hpp>
#include <silktrace/core/internal_transactions.hpp>

namespace silktrace::core {

std::optional<CallNode> make_call_stack(const CallEvents& calls, const ReturnEvents& returns, std::size_t max_internal_calls) {
    if (calls.size() > max_internal_calls) {
        throw std::system_error{make_error_code(TraceError::too_many_calls),
            std::to_string(calls.size()) + " calls, limit " + std::to_string(max_internal_calls)};
    }
    return build_call_tree(calls, returns);
}

std::optional<CallNode> make_call_stack(const Transaction& transaction, std::size_t max_internal_calls) {
    return make_call_stack(transaction.internal_calls, transaction.internal_returns, max_internal_calls);
}

Receipt make_receipt(const Transaction& transaction, std::size_t max_internal_calls) {
    SILKTRACE_DEBUG << "make_receipt " << transaction << "\n";

    Receipt receipt;
    receipt.success = transaction.success;
    receipt.cumulative_gas_used = transaction.cumulative_gas_used;
    receipt.bloom = transaction.bloom;
    receipt.logs = transaction.logs;
    receipt.tx_hash = transaction.hash;
    receipt.contract_address = transaction.contract_address;
    receipt.gas_used = transaction.gas_used;
    receipt.block_hash = transaction.block_hash;
    receipt.block_number = transaction.block_number;
    receipt.tx_index = transaction.transaction_index;
    receipt.from = transaction.from;
    receipt.to = transaction.to;

    const auto call_stack = make_call_stack(transaction, max_internal_calls);
    receipt.internal_transactions = make_internal_transactions(call_stack);

    return receipt;
}

Receipts make_receipts(const std::vector<Transaction>& transactions, std::size_t max_internal_calls) {
    Receipts receipts;
    receipts.reserve(transactions.size());
    for (const auto& transaction : transactions) {
        receipts.push_back(make_receipt(transaction, max_internal_calls));
    }
    return receipts;
}

} // namespace silktrace::core
