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

#ifndef SILKTRACE_CORE_RECEIPTS_HPP_
#define SILKTRACE_CORE_RECEIPTS_HPP_

#include <cstddef>
#include <optional>
#include <vector>

#include <silktrace/common/constants.hpp>
#include <silktrace/types/call_trace.hpp>
#include <silktrace/types/receipt.hpp>
#include <silktrace/types/transaction.hpp>

namespace silktrace::core {

//! Nested internal call stack of a recorded trace, std::nullopt if it has no calls.
//! Throws std::system_error with TraceError::too_many_calls if the trace has more than \p max_internal_calls calls.
std::optional<CallNode> make_call_stack(const CallEvents& calls, const ReturnEvents& returns, std::size_t max_internal_calls = kDefaultMaxInternalCalls);

std::optional<CallNode> make_call_stack(const Transaction& transaction, std::size_t max_internal_calls = kDefaultMaxInternalCalls);

Receipt make_receipt(const Transaction& transaction, std::size_t max_internal_calls = kDefaultMaxInternalCalls);

Receipts make_receipts(const std::vector<Transaction>& transactions, std::size_t max_internal_calls = kDefaultMaxInternalCalls);

} // namespace silktrace::core

#endif  // SILKTRACE_CORE_RECEIPTS_HPP_
