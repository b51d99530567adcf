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

#ifndef SILKTRACE_CORE_INTERNAL_TRANSACTIONS_HPP_
#define SILKTRACE_CORE_INTERNAL_TRANSACTIONS_HPP_

#include <cstdint>
#include <optional>

#include <silktrace/core/call_path.hpp>
#include <silktrace/types/call_trace.hpp>
#include <silktrace/types/internal_transaction.hpp>

namespace silktrace::core {

//! Gas consumed by the call, zero if its entry gas was not recorded
uint64_t gas_used(const CallNode& node);

InternalTransactions make_internal_transactions(const LabeledCalls& labeled_calls);

//! Label and flatten the whole tree; an empty trace gives an empty list
InternalTransactions make_internal_transactions(const std::optional<CallNode>& root);

} // namespace silktrace::core

#endif  // SILKTRACE_CORE_INTERNAL_TRANSACTIONS_HPP_
