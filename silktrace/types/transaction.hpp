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

#ifndef SILKTRACE_TYPES_TRANSACTION_HPP_
#define SILKTRACE_TYPES_TRANSACTION_HPP_

#include <cstdint>
#include <iostream>
#include <optional>

#include <evmc/evmc.hpp>

#include <silkworm/types/bloom.hpp>

#include <silktrace/types/call_trace.hpp>
#include <silktrace/types/log.hpp>

namespace silktrace {

// Executed transaction as kept by the node, together with its recorded internal call trace
struct Transaction {
    evmc::bytes32 hash;
    uint64_t block_number{0};
    evmc::bytes32 block_hash;
    uint32_t transaction_index{0};

    evmc::address from;
    std::optional<evmc::address> to;
    std::optional<evmc::address> contract_address;

    uint64_t gas_used{0};
    uint64_t cumulative_gas_used{0};
    bool success{false};
    Logs logs;
    silkworm::Bloom bloom{};

    CallEvents internal_calls;
    ReturnEvents internal_returns;
};

std::ostream& operator<<(std::ostream& out, const Transaction& transaction);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_TRANSACTION_HPP_
