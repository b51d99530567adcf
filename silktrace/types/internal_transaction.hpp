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

#ifndef SILKTRACE_TYPES_INTERNAL_TRANSACTION_HPP_
#define SILKTRACE_TYPES_INTERNAL_TRANSACTION_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkworm/common/base.hpp>

namespace silktrace {

// One internal call flattened out of the call tree, labelled with its call path
struct InternalTransaction {
    std::string call_path;
    evmc::address from;
    evmc::address to;
    std::optional<uint64_t> gas;
    intx::uint256 value{0};
    silkworm::Bytes input;
    int32_t status{0};
    uint64_t gas_used{0};
    silkworm::Bytes output;
};

typedef std::vector<InternalTransaction> InternalTransactions;

std::ostream& operator<<(std::ostream& out, const InternalTransaction& itx);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_INTERNAL_TRANSACTION_HPP_
