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

#include "transaction.hpp"

#include <silktrace/common/util.hpp>

namespace silktrace {

std::ostream& operator<<(std::ostream& out, const Transaction& transaction) {
    out << "hash: " << transaction.hash;
    out << " block_number: " << transaction.block_number;
    out << " block_hash: " << transaction.block_hash;
    out << " transaction_index: " << transaction.transaction_index;
    out << " from: " << transaction.from;
    if (transaction.to) {
        out << " to: " << *transaction.to;
    }
    out << " gas_used: " << transaction.gas_used;
    out << " success: " << std::boolalpha << transaction.success << std::noboolalpha;
    out << " #logs: " << transaction.logs.size();
    out << " #internal_calls: " << transaction.internal_calls.size();
    out << " #internal_returns: " << transaction.internal_returns.size();
    return out;
}

} // namespace silktrace
