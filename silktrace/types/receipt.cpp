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

#include "receipt.hpp"

#include <silktrace/common/util.hpp>

namespace silktrace {

std::ostream& operator<<(std::ostream& out, const Receipt& r) {
    out << " block_hash: " << r.block_hash;
    out << " block_number: " << r.block_number;
    if (r.contract_address) {
        out << " contract_address: " << *r.contract_address;
    } else {
        out << " contract_address: null";
    }
    out << " cumulative_gas_used: " << r.cumulative_gas_used;
    out << " from: " << r.from;
    out << " gas_used: " << r.gas_used;
    out << " #logs: " << r.logs.size();
    out << " #internal_transactions: " << r.internal_transactions.size();
    out << " success: " << std::boolalpha << r.success << std::noboolalpha;
    if (r.to) {
        out << " to: " << *r.to;
    } else {
        out << " to: null";
    }
    out << " tx_hash: " << r.tx_hash;
    out << " tx_index: " << r.tx_index;
    return out;
}

} // namespace silktrace
