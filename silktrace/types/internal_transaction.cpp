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

#include "internal_transaction.hpp"

#include <silkworm/common/util.hpp>

#include <silktrace/common/util.hpp>

namespace silktrace {

std::ostream& operator<<(std::ostream& out, const InternalTransaction& itx) {
    out << "call_path: " << itx.call_path;
    out << " from: " << itx.from;
    out << " to: " << itx.to;
    if (itx.gas) {
        out << " gas: " << *itx.gas;
    }
    out << " value: " << intx::to_string(itx.value);
    out << " input: " << silkworm::to_hex(itx.input);
    out << " status: " << itx.status;
    out << " gas_used: " << itx.gas_used;
    out << " output: " << silkworm::to_hex(itx.output);
    return out;
}

} // namespace silktrace
