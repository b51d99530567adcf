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

#ifndef SILKTRACE_TYPES_CALL_TRACE_HPP_
#define SILKTRACE_TYPES_CALL_TRACE_HPP_

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <silkworm/common/base.hpp>

namespace silktrace {

// Flavour of the call instruction which opened a frame, as reported by the EVM
enum class CallKind : uint8_t {
    kCall,
    kStaticCall,
    kDelegateCall,
    kCallCode,
    kCreate,
    kCreate2,
};

std::string to_string(CallKind kind);
std::optional<CallKind> call_kind_from_string(std::string_view name);

std::ostream& operator<<(std::ostream& out, CallKind kind);

struct CallEvent {
    int32_t depth{0};
    evmc::address sender;
    evmc::address destination;
    silkworm::Bytes input;
    CallKind kind{CallKind::kCall};
    std::optional<uint64_t> gas;
    intx::uint256 value{0};
};

std::ostream& operator<<(std::ostream& out, const CallEvent& event);

struct ReturnEvent {
    silkworm::Bytes output;
    int32_t status_code{0};
    int64_t gas_left{0};
};

std::ostream& operator<<(std::ostream& out, const ReturnEvent& event);

using CallEvents = std::vector<CallEvent>;
using ReturnEvents = std::vector<ReturnEvent>;

struct CallNode {
    /* call fields */
    int32_t depth{0};
    evmc::address from;
    evmc::address to;
    silkworm::Bytes input;
    CallKind kind{CallKind::kCall};
    std::optional<uint64_t> gas;
    intx::uint256 value{0};

    /* return fields */
    silkworm::Bytes output;
    int32_t status_code{0};
    int64_t gas_left{0};

    std::vector<CallNode> calls;
};

std::ostream& operator<<(std::ostream& out, const CallNode& node);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_CALL_TRACE_HPP_
