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

#ifndef SILKTRACE_COMMON_UTIL_HPP_
#define SILKTRACE_COMMON_UTIL_HPP_

#include <iostream>
#include <string>

#include <evmc/evmc.hpp>

#include <silkworm/common/base.hpp>
#include <silkworm/common/util.hpp>

namespace silktrace {

inline silkworm::ByteView full_view(const evmc::address& address) {
    return {address.bytes, sizeof(address.bytes)};
}

inline silkworm::ByteView full_view(const evmc::bytes32& hash) {
    return {hash.bytes, sizeof(hash.bytes)};
}

} // namespace silktrace

namespace evmc {

// found by ADL from any namespace
inline std::ostream& operator<<(std::ostream& out, const address& addr) {
    out << silkworm::to_hex(silktrace::full_view(addr));
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const bytes32& b32) {
    out << silkworm::to_hex(silktrace::full_view(b32));
    return out;
}

} // namespace evmc

#endif // SILKTRACE_COMMON_UTIL_HPP_
