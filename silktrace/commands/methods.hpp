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

#ifndef SILKTRACE_COMMANDS_METHODS_HPP_
#define SILKTRACE_COMMANDS_METHODS_HPP_

namespace silktrace::commands::method {

constexpr const char* k_eth_getTransactionReceipt = "eth_getTransactionReceipt";
constexpr const char* k_sbch_getTxListByHeight = "sbch_getTxListByHeight";
constexpr const char* k_debug_getInternalCallStack = "debug_getInternalCallStack";

} // namespace silktrace::commands::method

#endif  // SILKTRACE_COMMANDS_METHODS_HPP_
