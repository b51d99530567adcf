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

#ifndef SILKTRACE_JSON_TYPES_HPP_
#define SILKTRACE_JSON_TYPES_HPP_

#include <cstdint>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <silkworm/common/base.hpp>

#include <silktrace/types/call_trace.hpp>
#include <silktrace/types/error.hpp>
#include <silktrace/types/internal_transaction.hpp>
#include <silktrace/types/log.hpp>
#include <silktrace/types/receipt.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

} // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256);

} // namespace intx

namespace silktrace {

void to_json(nlohmann::json& json, const CallKind& kind);
void from_json(const nlohmann::json& json, CallKind& kind);

void from_json(const nlohmann::json& json, CallEvent& call);
void from_json(const nlohmann::json& json, ReturnEvent& ret);

// nested call stack shape
void to_json(nlohmann::json& json, const CallNode& node);

void to_json(nlohmann::json& json, const InternalTransaction& itx);

void to_json(nlohmann::json& json, const Log& log);

void to_json(nlohmann::json& json, const Receipt& receipt);

void to_json(nlohmann::json& json, const Error& error);

silkworm::Bytes bytes_from_json(const nlohmann::json& json);
uint64_t quantity_from_json(const nlohmann::json& json);

std::string to_hex_no_leading_zeros(uint64_t number);
std::string to_hex_no_leading_zeros(silkworm::ByteView bytes);

std::string to_quantity(uint64_t number);
std::string to_quantity(intx::uint256 number);
std::string to_quantity(silkworm::ByteView bytes);

nlohmann::json make_json_content(uint32_t id, const nlohmann::json& result);
nlohmann::json make_json_error(uint32_t id, int32_t code, const std::string& message);

} // namespace silktrace

#endif  // SILKTRACE_JSON_TYPES_HPP_
