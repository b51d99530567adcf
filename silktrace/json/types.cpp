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

#include "types.hpp"

#include <stdexcept>
#include <string>
#include <system_error>

#include <boost/endian/conversion.hpp>
#include <silkworm/common/endian.hpp>
#include <silkworm/common/util.hpp>

#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = "0x" + silkworm::to_hex(silktrace::full_view(addr));
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto hex = json.get<std::string>();
    const auto address_bytes = silkworm::from_hex(hex);
    if (!address_bytes || address_bytes->size() != sizeof(addr.bytes)) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid address: " + hex};
    }
    addr = silkworm::to_evmc_address(*address_bytes);
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = "0x" + silkworm::to_hex(silktrace::full_view(b32));
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto hex = json.get<std::string>();
    const auto b32_bytes = silkworm::from_hex(hex);
    if (!b32_bytes || b32_bytes->size() != sizeof(b32.bytes)) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid bytes32: " + hex};
    }
    b32 = silkworm::to_bytes32(*b32_bytes);
}

} // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    if (json.is_number_unsigned()) {
        ui256 = json.get<uint64_t>();
        return;
    }
    const auto quantity = json.get<std::string>();
    try {
        ui256 = intx::from_string<intx::uint256>(quantity);
    } catch (const std::invalid_argument& ia) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid uint256 " + quantity + ": " + ia.what()};
    } catch (const std::out_of_range& oor) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid uint256 " + quantity + ": " + oor.what()};
    }
}

} // namespace intx

namespace silktrace {

void to_json(nlohmann::json& json, const CallKind& kind) {
    json = to_string(kind);
}

void from_json(const nlohmann::json& json, CallKind& kind) {
    const auto name = json.get<std::string>();
    const auto call_kind = call_kind_from_string(name);
    if (!call_kind) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "CallKind: unknown kind " + name};
    }
    kind = *call_kind;
}

void from_json(const nlohmann::json& json, CallEvent& call) {
    call.depth = json.at("depth").get<int32_t>();
    call.sender = json.at("from").get<evmc::address>();
    call.destination = json.at("to").get<evmc::address>();
    call.input = bytes_from_json(json.at("input"));
    if (json.contains("kind")) {
        call.kind = json["kind"].get<CallKind>();
    }
    if (json.contains("gas")) {
        call.gas = quantity_from_json(json["gas"]);
    }
    if (json.contains("value")) {
        call.value = json["value"].get<intx::uint256>();
    }
}

void from_json(const nlohmann::json& json, ReturnEvent& ret) {
    ret.output = bytes_from_json(json.at("output"));
    ret.status_code = json.at("statusCode").get<int32_t>();
    ret.gas_left = json.at("gasLeft").get<int64_t>();
}

void to_json(nlohmann::json& json, const CallNode& node) {
    json["From"] = node.from;
    json["To"] = node.to;
    json["Input"] = "0x" + silkworm::to_hex(node.input);
    json["Output"] = "0x" + silkworm::to_hex(node.output);
    json["StatusCode"] = node.status_code;
    json["GasLeft"] = node.gas_left;
    if (node.calls.empty()) {
        json["Calls"] = nlohmann::json::value_t::null;
    } else {
        json["Calls"] = node.calls;
    }
}

void to_json(nlohmann::json& json, const InternalTransaction& itx) {
    json["callPath"] = itx.call_path;
    json["from"] = itx.from;
    json["to"] = itx.to;
    if (itx.gas) {
        json["gas"] = to_quantity(*itx.gas);
    }
    json["value"] = to_quantity(itx.value);
    json["input"] = "0x" + silkworm::to_hex(itx.input);
    json["status"] = to_quantity(static_cast<uint32_t>(itx.status));
    json["gasUsed"] = to_quantity(itx.gas_used);
    json["output"] = "0x" + silkworm::to_hex(itx.output);
}

void to_json(nlohmann::json& json, const Log& log) {
    json["address"] = log.address;
    json["topics"] = log.topics;
    json["data"] = "0x" + silkworm::to_hex(log.data);
    json["blockNumber"] = to_quantity(log.block_number);
    json["blockHash"] = log.block_hash;
    json["transactionHash"] = log.tx_hash;
    json["transactionIndex"] = to_quantity(log.tx_index);
    json["logIndex"] = to_quantity(log.index);
    json["removed"] = log.removed;
}

void to_json(nlohmann::json& json, const Receipt& receipt) {
    json["blockHash"] = receipt.block_hash;
    json["blockNumber"] = to_quantity(receipt.block_number);
    json["transactionHash"] = receipt.tx_hash;
    json["transactionIndex"] = to_quantity(receipt.tx_index);
    json["from"] = receipt.from;
    if (receipt.to) {
        json["to"] = *receipt.to;
    } else {
        json["to"] = nlohmann::json{};
    }
    json["gasUsed"] = to_quantity(receipt.gas_used);
    json["cumulativeGasUsed"] = to_quantity(receipt.cumulative_gas_used);
    if (receipt.contract_address) {
        json["contractAddress"] = *receipt.contract_address;
    } else {
        json["contractAddress"] = nlohmann::json{};
    }
    json["logs"] = receipt.logs;
    json["logsBloom"] = "0x" + silkworm::to_hex(silkworm::ByteView{receipt.bloom.data(), receipt.bloom.size()});
    json["status"] = to_quantity(receipt.success ? 1 : 0);
    json["internalTransactions"] = receipt.internal_transactions;
}

void to_json(nlohmann::json& json, const Error& error) {
    json = {{"code", error.code}, {"message", error.message}};
}

silkworm::Bytes bytes_from_json(const nlohmann::json& json) {
    const auto hex = json.get<std::string>();
    const auto bytes = silkworm::from_hex(hex);
    if (!bytes) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid hex bytes: " + hex};
    }
    return *bytes;
}

uint64_t quantity_from_json(const nlohmann::json& json) {
    if (json.is_number_unsigned()) {
        return json.get<uint64_t>();
    }
    const auto quantity = json.get<std::string>();
    if (quantity.size() < 3 || quantity.rfind("0x", 0) != 0) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid quantity: " + quantity};
    }
    std::size_t processed{0};
    uint64_t number{0};
    try {
        number = std::stoull(quantity, &processed, 16);
    } catch (const std::out_of_range&) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "quantity out of range: " + quantity};
    } catch (const std::invalid_argument&) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid quantity: " + quantity};
    }
    if (processed != quantity.size()) {
        throw std::system_error{std::make_error_code(std::errc::invalid_argument), "invalid quantity: " + quantity};
    }
    return number;
}

std::string to_hex_no_leading_zeros(silkworm::ByteView bytes) {
    static const char* kHexDigits{"0123456789abcdef"};

    std::string out{};

    if (bytes.length() == 0) {
        out.reserve(1);
        out.push_back('0');
        return out;
    }

    out.reserve(2 * bytes.length());

    bool found_nonzero{false};
    for (size_t i{0}; i < bytes.length(); ++i) {
        uint8_t x{bytes[i]};
        char lo{kHexDigits[x & 0x0f]};
        char hi{kHexDigits[x >> 4]};
        if (!found_nonzero && hi != '0') {
            found_nonzero = true;
        }
        if (found_nonzero) {
            out.push_back(hi);
        }
        if (!found_nonzero && lo != '0') {
            found_nonzero = true;
        }
        if (found_nonzero || i == bytes.length() - 1) {
            out.push_back(lo);
        }
    }

    return out;
}

std::string to_hex_no_leading_zeros(uint64_t number) {
    silkworm::Bytes number_bytes(8, '\0');
    boost::endian::store_big_u64(&number_bytes[0], number);
    return to_hex_no_leading_zeros(number_bytes);
}

std::string to_quantity(silkworm::ByteView bytes) {
    return "0x" + to_hex_no_leading_zeros(bytes);
}

std::string to_quantity(uint64_t number) {
    return "0x" + to_hex_no_leading_zeros(number);
}

std::string to_quantity(intx::uint256 number) {
    if (number == 0) {
       return "0x0";
    }
    return to_quantity(silkworm::endian::to_big_compact(number));
}

nlohmann::json make_json_content(uint32_t id, const nlohmann::json& result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

nlohmann::json make_json_error(uint32_t id, int32_t code, const std::string& message) {
    const Error error{code, message};
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

} // namespace silktrace
