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

#include "receipt_api.hpp"

#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <string>
#include <system_error>

#include <silktrace/commands/methods.hpp>
#include <silktrace/common/log.hpp>
#include <silktrace/common/util.hpp>
#include <silktrace/core/error.hpp>
#include <silktrace/core/receipts.hpp>
#include <silktrace/json/types.hpp>

namespace silktrace::commands {

static nlohmann::json make_json_trace_error(const nlohmann::json& request, const std::system_error& se) {
    if (se.code().category() == trace_category()) {
        SILKTRACE_WARN << "rejected trace: " << se.what() << " processing request: " << request.dump() << "\n";
    } else {
        SILKTRACE_ERROR << "system_error: " << se.what() << " processing request: " << request.dump() << "\n";
    }
    return make_json_error(request["id"], kServerErrorCode, se.what());
}

// transaction hash given as the single request parameter
static std::optional<evmc::bytes32> hash_from_params(const nlohmann::json& params) {
    if (!params.is_array() || params.size() != 1 || !params[0].is_string()) {
        return std::nullopt;
    }
    try {
        return params[0].get<evmc::bytes32>();
    } catch (const std::system_error& se) {
        SILKTRACE_DEBUG << "invalid transaction hash: " << se.what() << "\n";
        return std::nullopt;
    }
}

std::optional<ReceiptRpcApi::HandleMethod> ReceiptRpcApi::find_handler(const std::string& method) {
    static const std::map<std::string, HandleMethod> handlers{
        {method::k_eth_getTransactionReceipt, &ReceiptRpcApi::handle_eth_get_transaction_receipt},
        {method::k_sbch_getTxListByHeight, &ReceiptRpcApi::handle_sbch_get_tx_list_by_height},
        {method::k_debug_getInternalCallStack, &ReceiptRpcApi::handle_debug_get_internal_call_stack},
    };
    const auto handle_method_pair = handlers.find(method);
    if (handle_method_pair == handlers.end()) {
        return std::nullopt;
    }
    return handle_method_pair->second;
}

boost::asio::awaitable<void> ReceiptRpcApi::handle_request(const nlohmann::json& request, nlohmann::json& reply) {
    SILKTRACE_DEBUG << "handle_request: " << request.dump() << "\n";

    const bool has_id = request.is_object() && request.contains("id") && request["id"].is_number_unsigned();
    const uint32_t request_id = has_id ? request["id"].get<uint32_t>() : 0;
    if (!has_id || !request.contains("method") || !request["method"].is_string()) {
        SILKTRACE_ERROR << "invalid request: " << request.dump() << "\n";
        reply = make_json_error(request_id, kInvalidRequestErrorCode, "invalid request: id or method missing");
        co_return;
    }

    const auto method = request["method"].get<std::string>();
    const auto handle_method = find_handler(method);
    if (!handle_method) {
        SILKTRACE_WARN << "method not found: " << method << "\n";
        reply = make_json_error(request_id, kMethodNotFoundErrorCode, "the method " + method + " does not exist/is not available");
        co_return;
    }

    co_await (this->*(*handle_method))(request, reply);
}

// https://eth.wiki/json-rpc/API#eth_gettransactionreceipt
boost::asio::awaitable<void> ReceiptRpcApi::handle_eth_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply) {
    const auto params = request.value("params", nlohmann::json::array());
    const auto hash = hash_from_params(params);
    if (!hash) {
        auto error_msg = std::string{"invalid "} + method::k_eth_getTransactionReceipt + " params: " + params.dump();
        SILKTRACE_ERROR << error_msg << "\n";
        reply = make_json_error(request["id"], kInvalidParamsErrorCode, error_msg);
        co_return;
    }
    const auto transaction_hash = *hash;
    SILKTRACE_DEBUG << "transaction_hash: " << transaction_hash << "\n";

    try {
        const auto transaction = co_await reader_.read_transaction(transaction_hash);
        if (!transaction) {
            SILKTRACE_DEBUG << "transaction not found: " << transaction_hash << "\n";
            reply = make_json_content(request["id"], nullptr);
            co_return;
        }
        const auto receipt = core::make_receipt(*transaction, max_internal_calls_);
        SILKTRACE_TRACE << "receipt: " << receipt << "\n";
        reply = make_json_content(request["id"], receipt);
    } catch (const std::system_error& se) {
        reply = make_json_trace_error(request, se);
    } catch (const std::exception& e) {
        SILKTRACE_ERROR << "exception: " << e.what() << " processing request: " << request.dump() << "\n";
        reply = make_json_error(request["id"], kServerErrorCode, e.what());
    }

    co_return;
}

boost::asio::awaitable<void> ReceiptRpcApi::handle_sbch_get_tx_list_by_height(const nlohmann::json& request, nlohmann::json& reply) {
    const auto params = request.value("params", nlohmann::json::array());
    if (!params.is_array() || params.size() != 1) {
        auto error_msg = std::string{"invalid "} + method::k_sbch_getTxListByHeight + " params: " + params.dump();
        SILKTRACE_ERROR << error_msg << "\n";
        reply = make_json_error(request["id"], kInvalidParamsErrorCode, error_msg);
        co_return;
    }

    try {
        const auto height = quantity_from_json(params[0]);
        SILKTRACE_DEBUG << "height: " << height << "\n";

        const auto transactions = co_await reader_.read_transactions_by_height(height);
        const auto receipts = core::make_receipts(transactions, max_internal_calls_);
        reply = make_json_content(request["id"], receipts);
    } catch (const std::system_error& se) {
        reply = make_json_trace_error(request, se);
    } catch (const std::exception& e) {
        SILKTRACE_ERROR << "exception: " << e.what() << " processing request: " << request.dump() << "\n";
        reply = make_json_error(request["id"], kServerErrorCode, e.what());
    }

    co_return;
}

boost::asio::awaitable<void> ReceiptRpcApi::handle_debug_get_internal_call_stack(const nlohmann::json& request, nlohmann::json& reply) {
    const auto params = request.value("params", nlohmann::json::array());
    const auto hash = hash_from_params(params);
    if (!hash) {
        auto error_msg = std::string{"invalid "} + method::k_debug_getInternalCallStack + " params: " + params.dump();
        SILKTRACE_ERROR << error_msg << "\n";
        reply = make_json_error(request["id"], kInvalidParamsErrorCode, error_msg);
        co_return;
    }
    const auto transaction_hash = *hash;
    SILKTRACE_DEBUG << "transaction_hash: " << transaction_hash << "\n";

    try {
        const auto transaction = co_await reader_.read_transaction(transaction_hash);
        if (!transaction) {
            reply = make_json_content(request["id"], nullptr);
            co_return;
        }
        const auto call_stack = core::make_call_stack(*transaction, max_internal_calls_);
        if (call_stack) {
            reply = make_json_content(request["id"], *call_stack);
        } else {
            reply = make_json_content(request["id"], nullptr);
        }
    } catch (const std::system_error& se) {
        reply = make_json_trace_error(request, se);
    } catch (const std::exception& e) {
        SILKTRACE_ERROR << "exception: " << e.what() << " processing request: " << request.dump() << "\n";
        reply = make_json_error(request["id"], kServerErrorCode, e.what());
    }

    co_return;
}

} // namespace silktrace::commands
