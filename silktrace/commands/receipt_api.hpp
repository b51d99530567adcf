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

#ifndef SILKTRACE_COMMANDS_RECEIPT_API_HPP_
#define SILKTRACE_COMMANDS_RECEIPT_API_HPP_

#include <cstddef>
#include <optional>
#include <string>

#include <boost/asio/awaitable.hpp>
#include <nlohmann/json.hpp>

#include <silktrace/common/constants.hpp>
#include <silktrace/core/rawdb/transaction_reader.hpp>

namespace silktrace::commands {

// JSON RPC handlers exposing transaction receipts extended with their internal transactions
class ReceiptRpcApi {
public:
    explicit ReceiptRpcApi(const core::rawdb::TransactionReader& reader, std::size_t max_internal_calls = kDefaultMaxInternalCalls)
        : reader_(reader), max_internal_calls_{max_internal_calls} {}
    virtual ~ReceiptRpcApi() {}

    ReceiptRpcApi(const ReceiptRpcApi&) = delete;
    ReceiptRpcApi& operator=(const ReceiptRpcApi&) = delete;

    //! Dispatch one JSON RPC request to the handler registered for its method
    boost::asio::awaitable<void> handle_request(const nlohmann::json& request, nlohmann::json& reply);

protected:
    boost::asio::awaitable<void> handle_eth_get_transaction_receipt(const nlohmann::json& request, nlohmann::json& reply);
    boost::asio::awaitable<void> handle_sbch_get_tx_list_by_height(const nlohmann::json& request, nlohmann::json& reply);
    boost::asio::awaitable<void> handle_debug_get_internal_call_stack(const nlohmann::json& request, nlohmann::json& reply);

private:
    typedef boost::asio::awaitable<void> (ReceiptRpcApi::*HandleMethod)(const nlohmann::json&, nlohmann::json&);

    static std::optional<HandleMethod> find_handler(const std::string& method);

    const core::rawdb::TransactionReader& reader_;
    std::size_t max_internal_calls_;
};

} // namespace silktrace::commands

#endif  // SILKTRACE_COMMANDS_RECEIPT_API_HPP_
