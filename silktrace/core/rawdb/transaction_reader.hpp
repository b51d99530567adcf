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

#ifndef SILKTRACE_CORE_RAWDB_TRANSACTION_READER_HPP_
#define SILKTRACE_CORE_RAWDB_TRANSACTION_READER_HPP_

#include <cstdint>
#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>

#include <silktrace/types/transaction.hpp>

namespace silktrace::core::rawdb {

// Access to executed transactions kept by the node storage
class TransactionReader {
public:
    virtual ~TransactionReader() = default;

    virtual boost::asio::awaitable<std::optional<Transaction>> read_transaction(const evmc::bytes32& hash) const = 0;

    //! Transactions of the block at \p height in transaction-index order, empty if unknown
    virtual boost::asio::awaitable<std::vector<Transaction>> read_transactions_by_height(uint64_t height) const = 0;
};

} // namespace silktrace::core::rawdb

#endif  // SILKTRACE_CORE_RAWDB_TRANSACTION_READER_HPP_
