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

#ifndef SILKTRACE_TEST_MOCK_TRANSACTION_READER_HPP_
#define SILKTRACE_TEST_MOCK_TRANSACTION_READER_HPP_

#include <optional>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <evmc/evmc.hpp>
#include <gmock/gmock.h>

#include <silktrace/core/rawdb/transaction_reader.hpp>
#include <silktrace/types/transaction.hpp>

namespace silktrace::test {

class MockTransactionReader : public core::rawdb::TransactionReader {
public:
    MOCK_CONST_METHOD1(read_transaction, boost::asio::awaitable<std::optional<Transaction>>(const evmc::bytes32&));
    MOCK_CONST_METHOD1(read_transactions_by_height, boost::asio::awaitable<std::vector<Transaction>>(uint64_t));
};

}  // namespace silktrace::test

#endif  // SILKTRACE_TEST_MOCK_TRANSACTION_READER_HPP_
