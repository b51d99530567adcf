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

#include "receipts.hpp"

#include <system_error>
#include <vector>

#include <catch2/catch.hpp>
#include <evmc/evmc.hpp>

#include <silktrace/common/util.hpp>
#include <silktrace/core/error.hpp>
#include <silktrace/test/call_trace_fixture.hpp>

namespace silktrace::core {

using evmc::literals::operator""_bytes32;

static Transaction make_transaction() {
    Transaction transaction;
    transaction.hash = 0x2a1e4e4bcd79e35a4e9cce1ba5c7d3c1eeb40a2e4c0ab1b1c4bbf6f7ea3a4ab2_bytes32;
    transaction.block_number = 4;
    transaction.block_hash = 0x7d3fb7b4d6fa5c9aaf7bbf2d3a1a7fbd1cb6bea7a3b8fa0c9e9c9c3c8f1d2e3a_bytes32;
    transaction.transaction_index = 1;
    transaction.from = test::kCaller;
    transaction.to = test::kContract1;
    transaction.gas_used = 0x1a2b3;
    transaction.cumulative_gas_used = 0x3c4d5;
    transaction.success = true;
    transaction.internal_calls = test::sample_calls();
    transaction.internal_returns = test::sample_returns();
    return transaction;
}

TEST_CASE("make_call_stack", "[silktrace][core][receipts]") {
    const auto transaction = make_transaction();

    SECTION("within limit") {
        const auto call_stack = make_call_stack(transaction);
        REQUIRE(call_stack);
        CHECK(call_stack->calls.size() == 2);
    }

    SECTION("exactly at limit") {
        CHECK(make_call_stack(transaction, 7));
    }

    SECTION("over limit") {
        CHECK_THROWS_MATCHES(make_call_stack(transaction, 6), std::system_error,
            Catch::Matchers::Predicate<std::system_error>(
                [](const std::system_error& se) { return se.code() == make_error_code(TraceError::too_many_calls); }));
    }

    SECTION("no internal calls") {
        Transaction plain_transfer;
        CHECK(!make_call_stack(plain_transfer));
    }
}

TEST_CASE("make_call_stack from recorded trace", "[silktrace][core][receipts]") {
    const auto calls = test::sample_calls();
    const auto returns = test::sample_returns();

    SECTION("default limit") {
        const auto call_stack = make_call_stack(calls, returns);
        REQUIRE(call_stack);
        CHECK(call_stack->gas_left == 890031);
    }

    SECTION("over limit") {
        CHECK_THROWS_MATCHES(make_call_stack(calls, returns, 1), std::system_error,
            Catch::Matchers::Predicate<std::system_error>(
                [](const std::system_error& se) { return se.code() == make_error_code(TraceError::too_many_calls); }));
    }

    SECTION("empty trace") {
        CHECK(!make_call_stack(CallEvents{}, ReturnEvents{}, 0));
    }
}

TEST_CASE("make_receipt", "[silktrace][core][receipts]") {
    const auto transaction = make_transaction();
    const auto receipt = make_receipt(transaction);

    CHECK(receipt.success);
    CHECK(receipt.tx_hash == transaction.hash);
    CHECK(receipt.block_number == 4);
    CHECK(receipt.block_hash == transaction.block_hash);
    CHECK(receipt.tx_index == 1);
    CHECK(receipt.from == test::kCaller);
    CHECK(receipt.to == test::kContract1);
    CHECK(!receipt.contract_address);
    CHECK(receipt.gas_used == 0x1a2b3);
    CHECK(receipt.cumulative_gas_used == 0x3c4d5);
    REQUIRE(receipt.internal_transactions.size() == 7);
    CHECK(receipt.internal_transactions[0].call_path == "call_0");
    CHECK(receipt.internal_transactions[6].call_path == "staticcall_0_1_1");
}

TEST_CASE("make_receipt with malformed trace", "[silktrace][core][receipts]") {
    auto transaction = make_transaction();
    transaction.internal_returns.pop_back();
    CHECK_THROWS_AS(make_receipt(transaction), std::system_error);
}

TEST_CASE("make_receipts", "[silktrace][core][receipts]") {
    auto first = make_transaction();
    auto second = make_transaction();
    second.transaction_index = 2;
    second.internal_calls.clear();
    second.internal_returns.clear();

    const auto receipts = make_receipts(std::vector<Transaction>{first, second});
    REQUIRE(receipts.size() == 2);
    CHECK(receipts[0].tx_index == 1);
    CHECK(receipts[0].internal_transactions.size() == 7);
    CHECK(receipts[1].tx_index == 2);
    CHECK(receipts[1].internal_transactions.empty());

    CHECK(make_receipts(std::vector<Transaction>{}).empty());
}

} // namespace silktrace::core
