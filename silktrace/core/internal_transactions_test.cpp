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

#include "internal_transactions.hpp"

#include <optional>
#include <vector>

#include <catch2/catch.hpp>

#include <silktrace/common/util.hpp>
#include <silktrace/core/call_tree.hpp>
#include <silktrace/test/call_trace_fixture.hpp>

namespace silktrace::core {

TEST_CASE("gas_used", "[silktrace][core][internal_transactions]") {
    CallNode node;

    SECTION("untracked gas") {
        node.gas_left = 100;
        CHECK(gas_used(node) == 0);
    }

    SECTION("tracked gas") {
        node.gas = 0xeef6c;
        node.gas_left = 890031;
        CHECK(gas_used(node) == 0x15abd);
    }

    SECTION("all gas consumed") {
        node.gas = 21000;
        node.gas_left = 0;
        CHECK(gas_used(node) == 21000);
    }

    SECTION("gas left above entry gas") {
        node.gas = 100;
        node.gas_left = 200;
        CHECK(gas_used(node) == 0);
    }

    SECTION("negative gas left") {
        node.gas = 100;
        node.gas_left = -1;
        CHECK(gas_used(node) == 0);
    }
}

TEST_CASE("make_internal_transactions with no calls", "[silktrace][core][internal_transactions]") {
    CHECK(make_internal_transactions(std::optional<CallNode>{}).empty());
}

TEST_CASE("make_internal_transactions with nested calls", "[silktrace][core][internal_transactions]") {
    const auto calls = test::sample_calls();
    const auto root = build_call_tree(calls, test::sample_returns());
    const auto internal_transactions = make_internal_transactions(root);
    REQUIRE(internal_transactions.size() == 7);

    SECTION("call paths and gas") {
        struct Expected {
            const char* call_path;
            uint64_t gas;
            uint64_t gas_used;
        };
        const std::vector<Expected> expected{
            {"call_0", 0xeef6c, 0x15abd},
            {"call_0_0", 0xe571e, 0xc26e},
            {"call_0_0_0", 0xdc147, 0x5459},
            {"staticcall_0_0_1", 0xd62ad, 0x24d},
            {"call_0_1", 0xd8c25, 0x2c6e},
            {"call_0_1_0", 0xd434e, 0x959},
            {"staticcall_0_1_1", 0xd2e88, 0x24d},
        };
        for (std::size_t i{0}; i < expected.size(); ++i) {
            const auto& itx = internal_transactions[i];
            CHECK(itx.call_path == expected[i].call_path);
            CHECK(itx.gas == expected[i].gas);
            CHECK(itx.gas_used == expected[i].gas_used);
            CHECK(itx.status == 0);
            CHECK(itx.value == 0);
        }
    }

    SECTION("call data in call order") {
        for (std::size_t i{0}; i < calls.size(); ++i) {
            CHECK(internal_transactions[i].from == calls[i].sender);
            CHECK(internal_transactions[i].to == calls[i].destination);
            CHECK(internal_transactions[i].input == calls[i].input);
        }
    }

    SECTION("outputs from returns") {
        CHECK(internal_transactions[0].output == test::return_data("100"));
        CHECK(internal_transactions[2].output == test::return_data("102"));
        CHECK(internal_transactions[4].output == test::return_data("105"));
        CHECK(internal_transactions[6].output == test::return_data("107"));
    }
}

TEST_CASE("make_internal_transactions with failed call", "[silktrace][core][internal_transactions]") {
    auto calls = test::calls_with_depths({0, 1});
    calls[1].gas = 5000;
    ReturnEvents returns{
        ReturnEvent{silkworm::Bytes{}, 2, 0},
        ReturnEvent{silkworm::Bytes{}, 0, 0},
    };

    const auto internal_transactions = make_internal_transactions(build_call_tree(calls, returns));
    REQUIRE(internal_transactions.size() == 2);
    CHECK(internal_transactions[0].call_path == "call_0");
    CHECK(!internal_transactions[0].gas);
    CHECK(internal_transactions[0].gas_used == 0);
    CHECK(internal_transactions[1].call_path == "call_0_0");
    CHECK(internal_transactions[1].status == 2);
    CHECK(internal_transactions[1].gas_used == 5000);
}

} // namespace silktrace::core
