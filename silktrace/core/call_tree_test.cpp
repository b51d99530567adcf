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

#include "call_tree.hpp"

#include <string>
#include <system_error>
#include <vector>

#include <catch2/catch.hpp>

#include <silktrace/common/util.hpp>
#include <silktrace/test/call_trace_fixture.hpp>

namespace silktrace::core {

static Catch::Matchers::Generic::PredicateMatcher<std::system_error> is_trace_error(TraceError expected) {
    return Catch::Matchers::Predicate<std::system_error>(
        [=](const std::system_error& se) { return se.code() == make_error_code(expected); },
        "trace error " + make_error_code(expected).message());
}

TEST_CASE("build_call_tree with no calls", "[silktrace][core][call_tree]") {
    SECTION("no returns gives no tree") {
        const auto root = build_call_tree(CallEvents{}, ReturnEvents{});
        CHECK(!root);
    }

    SECTION("returns without calls are rejected") {
        CHECK_THROWS_MATCHES(build_call_tree(CallEvents{}, test::successful_returns(1)), std::system_error, is_trace_error(TraceError::unconsumed_return));
    }
}

TEST_CASE("build_call_tree with single call", "[silktrace][core][call_tree]") {
    CallEvents calls{test::sample_calls()[0]};
    ReturnEvents returns{ReturnEvent{*silkworm::from_hex("0x01"), 0, 100}};

    const auto root = build_call_tree(calls, returns);
    REQUIRE(root);
    CHECK(root->depth == 0);
    CHECK(root->from == test::kCaller);
    CHECK(root->to == test::kContract1);
    CHECK(root->input == calls[0].input);
    CHECK(root->output == *silkworm::from_hex("0x01"));
    CHECK(root->gas_left == 100);
    CHECK(root->calls.empty());
    CHECK(count_calls(*root) == 1);
}

TEST_CASE("build_call_tree with nested calls", "[silktrace][core][call_tree]") {
    const auto calls = test::sample_calls();
    const auto returns = test::sample_returns();

    const auto root = build_call_tree(calls, returns);
    REQUIRE(root);
    CHECK(count_calls(*root) == calls.size());

    SECTION("shape follows call depths") {
        REQUIRE(root->calls.size() == 2);
        CHECK(root->calls[0].calls.size() == 2);
        CHECK(root->calls[1].calls.size() == 2);
        for (const auto& child : root->calls) {
            CHECK(child.depth == 1);
            CHECK(child.from == test::kContract1);
            CHECK(child.to == test::kContract2);
            for (const auto& grandchild : child.calls) {
                CHECK(grandchild.depth == 2);
                CHECK(grandchild.from == test::kContract2);
                CHECK(grandchild.to == test::kContract3);
                CHECK(grandchild.calls.empty());
            }
        }
    }

    SECTION("pre-order visit matches call order") {
        std::vector<const CallNode*> pre_order{
            &*root,
            &root->calls[0], &root->calls[0].calls[0], &root->calls[0].calls[1],
            &root->calls[1], &root->calls[1].calls[0], &root->calls[1].calls[1],
        };
        REQUIRE(pre_order.size() == calls.size());
        for (std::size_t i{0}; i < calls.size(); ++i) {
            CHECK(pre_order[i]->input == calls[i].input);
            CHECK(pre_order[i]->kind == calls[i].kind);
            CHECK(pre_order[i]->gas == calls[i].gas);
        }
    }

    SECTION("returns are assigned in completion order") {
        CHECK(root->calls[0].calls[0].gas_left == 879854);
        CHECK(root->calls[0].calls[1].gas_left == 876640);
        CHECK(root->calls[0].gas_left == 890032);
        CHECK(root->calls[1].calls[0].gas_left == 866805);
        CHECK(root->calls[1].calls[1].gas_left == 863291);
        CHECK(root->calls[1].gas_left == 876471);
        CHECK(root->gas_left == 890031);
        CHECK(root->output == test::return_data("100"));
        CHECK(root->calls[1].calls[1].output == test::return_data("107"));
    }
}

TEST_CASE("build_call_tree with sibling chain", "[silktrace][core][call_tree]") {
    const auto root = build_call_tree(test::calls_with_depths({0, 1, 1, 1}), test::successful_returns(4));
    REQUIRE(root);
    CHECK(root->calls.size() == 3);
    CHECK(count_calls(*root) == 4);
}

TEST_CASE("build_call_tree with deep chain", "[silktrace][core][call_tree]") {
    const auto root = build_call_tree(test::calls_with_depths({0, 1, 2, 3, 4}), test::successful_returns(5));
    REQUIRE(root);
    const CallNode* node = &*root;
    for (int32_t depth{0}; depth < 4; ++depth) {
        CHECK(node->depth == depth);
        REQUIRE(node->calls.size() == 1);
        node = &node->calls[0];
    }
    CHECK(node->depth == 4);
    CHECK(node->calls.empty());
}

TEST_CASE("build_call_tree rejects malformed traces", "[silktrace][core][call_tree]") {
    SECTION("first call not at depth zero") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({1, 2}), test::successful_returns(2)), std::system_error, is_trace_error(TraceError::nonzero_root_depth));
    }

    SECTION("depth skips a level") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({0, 2}), test::successful_returns(2)), std::system_error, is_trace_error(TraceError::depth_skipped));
    }

    SECTION("second top-level call") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({0, 1, 0}), test::successful_returns(3)), std::system_error, is_trace_error(TraceError::multiple_roots));
    }

    SECTION("fewer returns than calls") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({0, 1, 1}), test::successful_returns(2)), std::system_error, is_trace_error(TraceError::missing_return));
    }

    SECTION("no returns at all") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({0}), ReturnEvents{}), std::system_error, is_trace_error(TraceError::missing_return));
    }

    SECTION("more returns than calls") {
        CHECK_THROWS_MATCHES(build_call_tree(test::calls_with_depths({0, 1}), test::successful_returns(3)), std::system_error, is_trace_error(TraceError::unconsumed_return));
    }
}

TEST_CASE("trace error category", "[silktrace][core][call_tree]") {
    const std::error_code ec = TraceError::depth_skipped;
    CHECK(ec.category() == trace_category());
    CHECK(std::string{ec.category().name()} == "trace");
    CHECK(ec.message() == "malformed trace: call depth skips a nesting level");
    CHECK(make_error_code(TraceError::too_many_calls).message() == "trace exceeds the maximum number of internal calls");
}

} // namespace silktrace::core
