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

#include "call_path.hpp"

#include <map>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <silktrace/core/call_tree.hpp>
#include <silktrace/test/call_trace_fixture.hpp>

namespace silktrace::core {

static std::vector<std::string> call_paths(const LabeledCalls& labeled_calls) {
    std::vector<std::string> paths;
    for (const auto& labeled_call : labeled_calls) {
        paths.push_back(labeled_call.call_path);
    }
    return paths;
}

TEST_CASE("make_call_path", "[silktrace][core][call_path]") {
    CHECK(make_call_path(CallKind::kCall, "call_0", 0) == "call_0_0");
    CHECK(make_call_path(CallKind::kStaticCall, "call_0_1", 1) == "staticcall_0_1_1");
    CHECK(make_call_path(CallKind::kDelegateCall, "staticcall_0_1", 12) == "delegatecall_0_1_12");
    CHECK(make_call_path(CallKind::kCreate2, "call_0", 3) == "create2_0_3");
}

TEST_CASE("call_path_ordinals", "[silktrace][core][call_path]") {
    CHECK(call_path_ordinals("call_0") == "0");
    CHECK(call_path_ordinals("staticcall_0_1_1") == "0_1_1");
    CHECK(call_path_ordinals("callcode_0_2") == "0_2");
    CHECK(call_path_ordinals("call").empty());
}

TEST_CASE("label_call_tree with single call", "[silktrace][core][call_path]") {
    CallNode root;
    root.kind = CallKind::kStaticCall;
    const auto labeled_calls = label_call_tree(root);
    REQUIRE(labeled_calls.size() == 1);
    CHECK(labeled_calls[0].call_path == "call_0");
    CHECK(labeled_calls[0].node == &root);
}

TEST_CASE("label_call_tree with nested calls", "[silktrace][core][call_path]") {
    const auto root = build_call_tree(test::sample_calls(), test::sample_returns());
    REQUIRE(root);

    const auto labeled_calls = label_call_tree(*root);

    SECTION("paths in pre-order") {
        CHECK(call_paths(labeled_calls) == std::vector<std::string>{
            "call_0",
            "call_0_0",
            "call_0_0_0",
            "staticcall_0_0_1",
            "call_0_1",
            "call_0_1_0",
            "staticcall_0_1_1",
        });
    }

    SECTION("labels point to their nodes") {
        REQUIRE(labeled_calls.size() == 7);
        CHECK(labeled_calls[0].node == &*root);
        CHECK(labeled_calls[1].node == &root->calls[0]);
        CHECK(labeled_calls[3].node == &root->calls[0].calls[1]);
        CHECK(labeled_calls[6].node == &root->calls[1].calls[1]);
    }

    SECTION("labelling twice gives the same paths") {
        CHECK(call_paths(label_call_tree(*root)) == call_paths(labeled_calls));
    }

    SECTION("paths are unique") {
        std::map<std::string, const CallNode*> by_path;
        for (const auto& labeled_call : labeled_calls) {
            CHECK(by_path.emplace(labeled_call.call_path, labeled_call.node).second);
        }
    }

    SECTION("children are found by parent ordinals") {
        // every non-root call is the child of the call whose ordinals prefix its own
        std::map<std::string, std::vector<const CallNode*>> children;
        for (std::size_t i{1}; i < labeled_calls.size(); ++i) {
            const std::string ordinals{call_path_ordinals(labeled_calls[i].call_path)};
            const auto parent_ordinals = ordinals.substr(0, ordinals.rfind('_'));
            children[parent_ordinals].push_back(labeled_calls[i].node);
        }
        for (const auto& labeled_call : labeled_calls) {
            const std::string ordinals{call_path_ordinals(labeled_call.call_path)};
            const auto& calls = labeled_call.node->calls;
            const auto& found = children[ordinals];
            REQUIRE(found.size() == calls.size());
            for (std::size_t i{0}; i < calls.size(); ++i) {
                CHECK(found[i] == &calls[i]);
            }
        }
    }
}

TEST_CASE("label_call_tree uses call kind of each child", "[silktrace][core][call_path]") {
    CallNode root;
    root.calls.resize(3);
    root.calls[0].kind = CallKind::kDelegateCall;
    root.calls[1].kind = CallKind::kCreate;
    root.calls[2].kind = CallKind::kCallCode;
    root.calls[1].calls.resize(1);
    root.calls[1].calls[0].kind = CallKind::kCreate2;

    CHECK(call_paths(label_call_tree(root)) == std::vector<std::string>{
        "call_0",
        "delegatecall_0_0",
        "create_0_1",
        "create2_0_1_0",
        "callcode_0_2",
    });
}

} // namespace silktrace::core
