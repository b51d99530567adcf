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

#include "error.hpp"

#include <string>

namespace silktrace {

namespace {

struct TraceErrorCategory : std::error_category {
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const char* TraceErrorCategory::name() const noexcept { return "trace"; }

std::string TraceErrorCategory::message(int ev) const {
    switch (static_cast<TraceError>(ev)) {
        case TraceError::nonzero_root_depth:
            return "malformed trace: first call has non-zero depth";
        case TraceError::depth_skipped:
            return "malformed trace: call depth skips a nesting level";
        case TraceError::multiple_roots:
            return "malformed trace: more than one top-level call";
        case TraceError::missing_return:
            return "malformed trace: return queue exhausted before open calls";
        case TraceError::unconsumed_return:
            return "malformed trace: returns left after all calls resolved";
        case TraceError::too_many_calls:
            return "trace exceeds the maximum number of internal calls";
        default:
            return "unknown trace error";
    }
}

const TraceErrorCategory kTraceErrorCategory{};

} // namespace

const std::error_category& trace_category() noexcept {
    return kTraceErrorCategory;
}

std::error_code make_error_code(TraceError errc) {
    return {static_cast<int>(errc), kTraceErrorCategory};
}

} // namespace silktrace
