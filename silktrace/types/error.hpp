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

#ifndef SILKTRACE_TYPES_ERROR_HPP_
#define SILKTRACE_TYPES_ERROR_HPP_

#include <cstdint>
#include <iostream>
#include <string>

namespace silktrace {

struct Error {
    int32_t code{0};
    std::string message;
};

std::ostream& operator<<(std::ostream& out, const Error& error);

} // namespace silktrace

#endif  // SILKTRACE_TYPES_ERROR_HPP_
