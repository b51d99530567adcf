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

#include "log.hpp"

#include <iostream>
#include <string>
#include <thread>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace silktrace {

LogLevel log_verbosity_{LogLevel::Info};
bool log_thread_enabled_{false};
std::mutex log_::log_mtx_;

static std::ostream* log_streams_[2]{&std::cout, &std::cerr};

class NullBuffer : public std::streambuf {
  public:
    int overflow(int c) override { return c; }
};

std::ostream& null_stream() {
    static NullBuffer null_buffer;
    static std::ostream null_ostream{&null_buffer};
    return null_ostream;
}

void log_set_streams_(std::ostream& o1, std::ostream& o2) {
    std::lock_guard<std::mutex> lock{log_::log_mtx_};
    log_streams_[0] = &o1;
    log_streams_[1] = &o2;
}

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return " INFO";
        case LogLevel::Warn: return " WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return " CRIT";
        default: return "     ";
    }
}

std::ostream& log_::header_(LogLevel level) {
    // errors and worse go to the second stream
    auto& out = (level >= LogLevel::Error && level != LogLevel::None) ? *log_streams_[1] : *log_streams_[0];
    out << level_tag(level) << " [" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), absl::UTCTimeZone()) << "]";
    if (log_thread_enabled_) {
        out << " [" << std::this_thread::get_id() << "]";
    }
    return out;
}

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error) {
    if (text == "n") {
        *level = LogLevel::None;
        return true;
    }
    if (text == "c") {
        *level = LogLevel::Critical;
        return true;
    }
    if (text == "e") {
        *level = LogLevel::Error;
        return true;
    }
    if (text == "w") {
        *level = LogLevel::Warn;
        return true;
    }
    if (text == "i") {
        *level = LogLevel::Info;
        return true;
    }
    if (text == "d") {
        *level = LogLevel::Debug;
        return true;
    }
    if (text == "t") {
        *level = LogLevel::Trace;
        return true;
    }
    *error = "unknown value for LogLevel";
    return false;
}

std::string AbslUnparseFlag(LogLevel level) {
    switch (level) {
        case LogLevel::None: return "n";
        case LogLevel::Critical: return "c";
        case LogLevel::Error: return "e";
        case LogLevel::Warn: return "w";
        case LogLevel::Info: return "i";
        case LogLevel::Debug: return "d";
        case LogLevel::Trace: return "t";
        default: return absl::StrCat(static_cast<int>(level));
    }
}

} // namespace silktrace
