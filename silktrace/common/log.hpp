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

#ifndef SILKTRACE_COMMON_LOG_HPP_
#define SILKTRACE_COMMON_LOG_HPP_

#include <absl/strings/string_view.h>

#include <mutex>
#include <ostream>
#include <string>

namespace silktrace {

// available verbosity levels
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, None };

// silence
std::ostream& null_stream();

//
// Below are for access via macros ONLY.
//
extern LogLevel log_verbosity_;
extern bool log_thread_enabled_;
void log_set_streams_(std::ostream& o1, std::ostream& o2);
class log_ {
  public:
    explicit log_(LogLevel level) : level_(level) { log_mtx_.lock(); }
    ~log_() { log_mtx_.unlock(); }
    std::ostream& header_(LogLevel);
    template <class T>
    std::ostream& operator<<(const T& message) {
        return header_(level_) << message;
    }

  private:
    friend void log_set_streams_(std::ostream& o1, std::ostream& o2);

    LogLevel level_;
    static std::mutex log_mtx_;
};

#define SILKTRACE_LOG_AT(level_) if ((level_) < silktrace::log_verbosity_) {} else silktrace::log_(level_) << " " // NOLINT

#define SILKTRACE_TRACE SILKTRACE_LOG_AT(silktrace::LogLevel::Trace)
#define SILKTRACE_DEBUG SILKTRACE_LOG_AT(silktrace::LogLevel::Debug)
#define SILKTRACE_INFO  SILKTRACE_LOG_AT(silktrace::LogLevel::Info)
#define SILKTRACE_WARN  SILKTRACE_LOG_AT(silktrace::LogLevel::Warn)
#define SILKTRACE_ERROR SILKTRACE_LOG_AT(silktrace::LogLevel::Error)
#define SILKTRACE_CRIT  SILKTRACE_LOG_AT(silktrace::LogLevel::Critical)
#define SILKTRACE_LOG   SILKTRACE_LOG_AT(silktrace::LogLevel::None)

#define SILKTRACE_LOG_VERBOSITY(level_) (silktrace::log_verbosity_ = (level_))

#define SILKTRACE_LOG_THREAD(log_thread_) (silktrace::log_thread_enabled_ = (log_thread_))

#define SILKTRACE_LOG_STREAMS(stream1_, stream2_) silktrace::log_set_streams_((stream1_), (stream2_))

bool AbslParseFlag(absl::string_view text, LogLevel* level, std::string* error);
std::string AbslUnparseFlag(LogLevel level);

} // namespace silktrace

#endif  // SILKTRACE_COMMON_LOG_HPP_
