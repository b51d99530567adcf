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

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <nlohmann/json.hpp>

#include <silktrace/commands/call_trace_output.hpp>
#include <silktrace/common/constants.hpp>
#include <silktrace/common/log.hpp>

ABSL_FLAG(std::string, trace_file, "", "JSON file holding the calls and returns arrays of one transaction");
ABSL_FLAG(std::string, output, silktrace::kInternalTransactionsOutput, "output shape as string: callstack or internal");
ABSL_FLAG(uint32_t, maxCalls, static_cast<uint32_t>(silktrace::kDefaultMaxInternalCalls), "maximum number of internal calls accepted as 32-bit integer");
ABSL_FLAG(silktrace::LogLevel, logLevel, silktrace::LogLevel::Critical, "logging level");

int main(int argc, char* argv[]) {
    absl::SetProgramUsageMessage("Rebuild the internal call tree of a transaction from its recorded call trace");
    absl::ParseCommandLine(argc, argv);

    SILKTRACE_LOG_VERBOSITY(absl::GetFlag(FLAGS_logLevel));

    auto trace_file{absl::GetFlag(FLAGS_trace_file)};
    if (trace_file.empty() || !std::filesystem::exists(trace_file)) {
        std::cerr << "Parameter trace_file is invalid: [" << trace_file << "]\n";
        std::cerr << "Use --trace_file flag to specify the path of the JSON call trace\n";
        return -1;
    }

    auto output{absl::GetFlag(FLAGS_output)};
    if (!silktrace::commands::is_valid_output(output)) {
        std::cerr << "Parameter output is invalid: [" << output << "]\n";
        std::cerr << "Use --output flag to specify either " << silktrace::kCallStackOutput
                  << " or " << silktrace::kInternalTransactionsOutput << "\n";
        return -1;
    }

    const auto max_calls{absl::GetFlag(FLAGS_maxCalls)};

    try {
        std::ifstream trace_stream{trace_file};
        const auto trace = nlohmann::json::parse(trace_stream);
        SILKTRACE_INFO << "Loaded trace from " << trace_file << "\n";

        const auto trace_output = silktrace::commands::make_call_trace_output(trace, output, max_calls);
        std::cout << trace_output.dump(2) << "\n";
    } catch (const std::system_error& se) {
        SILKTRACE_CRIT << "Trace error: " << se.what() << "\n" << std::flush;
        std::cerr << se.code().category().name() << " error " << se.code().value() << ": " << se.what() << "\n";
        return -1;
    } catch (const std::exception& e) {
        SILKTRACE_CRIT << "Exception: " << e.what() << "\n" << std::flush;
        std::cerr << e.what() << "\n";
        return -1;
    }

    return 0;
}
