#include <colloc/core/logging.hpp>

#include <absl/base/log_severity.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>

#include <mutex>

namespace colloc {

namespace {
std::once_flag g_once;
}

void init_logging(std::optional<int> min_level, std::optional<int> verbosity) {
    std::call_once(g_once, [] { absl::InitializeLog(); });
    if (min_level) {
        absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
            absl::NormalizeLogSeverity(*min_level)));
    }
    if (verbosity) {
        absl::SetGlobalVLogLevel(*verbosity);
    }
}

} // namespace colloc
