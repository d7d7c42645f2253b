#include "logging.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace Parity::App {

std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace Parity::App
