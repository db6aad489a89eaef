#ifndef APPTRACE_COMMON_LOGGER_H_
#define APPTRACE_COMMON_LOGGER_H_

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace apptrace {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the level from its name (trace, debug, info, warn, error, critical, off)
     * @return false if the name is not a known level
     */
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace apptrace

// Macros for convenient logging
#define APPTRACE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define APPTRACE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define APPTRACE_INFO(...)  spdlog::info(__VA_ARGS__)
#define APPTRACE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define APPTRACE_ERROR(...) spdlog::error(__VA_ARGS__)
#define APPTRACE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // APPTRACE_COMMON_LOGGER_H_
