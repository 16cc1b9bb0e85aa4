#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace paykit::logging {

class Logger {
public:
    /// Creates the "paykit" logger with a colour stdout sink. Safe to call
    /// more than once; only the first call has an effect. The level is read
    /// from PAYKIT_LOG_LEVEL when set, otherwise it defaults to info.
    static void Init();

    static std::shared_ptr<spdlog::logger>& GetCoreLogger();

    static void SetLevel(spdlog::level::level_enum level);

private:
    static std::shared_ptr<spdlog::logger> core_logger_;
};

inline void SetLevel(spdlog::level::level_enum level) {
    Logger::SetLevel(level);
}

}

#define PAYKIT_LOG_TRACE(...) ::paykit::logging::Logger::GetCoreLogger()->trace(__VA_ARGS__)
#define PAYKIT_LOG_DEBUG(...) ::paykit::logging::Logger::GetCoreLogger()->debug(__VA_ARGS__)
#define PAYKIT_LOG_INFO(...)  ::paykit::logging::Logger::GetCoreLogger()->info(__VA_ARGS__)
#define PAYKIT_LOG_WARN(...)  ::paykit::logging::Logger::GetCoreLogger()->warn(__VA_ARGS__)
#define PAYKIT_LOG_ERROR(...) ::paykit::logging::Logger::GetCoreLogger()->error(__VA_ARGS__)
