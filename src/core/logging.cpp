#include "paykit/core/logging.hpp"
#include "paykit/core/constants.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <mutex>

namespace paykit::logging {

std::shared_ptr<spdlog::logger> Logger::core_logger_;

namespace {
    std::once_flag init_flag;
}

void Logger::Init() {
    std::call_once(init_flag, [] {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [paykit] [t%t] %v");

        core_logger_ = std::make_shared<spdlog::logger>("paykit", console_sink);
        core_logger_->set_level(spdlog::level::info);
        if (const char* env_level = std::getenv(EnvironmentKeys::LOG_LEVEL)) {
            core_logger_->set_level(spdlog::level::from_str(env_level));
        }
        core_logger_->flush_on(spdlog::level::warn);
        spdlog::register_logger(core_logger_);
    });
}

std::shared_ptr<spdlog::logger>& Logger::GetCoreLogger() {
    Init();
    return core_logger_;
}

void Logger::SetLevel(const spdlog::level::level_enum level) {
    GetCoreLogger()->set_level(level);
}

}
