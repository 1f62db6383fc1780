#include <chronicle/core/logging.hpp>

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace chronicle {

std::shared_ptr<spdlog::logger>
get_logger()
{
    static std::mutex creation_mutex;
    std::lock_guard<std::mutex> lock(creation_mutex);
    auto logger = spdlog::get("chronicle");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("chronicle");
        logger->set_level(spdlog::level::warn);
    }
    return logger;
}

void
initialize_logging(optional<spdlog::level::level_enum> level)
{
    auto logger = get_logger();
    if (!level)
    {
        auto from_environment
            = get_optional_environment_variable("CHRONICLE_LOG_LEVEL");
        if (from_environment)
            level = spdlog::level::from_str(*from_environment);
    }
    if (level)
        logger->set_level(*level);
}

} // namespace chronicle
