#include "Logger.h"

#include <unistd.h>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// stdout 은 알림 클라이언트 출력 전용이므로 콘솔 로그는 stderr 로만 보냄
void InitConsoleLogger()
{
    auto logger = spdlog::get("notify_console");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("notify_console");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
}

void InitLogger(const NotifyConfig& config)
{
    if (geteuid() != 0)
    {
        InitConsoleLogger();
        return;
    }

    try
    {
        // 최대 5MB, 최대 3개 파일 보관
        auto logger = spdlog::rotating_logger_mt(
            "notify_logger", config.logFile,
            1024 * 1024 * 5,  // 5MB
            3                 // 파일 개수
        );

        // from_str 은 모르는 이름에 off 를 돌려줌
        auto level = spdlog::level::from_str(config.logLevel);
        if (level == spdlog::level::off && config.logLevel != "off")
        {
            level = spdlog::level::info;
        }

        spdlog::set_default_logger(logger);
        spdlog::set_level(level);
        spdlog::flush_on(spdlog::level::info);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        InitConsoleLogger();
        spdlog::warn("Log init failed ({}), logging to stderr", ex.what());
    }
}
