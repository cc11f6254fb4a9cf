#include "AppMain.h"
#include "config_manager.h"
#include "Logger.h"
#include "PrivilegeUtils.h"
#include "SessionSource.h"
#include "UserNotifier.h"
#include "Paths.h"

#include <iostream>

#include <spdlog/spdlog.h>

int RunNotifyApp(eMode mode, int argc, char* argv[])
{
    std::vector<std::string> tokens(argv + 1, argv + argc);

    // 도움말은 권한 확인, 설정, 탐색보다 먼저 처리
    if (CommandExecutor::IsHelpRequest(tokens))
    {
        CommandExecutor::ShowManual(mode, std::cout);
        return 0;
    }

    try
    {
        InitConsoleLogger();

        ConfigurationManager configManager(PATH_CONFIG);
        const NotifyConfig& config = configManager.get_config();

        // root 가 아니면 sudo 로 재실행 (성공 시 반환하지 않음)
        if (!EnsureRoot(tokens, config.elevation))
        {
            return 1;
        }

        InitLogger(config);
        if (!configManager.get_error().empty())
        {
            spdlog::warn("{}: {}, using defaults", PATH_CONFIG, configManager.get_error());
        }

        const std::string invoker = ResolveInvoker();
        spdlog::info("{} started by {}", CommandExecutor::ProgramName(mode), invoker);

        OutputSink out(std::cout);
        OutputSink err(std::cerr);

        auto sessions = CreateSessionSource(config);
        UserNotifier notifier(config, out, err);
        CommandExecutor executor(*sessions, notifier, config.excludeUsers);

        return executor.Execute(mode, tokens, invoker);
    }
    catch (const std::exception& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        spdlog::error("{}: {}", CommandExecutor::ProgramName(mode), e.what());
        return 1;
    }
}
