#include "CommandExecutor.h"
#include "Broadcaster.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

CommandExecutor::CommandExecutor(SessionSourceBase& sessions,
                                 NotifierBase& notifier,
                                 const std::vector<std::string>& excludeUsers)
    : mSessions(sessions)
    , mNotifier(notifier)
    , mExcludeUsers(excludeUsers)
{}

int CommandExecutor::Execute(eMode mode, const std::vector<std::string>& tokens, const std::string& invoker)
{
    if (mode == eMode::Single)
    {
        if (tokens.empty())
        {
            throw std::invalid_argument("Missing <username> for notify-send-to");
        }

        // 첫 인자는 대상 사용자, 나머지는 알림 클라이언트 인자. 탐색 생략
        const std::string& user = tokens[0];
        std::vector<std::string> clientArgs(tokens.begin() + 1, tokens.end());

        spdlog::info("notify-send-to {} ({} argument(s))", user, clientArgs.size());
        DeliveryResult result = mNotifier.Notify(user, clientArgs);
        return result.status == eDeliveryStatus::Delivered ? 0 : 1;
    }

    Broadcaster broadcaster(mSessions, mNotifier, mExcludeUsers);
    const std::string skipUser = (mode == eMode::Others) ? invoker : "";
    broadcaster.Broadcast(tokens, skipUser);

    // 일부 사용자 실패는 종료 코드에 반영하지 않음
    return 0;
}

bool CommandExecutor::IsHelpRequest(const std::vector<std::string>& tokens)
{
    return tokens.empty() || tokens[0] == "-?" || tokens[0] == "--help";
}

const char* CommandExecutor::ProgramName(eMode mode)
{
    switch (mode)
    {
    case eMode::Others:
        return "notify-send-others";
    case eMode::Single:
        return "notify-send-to";
    case eMode::All:
    default:
        return "notify-send-all";
    }
}

void CommandExecutor::ShowManual(eMode mode, std::ostream& out)
{
    const std::string name = ProgramName(mode);

    switch (mode)
    {
    case eMode::All:
        out << "Usage: " << name << " [options] <message>\n"
            << "Show a desktop notification to every user logged into a graphical session.\n";
        break;
    case eMode::Others:
        out << "Usage: " << name << " [options] <message>\n"
            << "Show a desktop notification to every logged-in user except yourself.\n";
        break;
    case eMode::Single:
        out << "Usage: " << name << " <username> [options] <message>\n"
            << "Show a desktop notification to <username> only.\n"
            << "  <username>         required first argument: the user to notify\n";
        break;
    }

    out << "\n"
        << "All options are passed unchanged to notify-send, for example:\n"
        << "  -u, --urgency=LEVEL   low, normal or critical\n"
        << "  -A, --action=NAME=LABEL\n"
        << "                        add a button; the chosen NAME is printed (repeatable)\n"
        << "  -?, --help            show this help (first argument only)\n"
        << "\n"
        << "Each line notify-send prints is shown as \"<username>\\t<line>\".\n"
        << "Runs as root; re-executes itself through sudo when needed.\n"
        << "\n"
        << "Example:\n"
        << "  " << name << (mode == eMode::Single ? " andy" : "")
        << " -A run=Run -A hide=Hide \"Backup finished\"\n";
}
