#pragma once
#include <vector>
#include <string>
#include <ostream>

#include "SessionSource.h"
#include "UserNotifier.h"

// 실행파일마다 고정되는 동작 모드
enum class eMode
{
    All,        // notify-send-all
    Others,     // notify-send-others
    Single      // notify-send-to <username>
};

class CommandExecutor
{
public:
    CommandExecutor(SessionSourceBase& sessions,
                    NotifierBase& notifier,
                    const std::vector<std::string>& excludeUsers);

    // tokens: 프로그램 이름을 뺀 인자. invoker: Others 모드에서 제외할 사용자
    int Execute(eMode mode, const std::vector<std::string>& tokens, const std::string& invoker);

    // 인자가 없거나 첫 인자가 -? / --help
    static bool IsHelpRequest(const std::vector<std::string>& tokens);

    static void ShowManual(eMode mode, std::ostream& out);

    static const char* ProgramName(eMode mode);

private:
    SessionSourceBase& mSessions;
    NotifierBase& mNotifier;
    std::vector<std::string> mExcludeUsers;
};
