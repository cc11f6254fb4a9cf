#pragma once

#include <string>
#include <vector>

#include "SessionSource.h"
#include "UserNotifier.h"

// 로그인한 모든 사용자에게 동시에 알림 전달 후 전부 끝날 때까지 대기
class Broadcaster
{
public:
    Broadcaster(SessionSourceBase& sessions,
                NotifierBase& notifier,
                const std::vector<std::string>& excludeUsers);

    // skipUser 가 비어 있지 않으면 해당 사용자는 제외 (탐색 결과 자체는 그대로).
    // 반환값: 실제 전달을 시도한 사용자 수
    size_t Broadcast(const std::vector<std::string>& clientArgs, const std::string& skipUser);

private:
    SessionSourceBase& mSessions;
    NotifierBase& mNotifier;
    std::vector<std::string> mExcludeUsers;

    bool isExcluded(const std::string& user, const std::string& skipUser) const;
};
