#pragma once

#include "SessionSource.h"

// utmp 로그인 기록(USER_PROCESS)에서 사용자 목록을 읽음. who 와 같은 데이터
class UtmpSessionSource : public SessionSourceBase
{
public:
    explicit UtmpSessionSource(const std::string& utmpPath);

    std::vector<std::string> ListUsers() override;

private:
    std::string mUtmpPath;
};
