#pragma once

#include "SessionSource.h"

// systemd-logind 세션 목록에서 사용자 목록을 얻음
class LogindSessionSource : public SessionSourceBase
{
public:
    std::vector<std::string> ListUsers() override;
};
