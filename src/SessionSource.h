#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config_manager.h"

// 현재 로그인한 사용자 이름 목록을 제공하는 인터페이스
class SessionSourceBase
{
public:
    virtual ~SessionSourceBase() = default;

    // 중복 제거 + 정렬된 사용자 이름. 비어 있어도 정상
    virtual std::vector<std::string> ListUsers() = 0;
};

// sort + unique. 같은 사용자의 여러 로그인 세션은 하나로 합침
std::vector<std::string> NormalizeUsers(std::vector<std::string> users);

// 설정의 discovery 값에 맞는 구현 생성
std::unique_ptr<SessionSourceBase> CreateSessionSource(const NotifyConfig& config);
