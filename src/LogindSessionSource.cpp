#include "LogindSessionSource.h"
#include "PrivilegeUtils.h"

#include <systemd/sd-login.h>
#include <cstdlib>
#include <cstring>
#include <memory>

#include <spdlog/spdlog.h>

namespace {

// sd-login 이 malloc 으로 돌려준 문자열 배열 (배열과 각 원소 모두 free)
struct StrvDeleter
{
    void operator()(char** strv) const
    {
        for (char** s = strv; *s; ++s)
        {
            free(*s);
        }
        free(strv);
    }
};

struct CharDeleter
{
    void operator()(char* str) const { free(str); }
};

} // namespace

std::vector<std::string> LogindSessionSource::ListUsers()
{
    std::vector<std::string> users;

    // systemd 세션 리스트 가져오기
    char** sessions = nullptr;
    int count = sd_get_sessions(&sessions);
    if (count < 0)
    {
        spdlog::warn("sd_get_sessions failed: {}", std::strerror(-count));
        return users;
    }
    if (!sessions)
    {
        return users;
    }
    std::unique_ptr<char*, StrvDeleter> sessionsGuard(sessions);

    for (int i = 0; sessions[i] != nullptr; ++i)
    {
        const char* session = sessions[i];

        // 종료 중인 세션(closing)은 제외
        char* state = nullptr;
        if (sd_session_get_state(session, &state) >= 0 && state)
        {
            std::unique_ptr<char, CharDeleter> stateGuard(state);
            if (strcmp(state, "closing") == 0)
            {
                continue;
            }
        }

        uid_t uid;
        if (sd_session_get_uid(session, &uid) < 0)
        {
            continue;
        }

        std::string name = UserNameOfUid(uid);
        if (name.empty())
        {
            spdlog::warn("session {}: no passwd entry for uid {}", session, uid);
            continue;
        }
        users.push_back(name);
    }

    users = NormalizeUsers(std::move(users));
    spdlog::debug("logind: {} logged-in user(s)", users.size());
    return users;
}
