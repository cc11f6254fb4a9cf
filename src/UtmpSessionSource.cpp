#include "UtmpSessionSource.h"
#include "StringUtils.h"

#include <utmp.h>
#include <cerrno>
#include <cstring>
#include <filesystem>

#include <spdlog/spdlog.h>

UtmpSessionSource::UtmpSessionSource(const std::string& utmpPath)
    : mUtmpPath(utmpPath)
{}

std::vector<std::string> UtmpSessionSource::ListUsers()
{
    std::vector<std::string> users;

    // utmpname()은 파일이 없어도 성공하므로 먼저 확인
    std::error_code ec;
    if (!std::filesystem::exists(mUtmpPath, ec))
    {
        spdlog::warn("utmp file not found: {}", mUtmpPath);
        return users;
    }

    if (utmpname(mUtmpPath.c_str()) != 0)
    {
        spdlog::warn("utmpname({}) failed: {}", mUtmpPath, std::strerror(errno));
        return users;
    }

    setutent();

    struct utmp entry;
    struct utmp* result = nullptr;
    while (getutent_r(&entry, &result) == 0 && result)
    {
        if (result->ut_type != USER_PROCESS)
        {
            continue;
        }

        std::string name = notifyall::utils::fromFixedField(result->ut_user, sizeof(result->ut_user));
        if (!name.empty())
        {
            users.push_back(name);
        }
    }

    endutent();

    users = NormalizeUsers(std::move(users));
    spdlog::debug("utmp {}: {} logged-in user(s)", mUtmpPath, users.size());
    return users;
}
