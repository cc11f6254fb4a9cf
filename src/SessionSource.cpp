#include "SessionSource.h"
#include "UtmpSessionSource.h"
#include "LogindSessionSource.h"

#include <algorithm>

std::vector<std::string> NormalizeUsers(std::vector<std::string> users)
{
    users.erase(std::remove(users.begin(), users.end(), std::string()), users.end());
    std::sort(users.begin(), users.end());
    users.erase(std::unique(users.begin(), users.end()), users.end());
    return users;
}

std::unique_ptr<SessionSourceBase> CreateSessionSource(const NotifyConfig& config)
{
    switch (config.discovery)
    {
    case eDiscovery::Logind:
        return std::make_unique<LogindSessionSource>();
    case eDiscovery::Utmp:
    default:
        return std::make_unique<UtmpSessionSource>(config.utmpFile);
    }
}
