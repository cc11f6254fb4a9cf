#ifndef CONFIGURATION_MANAGER_H
#define CONFIGURATION_MANAGER_H

#include <string>
#include <vector>

#include "Paths.h"

// 세션 탐색 방식
enum class eDiscovery
{
    Utmp,       // who 와 동일한 utmp 로그인 기록
    Logind      // systemd-logind 세션 목록
};

struct NotifyConfig
{
    std::string client = "notify-send";
    std::string safePath = PATH_SAFE_SEARCH;
    std::string runtimeDir = PATH_RUNTIME_BASE;
    eDiscovery discovery = eDiscovery::Utmp;
    std::string utmpFile = PATH_UTMP;
    std::vector<std::string> excludeUsers;
    std::string elevation = "sudo";
    std::string logFile = PATH_LOG;
    std::string logLevel = "info";
};

class ConfigurationManager {
public:
    // Loads the YAML file at config_path. Missing file or parse error -> defaults.
    explicit ConfigurationManager(const std::string& config_path);

    const NotifyConfig& get_config() const;

    // Set when the file existed but could not be parsed
    const std::string& get_error() const;

private:
    std::string config_path;
    NotifyConfig config;
    std::string error;

    void load();
};

#endif
