#include "config_manager.h"
#include "StringUtils.h"

#include <filesystem>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

using namespace std;

ConfigurationManager::ConfigurationManager(const std::string& config_path)
    : config_path(config_path)
{
    load();
}

const NotifyConfig& ConfigurationManager::get_config() const {
    return config;
}

const std::string& ConfigurationManager::get_error() const {
    return error;
}

// 스칼라 값 하나 읽기. 타입이 맞지 않으면 기본값 유지
static void readString(const YAML::Node& root, const char* key, std::string& out)
{
    const YAML::Node node = root[key];
    if (!node)
    {
        return;
    }
    if (!node.IsScalar())
    {
        spdlog::warn("config: '{}' must be a string, keeping default '{}'", key, out);
        return;
    }
    string value = notifyall::utils::trim(node.as<string>());
    if (!value.empty())
    {
        out = value;
    }
}

void ConfigurationManager::load() {
    // 설정 파일이 없는 것은 에러가 아님 (기본값 사용)
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return;
    }

    try
    {
        YAML::Node root = YAML::LoadFile(config_path);
        if (!root.IsMap())
        {
            if (!root.IsNull())
            {
                error = "top level of " + config_path + " is not a mapping";
                spdlog::warn("config: {}", error);
            }
            return;
        }

        readString(root, "client", config.client);
        readString(root, "safe_path", config.safePath);
        readString(root, "runtime_dir", config.runtimeDir);
        readString(root, "utmp_file", config.utmpFile);
        readString(root, "elevation", config.elevation);
        readString(root, "log_file", config.logFile);
        readString(root, "log_level", config.logLevel);

        string discovery;
        readString(root, "discovery", discovery);
        if (discovery == "logind")
        {
            config.discovery = eDiscovery::Logind;
        }
        else if (!discovery.empty() && discovery != "utmp")
        {
            spdlog::warn("config: unknown discovery '{}', using utmp", discovery);
        }

        const YAML::Node exclude = root["exclude_users"];
        if (exclude && exclude.IsSequence())
        {
            for (const auto& item : exclude)
            {
                // 항목 하나가 잘못되어도 나머지 설정은 유지
                if (!item.IsScalar())
                {
                    spdlog::warn("config: 'exclude_users' item is not a string, skipped");
                    continue;
                }
                string user = notifyall::utils::trim(item.as<string>());
                if (!user.empty())
                {
                    config.excludeUsers.push_back(user);
                }
            }
        }
        else if (exclude && !exclude.IsNull())
        {
            spdlog::warn("config: 'exclude_users' must be a list, ignored");
        }
    }
    catch (const YAML::Exception& e)
    {
        // 파싱 실패 시 기본값으로 동작
        error = e.what();
        config = NotifyConfig{};
        spdlog::warn("config: failed to parse {}: {}", config_path, error);
    }
}
