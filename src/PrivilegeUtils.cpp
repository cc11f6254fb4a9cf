#include "PrivilegeUtils.h"
#include "Paths.h"

#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <limits.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

#include <spdlog/spdlog.h>

static size_t pwBufferSize()
{
    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    return size > 0 ? static_cast<size_t>(size) : 16384;
}

std::optional<UserAccount> LookupAccount(const std::string& name)
{
    std::string buffer(pwBufferSize(), '\0');
    struct passwd pw;
    struct passwd* result = nullptr;

    // ERANGE 면 버퍼를 늘려 재시도
    int rc;
    while ((rc = getpwnam_r(name.c_str(), &pw, &buffer[0], buffer.size(), &result)) == ERANGE)
    {
        buffer.resize(buffer.size() * 2);
    }
    if (rc != 0 || !result)
    {
        return std::nullopt;
    }

    UserAccount account{ result->pw_name, result->pw_uid, result->pw_gid, result->pw_dir, {} };

    // 보조 그룹 목록. 개수를 모르므로 -1 이 나오면 ngroups 크기로 다시 호출
    int ngroups = 16;
    account.groups.resize(ngroups);
    if (getgrouplist(account.name.c_str(), account.gid, account.groups.data(), &ngroups) < 0)
    {
        account.groups.resize(ngroups);
        if (getgrouplist(account.name.c_str(), account.gid, account.groups.data(), &ngroups) < 0)
        {
            spdlog::warn("getgrouplist({}) failed, using primary group only", account.name);
            ngroups = 1;
            account.groups.assign(1, account.gid);
        }
    }
    account.groups.resize(ngroups);

    return account;
}

std::string UserNameOfUid(uid_t uid)
{
    std::string buffer(pwBufferSize(), '\0');
    struct passwd pw;
    struct passwd* result = nullptr;

    if (getpwuid_r(uid, &pw, &buffer[0], buffer.size(), &result) != 0 || !result)
    {
        return "";
    }
    return result->pw_name;
}

std::string ResolveInvoker()
{
    if (getuid() == 0)
    {
        const char* sudoUser = getenv("SUDO_USER");
        if (sudoUser && *sudoUser)
        {
            return sudoUser;
        }
    }
    return UserNameOfUid(getuid());
}

bool EnsureRoot(const std::vector<std::string>& args, const std::string& elevation)
{
    if (geteuid() == 0)
    {
        return true;
    }

    // /proc/self/exe 로 현재 실행파일의 절대경로를 얻음. 실행파일별 모드가 그대로 유지됨
    char result[PATH_MAX];
    ssize_t count = readlink(PATH_SELF_EXE, result, PATH_MAX - 1);
    if (count == -1)
    {
        std::cerr << "ERROR: Could not get executable path: " << std::strerror(errno) << std::endl;
        return false;
    }
    std::string self(result, count);

    std::vector<std::string> command = { elevation, "--", self };
    command.insert(command.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : command)
    {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    // 자격 증명 확인은 sudo 가 담당. 실패하면 sudo 의 종료 코드로 끝남
    execvp(argv[0], argv.data());

    std::cerr << "ERROR: failed to run " << elevation << ": " << std::strerror(errno) << std::endl;
    return false;
}
