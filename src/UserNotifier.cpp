#include "UserNotifier.h"
#include "PrivilegeUtils.h"
#include "StringUtils.h"

#include <grp.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

namespace {

// 자식이 exec 전에 실패한 이유. 상태 파이프로 부모에게 전달
enum eChildError : int
{
    ChildOk = 0,
    ChildBusMissing = 1,
    ChildSwitchFailed = 2,
    ChildExecFailed = 3
};

struct ChildReport
{
    int code;
    int err;
};

// fork 전에 모두 준비해 두는 자식 실행 정보. 자식에서는 async-signal-safe 호출만 사용
struct ChildPlan
{
    bool switchIdentity;
    uid_t uid;
    gid_t gid;
    const std::vector<gid_t>* groups;
    const char* busPath;
    char* const* argv;
    char* const* envp;
    const std::vector<const char*>* candidates;
    int outFd;
    int errFd;
    int statusFd;
};

std::vector<char*> toArgv(std::vector<std::string>& strings)
{
    std::vector<char*> out;
    for (auto& s : strings)
    {
        out.push_back(&s[0]);
    }
    out.push_back(nullptr);
    return out;
}

[[noreturn]] void reportAndExit(int statusFd, int code, int err)
{
    ChildReport report{ code, err };
    ssize_t written = write(statusFd, &report, sizeof(report));
    (void)written;  // 부모가 읽지 못해도 종료 코드 127 로 실패는 드러남
    _exit(127);
}

[[noreturn]] void runChild(const ChildPlan& plan)
{
    // 자식 프로세스: 권한 강하. 순서 중요 (setuid 이후에는 그룹 변경 불가)
    if (plan.switchIdentity)
    {
        if (setgroups(plan.groups->size(), plan.groups->data()) < 0
            || setgid(plan.gid) < 0
            || setuid(plan.uid) < 0)
        {
            reportAndExit(plan.statusFd, ChildSwitchFailed, errno);
        }
    }

    // 대상 사용자 권한으로 세션 버스 소켓 존재 확인
    struct stat st;
    if (stat(plan.busPath, &st) < 0)
    {
        reportAndExit(plan.statusFd, ChildBusMissing, errno);
    }

    if (dup2(plan.outFd, STDOUT_FILENO) < 0 || dup2(plan.errFd, STDERR_FILENO) < 0)
    {
        reportAndExit(plan.statusFd, ChildExecFailed, errno);
    }

    // execvp 와 같은 규칙: ENOENT 가 아닌 에러(EACCES 등)를 우선 보고
    int lastErr = ENOENT;
    for (const char* candidate : *plan.candidates)
    {
        execve(candidate, plan.argv, plan.envp);
        if (errno != ENOENT || lastErr == ENOENT)
        {
            lastErr = errno;
        }
    }
    reportAndExit(plan.statusFd, ChildExecFailed, lastErr);
}

void closeFd(int& fd)
{
    if (fd >= 0)
    {
        close(fd);
        fd = -1;
    }
}

} // namespace

UserNotifier::UserNotifier(const NotifyConfig& config, OutputSink& out, OutputSink& err)
    : mConfig(config)
    , mOut(out)
    , mErr(err)
{}

std::string UserNotifier::BusSocketPath(const std::string& runtimeDir, uid_t uid)
{
    return runtimeDir + "/" + std::to_string(uid) + "/bus";
}

std::vector<std::string> UserNotifier::clientCandidates() const
{
    // 경로가 포함된 client 는 그대로 사용
    if (mConfig.client.find('/') != std::string::npos)
    {
        return { mConfig.client };
    }

    std::vector<std::string> candidates;
    for (const auto& dir : notifyall::utils::split(mConfig.safePath, ':'))
    {
        candidates.push_back(dir + "/" + mConfig.client);
    }
    return candidates;
}

DeliveryResult UserNotifier::Notify(const std::string& user,
                                    const std::vector<std::string>& clientArgs)
{
    auto account = LookupAccount(user);
    if (!account)
    {
        spdlog::warn("{}: unknown user", user);
        mErr.WriteLine(user + "\tERROR: Unknown user");
        return { eDeliveryStatus::UnknownUser, -1 };
    }

    const std::string busPath = BusSocketPath(mConfig.runtimeDir, account->uid);
    const std::string runtimeDir = mConfig.runtimeDir + "/" + std::to_string(account->uid);

    // 해당 유저의 D-Bus 세션 주소를 포함한 깨끗한 환경. 호출자 환경은 넘기지 않음
    std::vector<std::string> env = {
        "DBUS_SESSION_BUS_ADDRESS=unix:path=" + busPath,
        "PATH=" + mConfig.safePath,
        "XDG_RUNTIME_DIR=" + runtimeDir,
        "HOME=" + account->home,
        "USER=" + account->name,
        "LOGNAME=" + account->name
    };

    std::vector<std::string> args;
    args.push_back(mConfig.client);
    args.insert(args.end(), clientArgs.begin(), clientArgs.end());

    std::vector<std::string> candidates = clientCandidates();
    std::vector<const char*> candidatePtrs;
    for (const auto& c : candidates)
    {
        candidatePtrs.push_back(c.c_str());
    }

    std::vector<char*> argv = toArgv(args);
    std::vector<char*> envp = toArgv(env);

    // 동시에 fork 되는 다른 사용자 작업이 파이프를 상속하지 않도록 모두 O_CLOEXEC
    int outPipe[2] = { -1, -1 };
    int errPipe[2] = { -1, -1 };
    int statusPipe[2] = { -1, -1 };
    if (pipe2(outPipe, O_CLOEXEC) < 0 || pipe2(errPipe, O_CLOEXEC) < 0 || pipe2(statusPipe, O_CLOEXEC) < 0)
    {
        int err = errno;
        for (int* p : { outPipe, errPipe, statusPipe })
        {
            closeFd(p[0]);
            closeFd(p[1]);
        }
        spdlog::error("{}: pipe failed: {}", user, std::strerror(err));
        mErr.WriteLine(user + "\tERROR: pipe: " + std::strerror(err));
        return { eDeliveryStatus::SpawnFailed, -1 };
    }

    ChildPlan plan{
        account->uid != geteuid(),
        account->uid,
        account->gid,
        &account->groups,
        busPath.c_str(),
        argv.data(),
        envp.data(),
        &candidatePtrs,
        outPipe[1],
        errPipe[1],
        statusPipe[1]
    };

    pid_t pid = fork();
    if (pid == 0)
    {
        runChild(plan);
    }

    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(statusPipe[1]);

    if (pid < 0)
    {
        int err = errno;
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        closeFd(statusPipe[0]);
        spdlog::error("{}: fork failed: {}", user, std::strerror(err));
        mErr.WriteLine(user + "\tERROR: fork: " + std::strerror(err));
        return { eDeliveryStatus::SpawnFailed, -1 };
    }

    // exec 성공 시 CLOEXEC 로 닫혀 0 바이트, 실패 시 ChildReport 수신
    ChildReport report{ ChildOk, 0 };
    ssize_t len;
    do
    {
        len = read(statusPipe[0], &report, sizeof(report));
    } while (len < 0 && errno == EINTR);
    closeFd(statusPipe[0]);
    if (len != static_cast<ssize_t>(sizeof(report)))
    {
        report = { ChildOk, 0 };
    }

    if (report.code == ChildOk)
    {
        pumpOutput(user, outPipe[0], errPipe[0]);
    }
    closeFd(outPipe[0]);
    closeFd(errPipe[0]);

    // 부모: 자식 종료 상태 확인
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {}

    switch (report.code)
    {
    case ChildBusMissing:
        spdlog::info("{}: session bus not found at {}", user, busPath);
        mErr.WriteLine(user + "\tERROR: No such file " + busPath);
        return { eDeliveryStatus::BusNotFound, -1 };

    case ChildSwitchFailed:
        spdlog::error("{}: cannot switch identity: {}", user, std::strerror(report.err));
        mErr.WriteLine(user + "\tERROR: Cannot switch to user: " + std::strerror(report.err));
        return { eDeliveryStatus::SwitchFailed, -1 };

    case ChildExecFailed:
        spdlog::error("{}: cannot run {}: {}", user, mConfig.client, std::strerror(report.err));
        mErr.WriteLine(user + "\tERROR: " + mConfig.client + ": " + std::strerror(report.err));
        return { eDeliveryStatus::SpawnFailed, -1 };

    default:
        break;
    }

    int exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    if (exitCode != 0)
    {
        spdlog::warn("{}: {} exited with status {}", user, mConfig.client, exitCode);
    }
    else
    {
        spdlog::info("{}: notification delivered", user);
    }
    return { eDeliveryStatus::Delivered, exitCode };
}

void UserNotifier::pumpOutput(const std::string& user, int outFd, int errFd)
{
    LinePrefixer outPrefixer(user, mOut);
    LinePrefixer errPrefixer(user, mErr);
    LinePrefixer* prefixers[2] = { &outPrefixer, &errPrefixer };

    struct pollfd fds[2] = {
        { outFd, POLLIN, 0 },
        { errFd, POLLIN, 0 }
    };
    int remaining = 2;
    char buffer[4096];

    while (remaining > 0)
    {
        if (poll(fds, 2, -1) < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            spdlog::error("{}: poll failed: {}", user, std::strerror(errno));
            break;
        }

        for (int i = 0; i < 2; ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
            {
                continue;
            }

            ssize_t len = read(fds[i].fd, buffer, sizeof(buffer));
            if (len > 0)
            {
                prefixers[i]->Feed(buffer, static_cast<size_t>(len));
                continue;
            }
            if (len < 0 && errno == EINTR)
            {
                continue;
            }
            // EOF (또는 읽기 오류): 음수 fd 는 poll 이 무시함
            fds[i].fd = -1;
            --remaining;
        }
    }

    outPrefixer.Flush();
    errPrefixer.Flush();
}
