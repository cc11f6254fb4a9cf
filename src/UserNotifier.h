#pragma once

#include <string>
#include <vector>
#include <sys/types.h>

#include "config_manager.h"
#include "LinePrefixer.h"

enum class eDeliveryStatus
{
    Delivered,      // 클라이언트가 실행됨 (클라이언트 종료 코드는 별도)
    BusNotFound,    // /run/user/<uid>/bus 없음 (그래픽 세션 없음)
    UnknownUser,
    SwitchFailed,   // setgroups/setgid/setuid 실패
    SpawnFailed     // pipe/fork/exec 실패
};

struct DeliveryResult
{
    eDeliveryStatus status;
    int exitCode;   // 클라이언트 종료 코드. 실행되지 않았으면 -1
};

// 한 사용자에게 알림 한 건을 전달하는 인터페이스
class NotifierBase
{
public:
    virtual ~NotifierBase() = default;

    virtual DeliveryResult Notify(const std::string& user,
                                  const std::vector<std::string>& clientArgs) = 0;
};

// 대상 사용자로 권한을 바꾼 자식 프로세스에서 알림 클라이언트(notify-send)를 실행하고,
// 출력 각 줄에 "<user>\t" 를 붙여 out/err 로 전달한다.
class UserNotifier : public NotifierBase
{
public:
    UserNotifier(const NotifyConfig& config, OutputSink& out, OutputSink& err);

    DeliveryResult Notify(const std::string& user,
                          const std::vector<std::string>& clientArgs) override;

    // <runtimeDir>/<uid>/bus
    static std::string BusSocketPath(const std::string& runtimeDir, uid_t uid);

private:
    NotifyConfig mConfig;
    OutputSink& mOut;
    OutputSink& mErr;

    // 클라이언트 실행파일 후보 (safe PATH 의 각 디렉토리 + client)
    std::vector<std::string> clientCandidates() const;

    void pumpOutput(const std::string& user, int outFd, int errFd);
};
