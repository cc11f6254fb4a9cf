#include "AppMain.h"
#include "PrivilegeUtils.h"

#include <gtest/gtest.h>

#include <unistd.h>
#include <cstdlib>
#include <iostream>

#include <spdlog/spdlog.h>

namespace {

// argv 흉내. RunNotifyApp 은 argv[1..] 만 읽음
int runWithArgs(eMode mode, std::vector<std::string> args, std::string& out)
{
    std::vector<char*> argv;
    for (auto& arg : args)
    {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);

    testing::internal::CaptureStdout();
    int rc = RunNotifyApp(mode, static_cast<int>(args.size()), argv.data());
    std::cout.flush();
    out = testing::internal::GetCapturedStdout();
    return rc;
}

// SUDO_USER 를 테스트 동안만 바꾸고 원래 값으로 복구
class SudoUserEnv
{
public:
    SudoUserEnv()
    {
        const char* value = getenv("SUDO_USER");
        mHad = value != nullptr;
        if (mHad)
        {
            mValue = value;
        }
    }

    ~SudoUserEnv()
    {
        if (mHad)
        {
            setenv("SUDO_USER", mValue.c_str(), 1);
        }
        else
        {
            unsetenv("SUDO_USER");
        }
    }

private:
    bool mHad;
    std::string mValue;
};

} // namespace

TEST(AppMainTest, NoArgumentsPrintsUsageBeforeAnythingElse)
{
    std::string out;
    EXPECT_EQ(runWithArgs(eMode::All, { "notify-send-all" }, out), 0);

    EXPECT_NE(out.find("Usage: notify-send-all [options] <message>"), std::string::npos);

    // 도움말 경로는 로거 초기화, 설정, 권한 확인까지 가지 않음
    EXPECT_FALSE(spdlog::get("notify_console"));
    EXPECT_FALSE(spdlog::get("notify_logger"));
}

TEST(AppMainTest, LeadingHelpFlagPrintsSingleTargetUsage)
{
    std::string out;
    EXPECT_EQ(runWithArgs(eMode::Single, { "notify-send-to", "--help" }, out), 0);

    EXPECT_NE(out.find("Usage: notify-send-to <username> [options] <message>"), std::string::npos);
    EXPECT_FALSE(spdlog::get("notify_console"));
}

TEST(AppMainTest, QuestionMarkFlagPrintsOthersUsage)
{
    std::string out;
    EXPECT_EQ(runWithArgs(eMode::Others, { "notify-send-others", "-?", "ignored" }, out), 0);

    EXPECT_NE(out.find("Usage: notify-send-others"), std::string::npos);
}

TEST(ResolveInvokerTest, UsesSudoUserOnlyWhenRoot)
{
    SudoUserEnv restore;
    setenv("SUDO_USER", "andy", 1);

    if (getuid() == 0)
    {
        EXPECT_EQ(ResolveInvoker(), "andy");
    }
    else
    {
        EXPECT_EQ(ResolveInvoker(), UserNameOfUid(getuid()));
    }
}

TEST(ResolveInvokerTest, FallsBackToRealUid)
{
    SudoUserEnv restore;
    unsetenv("SUDO_USER");

    EXPECT_EQ(ResolveInvoker(), UserNameOfUid(getuid()));
}

TEST(ResolveInvokerTest, EmptySudoUserIsIgnored)
{
    SudoUserEnv restore;
    setenv("SUDO_USER", "", 1);

    EXPECT_EQ(ResolveInvoker(), UserNameOfUid(getuid()));
}
