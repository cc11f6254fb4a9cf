#include "UserNotifier.h"
#include "PrivilegeUtils.h"

#include <gtest/gtest.h>

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// 현재 사용자 자신에게 전달 (권한 전환 없음). 임시 런타임 디렉토리에 bus 파일을 둠
class UserNotifierTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        mUser = UserNameOfUid(geteuid());
        if (mUser.empty())
        {
            GTEST_SKIP() << "no passwd entry for the current uid";
        }

        mRuntime = fs::temp_directory_path() /
                   ("nsa-run-" + std::to_string(getpid()) + "-" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(mRuntime / std::to_string(geteuid()));

        mConfig.runtimeDir = mRuntime.string();
        mConfig.safePath = "/usr/bin:/bin";
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(mRuntime, ec);
    }

    void createBus()
    {
        std::ofstream bus(UserNotifier::BusSocketPath(mConfig.runtimeDir, geteuid()));
    }

    std::string mUser;
    fs::path mRuntime;
    NotifyConfig mConfig;
    std::ostringstream mOutStream;
    std::ostringstream mErrStream;
    OutputSink mOut{ mOutStream };
    OutputSink mErr{ mErrStream };
};

TEST(UserNotifierPathTest, BusSocketPathIsKeyedByUid)
{
    EXPECT_EQ(UserNotifier::BusSocketPath("/run/user", 1000), "/run/user/1000/bus");
}

TEST_F(UserNotifierTest, PrefixesClientOutputWithUser)
{
    createBus();
    mConfig.client = "echo";
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify(mUser, { "hello", "world" });

    EXPECT_EQ(result.status, eDeliveryStatus::Delivered);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(mOutStream.str(), mUser + "\thello world\n");
    EXPECT_EQ(mErrStream.str(), "");
}

TEST_F(UserNotifierTest, MissingBusIsReportedWithoutRunningClient)
{
    mConfig.client = "echo";
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify(mUser, { "hello" });

    const std::string bus = UserNotifier::BusSocketPath(mConfig.runtimeDir, geteuid());
    EXPECT_EQ(result.status, eDeliveryStatus::BusNotFound);
    EXPECT_EQ(result.exitCode, -1);
    EXPECT_EQ(mOutStream.str(), "");
    EXPECT_EQ(mErrStream.str(), mUser + "\tERROR: No such file " + bus + "\n");
}

TEST_F(UserNotifierTest, ClientRunsWithSessionEnvironment)
{
    createBus();
    mConfig.client = "env";
    UserNotifier notifier(mConfig, mOut, mErr);

    ASSERT_EQ(notifier.Notify(mUser, {}).status, eDeliveryStatus::Delivered);

    const std::string bus = UserNotifier::BusSocketPath(mConfig.runtimeDir, geteuid());
    const std::string out = mOutStream.str();
    EXPECT_NE(out.find(mUser + "\tDBUS_SESSION_BUS_ADDRESS=unix:path=" + bus + "\n"), std::string::npos);
    EXPECT_NE(out.find(mUser + "\tPATH=/usr/bin:/bin\n"), std::string::npos);
    EXPECT_NE(out.find(mUser + "\tUSER=" + mUser + "\n"), std::string::npos);
}

TEST_F(UserNotifierTest, StderrAndPartialLinesArePrefixed)
{
    createBus();
    mConfig.client = "/bin/sh";
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify(mUser, { "-c", "echo oops >&2; printf partial" });

    EXPECT_EQ(result.status, eDeliveryStatus::Delivered);
    EXPECT_EQ(mOutStream.str(), mUser + "\tpartial\n");
    EXPECT_EQ(mErrStream.str(), mUser + "\toops\n");
}

TEST_F(UserNotifierTest, ClientFailureIsPassedThrough)
{
    createBus();
    mConfig.client = "/bin/sh";
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify(mUser, { "-c", "echo 'no daemon' >&2; exit 3" });

    EXPECT_EQ(result.status, eDeliveryStatus::Delivered);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(mErrStream.str(), mUser + "\tno daemon\n");
}

TEST_F(UserNotifierTest, MissingClientIsSpawnFailure)
{
    createBus();
    mConfig.client = "notify-send-all-no-such-client";
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify(mUser, { "hello" });

    EXPECT_EQ(result.status, eDeliveryStatus::SpawnFailed);
    EXPECT_EQ(mOutStream.str(), "");
    EXPECT_EQ(mErrStream.str().rfind(mUser + "\tERROR: notify-send-all-no-such-client: ", 0), 0u);
}

TEST_F(UserNotifierTest, UnknownUserIsReported)
{
    UserNotifier notifier(mConfig, mOut, mErr);

    DeliveryResult result = notifier.Notify("no-such-user-4f1c", { "hello" });

    EXPECT_EQ(result.status, eDeliveryStatus::UnknownUser);
    EXPECT_EQ(mErrStream.str(), "no-such-user-4f1c\tERROR: Unknown user\n");
}
