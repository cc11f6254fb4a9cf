#include "Broadcaster.h"

#include <algorithm>
#include <future>
#include <system_error>

#include <spdlog/spdlog.h>

Broadcaster::Broadcaster(SessionSourceBase& sessions,
                         NotifierBase& notifier,
                         const std::vector<std::string>& excludeUsers)
    : mSessions(sessions)
    , mNotifier(notifier)
    , mExcludeUsers(excludeUsers)
{}

bool Broadcaster::isExcluded(const std::string& user, const std::string& skipUser) const
{
    if (!skipUser.empty() && user == skipUser)
    {
        return true;
    }
    return std::find(mExcludeUsers.begin(), mExcludeUsers.end(), user) != mExcludeUsers.end();
}

size_t Broadcaster::Broadcast(const std::vector<std::string>& clientArgs, const std::string& skipUser)
{
    const std::vector<std::string> users = mSessions.ListUsers();
    spdlog::info("broadcast: {} logged-in user(s){}", users.size(),
                 skipUser.empty() ? "" : ", skipping " + skipUser);

    // 사용자당 작업 하나. 순서 보장 없음, 개수 제한 없음
    std::vector<std::future<DeliveryResult>> tasks;
    for (const auto& user : users)
    {
        if (isExcluded(user, skipUser))
        {
            spdlog::debug("broadcast: {} excluded", user);
            continue;
        }

        // 스레드 생성 실패 시 해당 사용자만 현재 스레드에서 직접 전달
        try
        {
            tasks.push_back(std::async(std::launch::async, [this, user, &clientArgs]() {
                return mNotifier.Notify(user, clientArgs);
            }));
        }
        catch (const std::system_error& e)
        {
            spdlog::warn("broadcast: cannot start task for {} ({}), delivering inline", user, e.what());
            std::promise<DeliveryResult> inlineResult;
            try
            {
                inlineResult.set_value(mNotifier.Notify(user, clientArgs));
            }
            catch (...)
            {
                inlineResult.set_exception(std::current_exception());
            }
            tasks.push_back(inlineResult.get_future());
        }
    }

    // 모든 작업 종료까지 대기. 한 사용자의 예외는 그 사용자 실패로만 처리
    size_t delivered = 0;
    for (auto& task : tasks)
    {
        try
        {
            if (task.get().status == eDeliveryStatus::Delivered)
            {
                ++delivered;
            }
        }
        catch (const std::exception& e)
        {
            spdlog::error("broadcast: delivery task failed: {}", e.what());
        }
    }

    spdlog::info("broadcast: {} of {} attempt(s) reached a session", delivered, tasks.size());
    return tasks.size();
}
