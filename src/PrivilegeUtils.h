#pragma once

#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

struct UserAccount
{
    std::string name;
    uid_t uid;
    gid_t gid;
    std::string home;
    std::vector<gid_t> groups;  // 보조 그룹 (권한 강하 시 setgroups 에 사용)
};

// 비밀번호 DB 조회. 없는 사용자면 nullopt
std::optional<UserAccount> LookupAccount(const std::string& name);

// uid -> 사용자 이름. 조회 실패 시 빈 문자열
std::string UserNameOfUid(uid_t uid);

// 프로그램을 실행한 사용자. sudo 로 올라온 경우 SUDO_USER
std::string ResolveInvoker();

// root 가 아니면 elevation 명령(sudo)으로 자기 자신을 같은 인자로 재실행.
// 이미 root 이면 true. 재실행에 성공하면 반환하지 않음. 실패 시 false
bool EnsureRoot(const std::vector<std::string>& args, const std::string& elevation);
