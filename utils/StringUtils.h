#pragma once
#include <string>
#include <vector>

namespace notifyall::utils {

    // 문자열 양끝 공백 제거 함수
    std::string trim(const std::string& s);

    // 구분자 기준 분리. 빈 토큰은 버림 ("/usr/bin::/bin" -> {"/usr/bin", "/bin"})
    std::vector<std::string> split(const std::string& s, char delim);

    // 고정 길이 char 배열(utmp 필드 등)을 NUL 이전까지만 잘라 문자열로 변환
    std::string fromFixedField(const char* field, size_t maxLen);
}
