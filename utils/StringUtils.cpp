#include "StringUtils.h"

#include <sstream>
#include <cstring>

namespace notifyall::utils {

std::string trim(const std::string& s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    size_t end = s.find_last_not_of(" \t\r\n");
    return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> tokens;
    std::stringstream ss(s);
    std::string token;

    while (std::getline(ss, token, delim))
    {
        token = trim(token);
        if (!token.empty())
        {
            tokens.push_back(token);
        }
    }
    return tokens;
}

std::string fromFixedField(const char* field, size_t maxLen)
{
    // utmp 필드는 꽉 찬 경우 NUL 종료가 보장되지 않음
    return std::string(field, strnlen(field, maxLen));
}

} // namespace notifyall::utils
