#pragma once

#include <mutex>
#include <ostream>
#include <string>

// 여러 전달 작업이 함께 쓰는 출력 스트림. 한 줄 단위로만 기록하여 줄이 섞이지 않음
class OutputSink
{
public:
    explicit OutputSink(std::ostream& out);

    // line 뒤에 개행을 붙여 원자적으로 기록
    void WriteLine(const std::string& line);

private:
    std::ostream& mOut;
    std::mutex mMutex;
};

// 자식 프로세스 출력을 받아 각 줄 앞에 "<user>\t" 를 붙여 sink 로 전달
class LinePrefixer
{
public:
    LinePrefixer(const std::string& user, OutputSink& sink);

    void Feed(const char* data, size_t len);

    // 개행 없이 끝난 마지막 줄을 내보냄
    void Flush();

private:
    std::string mPrefix;
    OutputSink& mSink;
    std::string mPending;
};
