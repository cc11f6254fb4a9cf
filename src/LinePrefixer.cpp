#include "LinePrefixer.h"

OutputSink::OutputSink(std::ostream& out)
    : mOut(out)
{}

void OutputSink::WriteLine(const std::string& line)
{
    std::lock_guard<std::mutex> lock(mMutex);
    mOut << line << '\n';
    mOut.flush();
}

LinePrefixer::LinePrefixer(const std::string& user, OutputSink& sink)
    : mPrefix(user + "\t")
    , mSink(sink)
{}

void LinePrefixer::Feed(const char* data, size_t len)
{
    mPending.append(data, len);

    size_t start = 0;
    size_t newline;
    while ((newline = mPending.find('\n', start)) != std::string::npos)
    {
        mSink.WriteLine(mPrefix + mPending.substr(start, newline - start));
        start = newline + 1;
    }
    mPending.erase(0, start);
}

void LinePrefixer::Flush()
{
    if (!mPending.empty())
    {
        mSink.WriteLine(mPrefix + mPending);
        mPending.clear();
    }
}
