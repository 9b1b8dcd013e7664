#include <gtest/gtest.h>

#include <fcntl.h>
#include <stdio.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "testSupport.h"
#include "workerPool.h"

namespace
{

size_t count_of(const std::string& haystack, const std::string& needle)
{
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size()))
    {
        ++count;
    }
    return count;
}

}  // namespace

TEST(WorkerPoolTest, SingleWorkerDoesNotFork)
{
    std::vector<pid_t> children;
    EXPECT_EQ(0, fork_workers(1, &children));
    EXPECT_TRUE(children.empty());
}

TEST(WorkerPoolTest, ChildrenDoNotRepeatBufferedOutput)
{
    temp_dir dir;
    std::string logPath = dir.join("stdout.log");

    fflush(stdout);
    int savedStdout = ::dup(STDOUT_FILENO);
    ASSERT_GE(savedStdout, 0);
    int fd = ::open(logPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(fd, 0);
    ::dup2(fd, STDOUT_FILENO);
    ::close(fd);

    // no newline: stays in the stdio buffer until someone flushes
    printf("startup banner");
    std::vector<pid_t> children;
    int index = fork_workers(3, &children);
    if (index > 0)
    {
        // a worker exiting writes out whatever it inherited
        fflush(stdout);
        _exit(0);
    }
    // signal 0 only reaps
    stop_workers(children, 0);

    fflush(stdout);
    ::dup2(savedStdout, STDOUT_FILENO);
    ::close(savedStdout);

    std::ifstream in(logPath.c_str());
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_EQ(2u, children.size());
    EXPECT_EQ(1u, count_of(content.str(), "startup banner")) << content.str();
}
