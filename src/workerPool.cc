#include "workerPool.h"

#include <errno.h>
#include <stdio.h>
#include <sys/wait.h>
#include <unistd.h>

#include <muduo/base/Logging.h>

int fork_workers(int count, std::vector<pid_t>* children)
{
    // muduo's default output leaves stdout buffered until FATAL
    fflush(stdout);
    fflush(stderr);
    for (int i = 1; i < count; ++i)
    {
        pid_t pid = ::fork();
        if (pid < 0)
        {
            LOG_SYSERR << "fork worker " << i;
            break;
        }
        if (pid == 0)
        {
            children->clear();
            return i;
        }
        children->push_back(pid);
    }
    return 0;
}

void stop_workers(const std::vector<pid_t>& children, int sig)
{
    for (pid_t pid : children)
    {
        ::kill(pid, sig);
    }
    for (pid_t pid : children)
    {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
        {
        }
    }
}
