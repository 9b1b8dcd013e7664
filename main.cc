#include <signal.h>
#include <string.h>

#include <iostream>
#include <string>
#include <vector>

#include <muduo/base/Logging.h>
#include <muduo/base/Timestamp.h>
#include <muduo/net/EventLoop.h>
#include <muduo/net/InetAddress.h>

#include <httpServer.hpp>
#include <serverConfig.h>
#include <workerPool.h>

namespace
{

volatile sig_atomic_t g_stopRequested = 0;

void on_stop_signal(int)
{
    g_stopRequested = 1;
}

void install_signal_handlers()
{
    struct sigaction sa;
    memset(&sa, 0, sizeof sa);
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, NULL);
    ::sigaction(SIGTERM, &sa, NULL);
}

// one event loop per worker process
int run_worker(const server_config& config, int index, bool reusePort)
{
    muduo::net::EventLoop loop;
    muduo::net::InetAddress addr("0.0.0.0", config.port);
    httpServer httpserver(&loop, addr, "muduoStatic-" + std::to_string(index), config,
                          reusePort ? muduo::net::TcpServer::kReusePort
                                    : muduo::net::TcpServer::kNoReusePort);
    httpserver.setThreadNum(config.threads);

    bool draining = false;
    muduo::Timestamp deadline;
    loop.runEvery(0.2, [&]() {
        if (g_stopRequested && !draining)
        {
            draining = true;
            deadline = muduo::addTime(muduo::Timestamp::now(), config.drain_timeout);
            LOG_INFO << "worker " << index << " shutting down, draining "
                     << httpserver.activeConnections() << " connections";
            httpserver.drain();
        }
        if (draining && (httpserver.activeConnections() == 0 || deadline < muduo::Timestamp::now()))
        {
            loop.quit();
        }
    });

    httpserver.start();
    loop.loop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[])
{
    server_config config;
    std::string error;
    switch (parse_command_line(argc, argv, &config, &error))
    {
        case cli_result::HELP:
            std::cout << usage(argv[0]);
            return 0;
        case cli_result::USAGE_ERROR:
            std::cerr << error << std::endl << usage(argv[0]);
            return 2;
        case cli_result::RUN:
            break;
    }

    muduo::Logger::setLogLevel(config.debug ? muduo::Logger::DEBUG : muduo::Logger::INFO);
    if (!validate_config(&config, &error))
    {
        LOG_ERROR << error;
        return 1;
    }

    LOG_INFO << "Starting HTTP server on port " << config.port;
    LOG_INFO << "Document root: " << config.document_root;
    LOG_INFO << "Workers: " << config.workers << ", I/O threads per worker: " << config.threads;
    install_signal_handlers();

    std::vector<pid_t> children;
    int index = fork_workers(config.workers, &children);
    if (index > 0)
    {
        return run_worker(config, index, true);
    }

    int rc = run_worker(config, 0, config.workers > 1);
    stop_workers(children);
    LOG_INFO << "Server shut down";
    return rc;
}
