#ifndef MUDUOSTATIC_HTTPSERVER_HPP
#define MUDUOSTATIC_HTTPSERVER_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/any.hpp>
#include <muduo/base/Logging.h>
#include <muduo/net/EventLoop.h>
#include <muduo/net/TcpServer.h>
#include <muduo/net/TimerId.h>

#include "connectionHandler.h"
#include "serverConfig.h"

// connection_transport over a muduo TcpConnection. Lives inside the
// connection's context, so it only holds a weak reference back.
class tcp_transport : public connection_transport
{
public:
    explicit tcp_transport(const muduo::net::TcpConnectionPtr& conn)
        : _conn(conn), _loop(conn->getLoop()), _input(conn->inputBuffer()), _timerArmed(false)
    {
    }

    muduo::net::Buffer* input() override { return _input; }

    void send(muduo::net::Buffer* data) override
    {
        muduo::net::TcpConnectionPtr conn = _conn.lock();
        if (conn)
        {
            conn->send(data);
        }
    }

    void shutdown() override
    {
        muduo::net::TcpConnectionPtr conn = _conn.lock();
        if (conn)
        {
            conn->shutdown();
        }
    }

    void force_close() override
    {
        muduo::net::TcpConnectionPtr conn = _conn.lock();
        if (conn)
        {
            conn->forceClose();
        }
    }

    void start_timer(double seconds, const TimerCallback& cb) override
    {
        cancel_timer();
        _timer = _loop->runAfter(seconds, cb);
        _timerArmed = true;
    }

    void cancel_timer() override
    {
        if (_timerArmed)
        {
            _loop->cancel(_timer);
            _timerArmed = false;
        }
    }

private:
    std::weak_ptr<muduo::net::TcpConnection> _conn;
    muduo::net::EventLoop* _loop;
    muduo::net::Buffer* _input;
    muduo::net::TimerId _timer;
    bool _timerArmed;
};

class httpServer
{
public:
    // connection name and how many requests it served
    typedef std::function<void(const std::string&, size_t)> ConnectionClosedCallback;

    httpServer(muduo::net::EventLoop* loop,
        const muduo::net::InetAddress& listenAddr,
        const std::string& nameArg,
        const server_config& config,
        muduo::net::TcpServer::Option option = muduo::net::TcpServer::kNoReusePort)
        :_loop(loop),_config(config),_draining(false),_tcpServer(loop,listenAddr,nameArg,option)
        {
            _tcpServer.setConnectionCallback(std::bind(&httpServer::ConnectionCallback, this, std::placeholders::_1));
            _tcpServer.setMessageCallback(std::bind(&httpServer::MessageCallback, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
            _tcpServer.setWriteCompleteCallback(std::bind(&httpServer::WriteCompleteCallback, this, std::placeholders::_1));
        }
    void setThreadNum(int num = 2)
    {
        _tcpServer.setThreadNum(num);
    }
    // set before start(); called from the connection's I/O thread
    void setConnectionClosedCallback(const ConnectionClosedCallback& cb)
    {
        _closedCallback = cb;
    }
    void start()
    {
        LOG_INFO << _tcpServer.name() << " listening on " << _tcpServer.ipPort()
                 << ", serving " << _config.document_root;
        _tcpServer.start();
    }

    // Stop starting new requests: idle connections close now, busy ones
    // after their current response. Thread safe.
    void drain()
    {
        std::vector<muduo::net::TcpConnectionPtr> connections;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _draining = true;
            connections.assign(_connections.begin(), _connections.end());
        }
        for (const muduo::net::TcpConnectionPtr& conn : connections)
        {
            conn->getLoop()->runInLoop([conn]() {
                std::shared_ptr<connection_handler> handler = handlerOf(conn);
                if (handler)
                {
                    handler->drain();
                }
            });
        }
    }

    size_t activeConnections() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _connections.size();
    }

private:
    static std::shared_ptr<connection_handler> handlerOf(const muduo::net::TcpConnectionPtr& conn)
    {
        const std::shared_ptr<connection_handler>* handler =
            boost::any_cast<std::shared_ptr<connection_handler>>(&conn->getContext());
        return handler ? *handler : std::shared_ptr<connection_handler>();
    }

    void ConnectionCallback(const muduo::net::TcpConnectionPtr& conn)
    {
        if(!conn->connected())
        {
            size_t served = 0;
            std::shared_ptr<connection_handler> handler = handlerOf(conn);
            if (handler)
            {
                handler->on_close();
                served = handler->requests_served();
            }
            // releases the handler and whatever file it still had open
            conn->setContext(boost::any());
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _connections.erase(conn);
            }
            LOG_DEBUG << conn->name() << " closed after " << served << " requests";
            if (_closedCallback)
            {
                _closedCallback(conn->name(), served);
            }
        }
        else
        {
            LOG_DEBUG << conn->name() << " accepted from " << conn->peerAddress().toIpPort();
            conn->setTcpNoDelay(true);
            std::shared_ptr<connection_handler> handler = std::make_shared<connection_handler>(
                conn->name(), _config, std::unique_ptr<connection_transport>(new tcp_transport(conn)));
            conn->setContext(handler);
            handler->start();

            bool draining = false;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                _connections.insert(conn);
                draining = _draining;
            }
            if (draining)
            {
                handler->drain();
            }
        }
    }

    void MessageCallback(const muduo::net::TcpConnectionPtr& conn,muduo::net::Buffer*buffer,muduo::Timestamp time)
    {
        std::shared_ptr<connection_handler> handler = handlerOf(conn);
        if (!handler)
        {
            buffer->retrieveAll();
            return;
        }
        handler->on_message();
    }

    void WriteCompleteCallback(const muduo::net::TcpConnectionPtr& conn)
    {
        std::shared_ptr<connection_handler> handler = handlerOf(conn);
        if (handler)
        {
            handler->on_write_complete();
        }
    }

    muduo::net::EventLoop* _loop;
    const server_config _config;
    ConnectionClosedCallback _closedCallback;

    mutable std::mutex _mutex;
    bool _draining;
    std::unordered_set<muduo::net::TcpConnectionPtr> _connections;

    // last: its destructor still reports closing connections to the members above
    muduo::net::TcpServer _tcpServer;
};

#endif  // MUDUOSTATIC_HTTPSERVER_HPP
