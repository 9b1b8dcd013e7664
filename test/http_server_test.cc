#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <muduo/net/EventLoop.h>
#include <muduo/net/InetAddress.h>

#include "httpServer.hpp"
#include "testSupport.h"

namespace
{

// asks the kernel for a port nobody is listening on
uint16_t free_port()
{
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    struct sockaddr_in addr;
    memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    socklen_t len = sizeof addr;
    if (fd < 0 || ::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof addr) != 0 ||
        ::getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0)
    {
        throw std::runtime_error("cannot pick a free port");
    }
    ::close(fd);
    return ntohs(addr.sin_port);
}

// Blocking loopback client, every read gives up after a few seconds.
class test_client
{
public:
    explicit test_client(uint16_t port)
        : _fd(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0))
    {
        struct timeval tv;
        tv.tv_sec = 3;
        tv.tv_usec = 0;
        ::setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof tv);

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof addr);
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(port);
        _connected = ::connect(_fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof addr) == 0;
    }

    ~test_client() { ::close(_fd); }

    bool connected() const { return _connected; }

    bool send(const std::string& data)
    {
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
            {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    bool read_response(parsed_response* out, bool headRequest = false)
    {
        while (true)
        {
            size_t used = parse_response(_pending, headRequest, out);
            if (used > 0)
            {
                _pending.erase(0, used);
                return true;
            }
            if (!fill())
            {
                return false;
            }
        }
    }

    // true once the server has closed its side, false on timeout
    bool wait_for_eof()
    {
        while (true)
        {
            char buf[4096];
            ssize_t n = ::recv(_fd, buf, sizeof buf, 0);
            if (n == 0)
            {
                return true;
            }
            if (n < 0)
            {
                return errno == ECONNRESET;
            }
            _pending.append(buf, static_cast<size_t>(n));
        }
    }

    const std::string& pending() const { return _pending; }

private:
    bool fill()
    {
        char buf[65536];
        ssize_t n = ::recv(_fd, buf, sizeof buf, 0);
        if (n <= 0)
        {
            return false;
        }
        _pending.append(buf, static_cast<size_t>(n));
        return true;
    }

    int _fd;
    bool _connected;
    std::string _pending;
};

}  // namespace

class HttpServerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        _root.write_file("index.html", "<h1>home</h1>");
        _root.write_file("hello.txt", "hello world\n");
        _root.make_dir("docs");
        _root.write_file("docs/index.html", "<h1>docs</h1>");
        _big.assign(1024 * 1024 + 17, 'z');
        for (size_t i = 0; i < _big.size(); i += 97)
        {
            _big[i] = static_cast<char>('a' + i % 26);
        }
        _root.write_file("big.bin", _big);

        _config.document_root = _root.path();
        _config.idle_timeout = 1.0;
        _port = free_port();

        std::promise<void> ready;
        std::future<void> started = ready.get_future();
        _thread = std::thread([this, &ready]() {
            muduo::net::EventLoop loop;
            muduo::net::InetAddress addr("127.0.0.1", _port);
            httpServer server(&loop, addr, "httpServerTest", _config);
            server.setConnectionClosedCallback([this](const std::string&, size_t served) {
                std::lock_guard<std::mutex> lock(_mutex);
                _closedConnections++;
                _lastServed = served;
                _closed.notify_all();
            });
            server.start();
            _loop = &loop;
            _server = &server;
            ready.set_value();
            loop.loop();
        });
        started.wait();
    }

    void TearDown() override
    {
        _loop->quit();
        _thread.join();
    }

    // waits until the server has reported `count` closed connections
    bool wait_for_closed(int count)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        return _closed.wait_for(lock, std::chrono::seconds(3),
                                [this, count]() { return _closedConnections >= count; });
    }

    temp_dir _root;
    std::string _big;
    server_config _config;
    uint16_t _port = 0;

    std::thread _thread;
    muduo::net::EventLoop* _loop = nullptr;
    httpServer* _server = nullptr;

    std::mutex _mutex;
    std::condition_variable _closed;
    int _closedConnections = 0;
    size_t _lastServed = 0;
};

TEST_F(HttpServerTest, KeepAliveServesSeveralRequests)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());

    parsed_response first;
    ASSERT_TRUE(client.send("GET /hello.txt HTTP/1.1\r\nHost: localhost\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&first));
    EXPECT_EQ("HTTP/1.1 200 OK", first.status_line);
    EXPECT_EQ("text/plain", first.header("Content-Type"));
    EXPECT_EQ("keep-alive", first.header("Connection"));
    EXPECT_EQ("hello world\n", first.body);

    parsed_response second;
    ASSERT_TRUE(client.send("GET / HTTP/1.1\r\nHost: localhost\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&second));
    EXPECT_EQ(200, second.status);
    EXPECT_EQ("text/html", second.header("Content-Type"));
    EXPECT_EQ("<h1>home</h1>", second.body);
}

TEST_F(HttpServerTest, ClosedCallbackReportsRequestsServed)
{
    {
        test_client client(_port);
        ASSERT_TRUE(client.connected());
        parsed_response response;
        ASSERT_TRUE(client.send("GET /hello.txt HTTP/1.1\r\n\r\nGET /docs/ HTTP/1.1\r\n\r\n"));
        ASSERT_TRUE(client.read_response(&response));
        ASSERT_TRUE(client.read_response(&response));
        EXPECT_EQ("<h1>docs</h1>", response.body);
    }
    ASSERT_TRUE(wait_for_closed(1));
    std::lock_guard<std::mutex> lock(_mutex);
    EXPECT_EQ(2u, _lastServed);
}

TEST_F(HttpServerTest, HeadSendsHeadersOnly)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    parsed_response response;
    ASSERT_TRUE(client.send("HEAD /hello.txt HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response, true));
    EXPECT_EQ(200, response.status);
    EXPECT_EQ("12", response.header("Content-Length"));
    EXPECT_TRUE(response.body.empty());

    // the next response starts right after the header block
    ASSERT_TRUE(client.send("GET /hello.txt HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ("hello world\n", response.body);
}

TEST_F(HttpServerTest, LargeFileArrivesIntact)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    parsed_response response;
    ASSERT_TRUE(client.send("GET /big.bin HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(std::to_string(_big.size()), response.header("Content-Length"));
    EXPECT_TRUE(response.body == _big);
}

TEST_F(HttpServerTest, ConnectionCloseEndsConnection)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    parsed_response response;
    ASSERT_TRUE(client.send("GET /hello.txt HTTP/1.1\r\nConnection: close\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ("close", response.header("Connection"));
    EXPECT_TRUE(client.wait_for_eof());
}

TEST_F(HttpServerTest, IdleConnectionIsClosedSilently)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    EXPECT_TRUE(client.wait_for_eof());
    EXPECT_TRUE(client.pending().empty());
}

TEST_F(HttpServerTest, ErrorStatuses)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    parsed_response response;

    ASSERT_TRUE(client.send("GET /../../etc/passwd HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(403, response.status);

    ASSERT_TRUE(client.send("GET /nope.html HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(404, response.status);

    ASSERT_TRUE(client.send("POST /hello.txt HTTP/1.1\r\nContent-Length: 0\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(405, response.status);
    EXPECT_EQ("GET, HEAD", response.header("Allow"));
    EXPECT_EQ("keep-alive", response.header("Connection"));

    ASSERT_TRUE(client.send("GARBAGE\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(400, response.status);
    EXPECT_EQ("close", response.header("Connection"));
    EXPECT_TRUE(client.wait_for_eof());
}

TEST_F(HttpServerTest, DrainClosesIdleConnections)
{
    test_client client(_port);
    ASSERT_TRUE(client.connected());
    parsed_response response;
    ASSERT_TRUE(client.send("GET /hello.txt HTTP/1.1\r\n\r\n"));
    ASSERT_TRUE(client.read_response(&response));
    EXPECT_EQ(1u, _server->activeConnections());

    _server->drain();
    EXPECT_TRUE(client.wait_for_eof());
    ASSERT_TRUE(wait_for_closed(1));
    EXPECT_EQ(0u, _server->activeConnections());
}
