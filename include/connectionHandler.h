#ifndef MUDUOSTATIC_CONNECTIONHANDLER_H
#define MUDUOSTATIC_CONNECTIONHANDLER_H

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>

#include <muduo/base/noncopyable.h>
#include <muduo/net/Buffer.h>

#include "httpRequest.h"
#include "httpResponse.h"
#include "pathResolver.h"
#include "serverConfig.h"
#include "util.h"

// The byte stream and timer a connection_handler drives.
// httpServer adapts a muduo TcpConnection to it.
class connection_transport
{
public:
    typedef std::function<void()> TimerCallback;

    virtual ~connection_transport() {}

    // received bytes not consumed yet
    virtual muduo::net::Buffer* input() = 0;

    // Takes everything readable in `data`. Each call is answered by exactly
    // one on_write_complete() once the output has drained.
    virtual void send(muduo::net::Buffer* data) = 0;

    // half-close after queued output is flushed
    virtual void shutdown() = 0;
    virtual void force_close() = 0;

    // one timer per connection, starting a new one replaces the old
    virtual void start_timer(double seconds, const TimerCallback& cb) = 0;
    virtual void cancel_timer() = 0;
};

// Owns one accepted connection from the first byte to the close.
//
// AwaitingRequest -> Parsing -> Resolving -> Responding -> AwaitingRequest
//                                                      \-> Closing -> Closed
//
// Only one request is in flight: bytes that arrive while Responding stay in
// the input buffer and are parsed after the response has been flushed.
class connection_handler : public std::enable_shared_from_this<connection_handler>,
                           muduo::noncopyable
{
public:
    enum State
    {
        kAwaitingRequest,
        kParsing,
        kResolving,
        kResponding,
        kClosing,
        kClosed,
    };

    connection_handler(const std::string& name,
                       const server_config& config,
                       std::unique_ptr<connection_transport> transport);

    // enters AwaitingRequest and arms the idle timer
    void start();

    void on_message();
    void on_write_complete();
    void on_idle_timeout();
    void on_close();

    // graceful shutdown: close when idle, finish the current response with
    // "Connection: close" otherwise
    void drain();

    State state() const { return _state; }
    size_t requests_served() const { return _requestsServed; }
    const std::string& name() const { return _name; }

private:
    void process_input();
    void handle_request(const http_request& request);
    void serve_file(const http_request& request, const resolved_target& target, bool keepAlive);
    void send_response(const http_response& response, bool headRequest);
    bool append_file_chunk(muduo::net::Buffer* output);
    void finish_response();
    void close_after_flush();
    void abort_connection();
    void arm_timer();
    void release_file();

    const std::string _name;
    const server_config _config;
    std::unique_ptr<connection_transport> _transport;

    State _state;
    bool _keepAlive;
    bool _draining;
    size_t _requestsServed;

    scoped_fd _file;
    int64_t _fileOffset;
    int64_t _fileRemaining;
};

#endif  // MUDUOSTATIC_CONNECTIONHANDLER_H
