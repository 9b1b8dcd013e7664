#include "connectionHandler.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <utility>

#include <muduo/base/Logging.h>
#include <muduo/base/Timestamp.h>

#include "requestParser.h"

namespace
{

const int64_t kChunkSize = 64 * 1024;

}  // namespace

connection_handler::connection_handler(const std::string& name,
                                       const server_config& config,
                                       std::unique_ptr<connection_transport> transport)
    : _name(name),
      _config(config),
      _transport(std::move(transport)),
      _state(kAwaitingRequest),
      _keepAlive(false),
      _draining(false),
      _requestsServed(0),
      _fileOffset(0),
      _fileRemaining(0)
{
}

void connection_handler::start()
{
    _state = kAwaitingRequest;
    arm_timer();
}

void connection_handler::on_message()
{
    switch (_state)
    {
        case kClosing:
        case kClosed:
            _transport->input()->retrieveAll();
            break;
        case kResolving:
        case kResponding:
            // picked up by finish_response()
            break;
        case kAwaitingRequest:
        case kParsing:
            process_input();
            break;
    }
}

void connection_handler::process_input()
{
    muduo::net::Buffer* input = _transport->input();
    if (input->readableBytes() == 0)
    {
        return;
    }

    _state = kParsing;
    http_request request;
    parse_result result = parse_request(input->peek(), input->readableBytes(),
                                        _config.limits, &request);
    if (result.status == parse_status::INCOMPLETE)
    {
        // the idle timer keeps running: the head must arrive before it fires
        return;
    }

    _transport->cancel_timer();
    if (result.status == parse_status::ERROR)
    {
        LOG_WARN << _name << " malformed request, answering " << result.error_status;
        input->retrieveAll();
        send_response(make_error_response(result.error_status, false), false);
        return;
    }

    input->retrieve(result.consumed);
    ++_requestsServed;
    _state = kResolving;
    handle_request(request);
}

void connection_handler::handle_request(const http_request& request)
{
    bool keepAlive = request.keep_alive && !_draining;
    bool headRequest = request.method == http_method::HEAD;

    if (request.method == http_method::UNSUPPORTED)
    {
        LOG_DEBUG << _name << " " << request.method_token << " " << request.target << " 405";
        send_response(make_error_response(405, keepAlive), false);
        return;
    }

    resolved_target target = resolve_target(request.target, _config.document_root);
    int status = 0;
    switch (target.outcome)
    {
        case resolve_outcome::FOUND:
            serve_file(request, target, keepAlive);
            return;
        case resolve_outcome::NOT_FOUND:
            status = 404;
            break;
        case resolve_outcome::FORBIDDEN:
            status = 403;
            break;
        case resolve_outcome::BAD_REQUEST:
            status = 400;
            break;
    }
    LOG_DEBUG << _name << " " << request.method_token << " " << request.target << " " << status;
    send_response(make_error_response(status, keepAlive), headRequest);
}

void connection_handler::serve_file(const http_request& request,
                                    const resolved_target& target,
                                    bool keepAlive)
{
    bool headRequest = request.method == http_method::HEAD;
    int fd = ::open(target.path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        int savedErrno = errno;
        int status = 500;
        if (savedErrno == ENOENT || savedErrno == ENOTDIR)
        {
            status = 404;
        }
        else if (savedErrno == EACCES || savedErrno == EPERM)
        {
            status = 403;
        }
        else
        {
            LOG_SYSERR << _name << " open " << target.path;
            keepAlive = false;
        }
        send_response(make_error_response(status, keepAlive), headRequest);
        return;
    }
    _file.reset(fd);

    // the length is taken from the descriptor we are about to stream
    struct stat st;
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode))
    {
        LOG_SYSERR << _name << " fstat " << target.path;
        release_file();
        send_response(make_error_response(500, false), headRequest);
        return;
    }

    LOG_DEBUG << _name << " " << request.method_token << " " << request.target
              << " 200 " << static_cast<int64_t>(st.st_size);
    _fileOffset = 0;
    _fileRemaining = static_cast<int64_t>(st.st_size);
    if (headRequest || _fileRemaining == 0)
    {
        release_file();
    }
    send_response(make_file_response(target.path, static_cast<int64_t>(st.st_size), keepAlive),
                  headRequest);
}

void connection_handler::send_response(const http_response& response, bool headRequest)
{
    muduo::net::Buffer output;
    std::string head = build_header_block(response, muduo::Timestamp::now().secondsSinceEpoch());
    output.append(head.data(), head.size());
    if (should_send_body(response, headRequest) && response.body == body_kind::MEMORY)
    {
        output.append(response.body_bytes.data(), response.body_bytes.size());
    }

    _keepAlive = response.keep_alive;
    _state = kResponding;
    // header block and first chunk leave in a single send
    if (_file.valid() && !append_file_chunk(&output))
    {
        abort_connection();
        return;
    }
    _transport->send(&output);
    arm_timer();
}

bool connection_handler::append_file_chunk(muduo::net::Buffer* output)
{
    size_t want = static_cast<size_t>(std::min(kChunkSize, _fileRemaining));
    output->ensureWritableBytes(want);
    ssize_t n = ::pread(_file.get(), output->beginWrite(), want, _fileOffset);
    if (n < 0)
    {
        LOG_SYSERR << _name << " pread";
        return false;
    }
    if (n == 0)
    {
        LOG_ERROR << _name << " file shrank while streaming, " << _fileRemaining << " bytes missing";
        return false;
    }

    output->hasWritten(static_cast<size_t>(n));
    _fileOffset += n;
    _fileRemaining -= n;
    if (_fileRemaining == 0)
    {
        release_file();
    }
    return true;
}

void connection_handler::on_write_complete()
{
    if (_state != kResponding)
    {
        return;
    }

    if (_file.valid())
    {
        muduo::net::Buffer output;
        if (!append_file_chunk(&output))
        {
            abort_connection();
            return;
        }
        _transport->send(&output);
        // a peer that stops reading must not pin the file forever
        arm_timer();
        return;
    }
    finish_response();
}

void connection_handler::finish_response()
{
    if (_keepAlive && !_draining)
    {
        _state = kAwaitingRequest;
        arm_timer();
        process_input();
    }
    else
    {
        close_after_flush();
    }
}

void connection_handler::close_after_flush()
{
    _state = kClosing;
    _transport->shutdown();
    // drop a peer that never closes its side
    arm_timer();
}

void connection_handler::abort_connection()
{
    _state = kClosing;
    release_file();
    _transport->cancel_timer();
    _transport->force_close();
}

void connection_handler::on_idle_timeout()
{
    switch (_state)
    {
        case kAwaitingRequest:
        case kParsing:
            LOG_DEBUG << _name << " idle for " << _config.idle_timeout << "s, closing";
            break;
        case kResponding:
            LOG_WARN << _name << " no write progress for " << _config.idle_timeout
                     << "s, dropping response";
            break;
        case kClosing:
            LOG_DEBUG << _name << " peer kept a closed connection open, dropping";
            break;
        default:
            return;
    }
    abort_connection();
}

void connection_handler::on_close()
{
    _state = kClosed;
    release_file();
    _transport->cancel_timer();
}

void connection_handler::drain()
{
    _draining = true;
    if (_state == kAwaitingRequest)
    {
        close_after_flush();
    }
}

void connection_handler::arm_timer()
{
    std::weak_ptr<connection_handler> weakSelf(shared_from_this());
    _transport->cancel_timer();
    _transport->start_timer(_config.idle_timeout, [weakSelf]() {
        std::shared_ptr<connection_handler> self = weakSelf.lock();
        if (self)
        {
            self->on_idle_timeout();
        }
    });
}

void connection_handler::release_file()
{
    _file.reset();
    _fileRemaining = 0;
}
