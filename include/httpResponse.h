#ifndef MUDUOSTATIC_HTTPRESPONSE_H
#define MUDUOSTATIC_HTTPRESPONSE_H

#include <stdint.h>
#include <time.h>

#include <string>
#include <utility>
#include <vector>

enum class body_kind
{
    NONE,
    MEMORY,     // body_bytes
    FILE,       // streamed from an open file by the connection handler
};

struct http_response
{
    int status = 200;
    std::string reason = "OK";
    bool keep_alive = true;
    std::string content_type;
    int64_t content_length = 0;
    body_kind body = body_kind::NONE;
    std::string body_bytes;
    std::vector<std::pair<std::string, std::string>> headers;  // extra headers, in order

    void add_header(const std::string& name, const std::string& value)
    {
        headers.push_back(std::make_pair(name, value));
    }
};

// Small text/html page "<h1>404 Not Found</h1>". 405 gets "Allow: GET, HEAD".
http_response make_error_response(int status, bool keepAlive);

// 200 for a resolved file; Content-Type from the file extension.
http_response make_file_response(const std::string& path, int64_t size, bool keepAlive);

// Status line, Server, Date, Connection, Content-Type, Content-Length,
// extra headers, blank line.
std::string build_header_block(const http_response& response, time_t now);

// HEAD and 1xx/204/304 never carry body bytes
bool should_send_body(const http_response& response, bool headRequest);

#endif  // MUDUOSTATIC_HTTPRESPONSE_H
