#include "httpResponse.h"

#include "util.h"

http_response make_error_response(int status, bool keepAlive)
{
    http_response response;
    response.status = status;
    response.reason = status_reason(status);
    response.keep_alive = keepAlive;
    response.content_type = "text/html";
    response.body = body_kind::MEMORY;
    response.body_bytes = "<html><body><h1>" + std::to_string(status) + " " +
                          response.reason + "</h1></body></html>";
    response.content_length = static_cast<int64_t>(response.body_bytes.size());
    if (status == 405)
    {
        response.add_header("Allow", "GET, HEAD");
    }
    return response;
}

http_response make_file_response(const std::string& path, int64_t size, bool keepAlive)
{
    http_response response;
    response.status = 200;
    response.reason = status_reason(200);
    response.keep_alive = keepAlive;
    response.content_type = get_content_type(path);
    response.content_length = size;
    response.body = body_kind::FILE;
    return response;
}

std::string build_header_block(const http_response& response, time_t now)
{
    std::string block;
    block.reserve(256);
    block += "HTTP/1.1 ";
    block += std::to_string(response.status);
    block += ' ';
    block += response.reason;
    block += "\r\n";

    block += "Server: " MUDUOSTATIC_SERVER_NAME "\r\n";
    block += "Date: " + http_date(now) + "\r\n";
    block += response.keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    if (!response.content_type.empty())
    {
        block += "Content-Type: " + response.content_type + "\r\n";
    }
    block += "Content-Length: " + std::to_string(response.content_length) + "\r\n";

    for (const auto& header : response.headers)
    {
        block += header.first;
        block += ": ";
        block += header.second;
        block += "\r\n";
    }
    block += "\r\n";
    return block;
}

bool should_send_body(const http_response& response, bool headRequest)
{
    if (headRequest || response.body == body_kind::NONE)
    {
        return false;
    }
    return !(response.status < 200 || response.status == 204 || response.status == 304);
}
