#include "requestParser.h"

#include <ctype.h>
#include <string.h>

#include <algorithm>
#include <utility>

namespace
{

const char kCRLF[] = "\r\n";
const char kCRLFCRLF[] = "\r\n\r\n";

// room for the method, two spaces and "HTTP/1.1" around the target
const size_t kRequestLineOverhead = 32;

parse_result complete(size_t consumed)
{
    parse_result result = {parse_status::COMPLETE, consumed, 0};
    return result;
}

parse_result incomplete()
{
    parse_result result = {parse_status::INCOMPLETE, 0, 0};
    return result;
}

parse_result failed(int status)
{
    parse_result result = {parse_status::ERROR, 0, status};
    return result;
}

// RFC 7230 tchar
bool is_token_char(char c)
{
    if (isalnum(static_cast<unsigned char>(c)))
    {
        return true;
    }
    return strchr("!#$%&'*+-.^_`|~", c) != nullptr && c != '\0';
}

bool is_token(const std::string& s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), is_token_char);
}

bool is_recognized_method(const std::string& method)
{
    static const char* const kMethods[] = {
        "POST", "PUT", "DELETE", "PATCH", "OPTIONS", "TRACE", "CONNECT",
    };
    for (const char* m : kMethods)
    {
        if (method == m)
        {
            return true;
        }
    }
    return false;
}

// 0 on success, otherwise the status to answer with
int parse_request_line(const char* begin, const char* end,
                       const parser_limits& limits, http_request* request)
{
    std::string line(begin, end);
    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos)
    {
        return 400;
    }
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || line.find(' ', sp2 + 1) != std::string::npos)
    {
        return 400;
    }

    std::string method = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string version = line.substr(sp2 + 1);
    if (!is_token(method) || target.empty() || version.empty())
    {
        return 400;
    }
    if (target.size() > limits.max_target_bytes)
    {
        return 414;
    }
    for (char c : target)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc <= 0x20 || uc == 0x7f)
        {
            return 400;
        }
    }

    if (method == "GET")
    {
        request->method = http_method::GET;
    }
    else if (method == "HEAD")
    {
        request->method = http_method::HEAD;
    }
    else if (is_recognized_method(method))
    {
        request->method = http_method::UNSUPPORTED;
    }
    else
    {
        return 501;
    }

    if (version.size() != 8 || version.compare(0, 5, "HTTP/") != 0 ||
        !isdigit(static_cast<unsigned char>(version[5])) || version[6] != '.' ||
        !isdigit(static_cast<unsigned char>(version[7])))
    {
        return 400;
    }
    if (version == "HTTP/1.1")
    {
        request->version = http_version::HTTP_1_1;
    }
    else if (version == "HTTP/1.0")
    {
        request->version = http_version::HTTP_1_0;
    }
    else
    {
        return 505;
    }

    request->method_token.swap(method);
    request->target.swap(target);
    return 0;
}

bool parse_header_line(const char* begin, const char* end, http_request* request)
{
    // obsolete line folding is rejected
    if (begin == end || *begin == ' ' || *begin == '\t')
    {
        return false;
    }
    const char* colon = std::find(begin, end, ':');
    if (colon == end)
    {
        return false;
    }

    std::string name(begin, colon);
    if (!is_token(name))
    {
        return false;
    }
    std::string value(colon + 1, end);
    for (char c : value)
    {
        unsigned char uc = static_cast<unsigned char>(c);
        if ((uc < 0x20 && c != '\t') || uc == 0x7f)
        {
            return false;
        }
    }
    request->headers[name] = trim_whitespace(value);
    return true;
}

bool negotiate_keep_alive(const http_request& request)
{
    bool keepAlive = request.version == http_version::HTTP_1_1;
    const std::string* connection = request.header("Connection");
    if (connection == nullptr)
    {
        return keepAlive;
    }

    size_t start = 0;
    while (start <= connection->size())
    {
        size_t comma = connection->find(',', start);
        if (comma == std::string::npos)
        {
            comma = connection->size();
        }
        std::string token = trim_whitespace(connection->substr(start, comma - start));
        if (iequals(token, "close"))
        {
            return false;
        }
        if (iequals(token, "keep-alive"))
        {
            keepAlive = true;
        }
        start = comma + 1;
    }
    return keepAlive;
}

}  // namespace

parse_result parse_request(const char* data, size_t len,
                           const parser_limits& limits,
                           http_request* request)
{
    const char* end = data + len;
    const char* start = data;
    // empty lines before the request line are ignored, but they still count
    // against the header limit
    while (end - start >= 2 && start[0] == '\r' && start[1] == '\n')
    {
        start += 2;
    }

    const char* lineEnd = std::search(start, end, kCRLF, kCRLF + 2);
    if (lineEnd == end)
    {
        if (static_cast<size_t>(end - start) > limits.max_target_bytes + kRequestLineOverhead)
        {
            return failed(414);
        }
        if (len > limits.max_header_bytes)
        {
            return failed(431);
        }
        return incomplete();
    }

    http_request parsed;
    int status = parse_request_line(start, lineEnd, limits, &parsed);
    if (status != 0)
    {
        return failed(status);
    }

    const char* headersEnd = std::search(lineEnd, end, kCRLFCRLF, kCRLFCRLF + 4);
    if (headersEnd == end)
    {
        if (len > limits.max_header_bytes)
        {
            return failed(431);
        }
        return incomplete();
    }
    if (static_cast<size_t>(headersEnd + 4 - data) > limits.max_header_bytes)
    {
        return failed(431);
    }

    // header lines live in [lineEnd + 2, headersEnd + 2), each ending in CRLF
    const char* headerBlockEnd = headersEnd + 2;
    const char* p = lineEnd + 2;
    while (p < headerBlockEnd)
    {
        const char* eol = std::search(p, headerBlockEnd, kCRLF, kCRLF + 2);
        if (!parse_header_line(p, eol, &parsed))
        {
            return failed(400);
        }
        p = eol + 2;
    }

    parsed.keep_alive = negotiate_keep_alive(parsed);
    *request = std::move(parsed);
    return complete(static_cast<size_t>(headersEnd + 4 - data));
}
