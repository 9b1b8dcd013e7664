#include "util.h"

#include <ctype.h>
#include <stdio.h>

#include <algorithm>
#include <map>

namespace
{

const std::map<std::string, std::string>& mime_table()
{
    static const std::map<std::string, std::string> table = {
        {"html", "text/html"},
        {"htm",  "text/html"},
        {"css",  "text/css"},
        {"js",   "application/javascript"},
        {"jpg",  "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"png",  "image/png"},
        {"gif",  "image/gif"},
        {"swf",  "application/x-shockwave-flash"},
        {"txt",  "text/plain"},
        {"json", "application/json"},
        {"xml",  "application/xml"},
        {"ico",  "image/x-icon"},
        {"svg",  "image/svg+xml"},
    };
    return table;
}

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string get_content_type(const std::string& path)
{
    size_t slash = path.rfind('/');
    size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash))
    {
        return "application/octet-stream";
    }

    auto it = mime_table().find(to_lower(path.substr(dot + 1)));
    return it != mime_table().end() ? it->second : "application/octet-stream";
}

bool url_decode(const std::string& in, std::string* out)
{
    std::string decoded;
    decoded.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] != '%')
        {
            decoded.push_back(in[i]);
            continue;
        }
        if (i + 2 >= in.size())
        {
            return false;
        }
        int hi = hex_value(in[i + 1]);
        int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0)
        {
            return false;
        }
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    out->swap(decoded);
    return true;
}

std::string http_date(time_t when)
{
    static const char* const kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    struct tm tm_time;
    ::gmtime_r(&when, &tm_time);

    char buf[32];
    snprintf(buf, sizeof buf, "%s, %02d %s %04d %02d:%02d:%02d GMT",
             kDays[tm_time.tm_wday], tm_time.tm_mday, kMonths[tm_time.tm_mon],
             tm_time.tm_year + 1900, tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);
    return buf;
}

const char* status_reason(int status)
{
    switch (status)
    {
        case 200: return "OK";
        case 204: return "No Content";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 414: return "URI Too Long";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() && ::strncasecmp(a.data(), b.data(), a.size()) == 0;
}

std::string to_lower(const std::string& s)
{
    std::string lowered(s);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    return lowered;
}

std::string trim_whitespace(const std::string& s)
{
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos)
    {
        return std::string();
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}
