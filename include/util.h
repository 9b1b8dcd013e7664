#ifndef MUDUOSTATIC_UTIL_H
#define MUDUOSTATIC_UTIL_H

#include <string.h>
#include <strings.h>
#include <stdint.h>
#include <time.h>
#include <unistd.h>

#include <string>

#include <muduo/base/noncopyable.h>

#define MUDUOSTATIC_SERVER_NAME "muduoStatic/0.1"

// Content-Type for a file path, picked by extension (case-insensitive).
// Unknown extensions map to application/octet-stream.
std::string get_content_type(const std::string& path);

// Percent-decode a URL path. '+' is kept as '+'.
// Returns false on a truncated or non-hex %XX sequence.
bool url_decode(const std::string& in, std::string* out);

// IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string http_date(time_t when);

const char* status_reason(int status);

bool iequals(const std::string& a, const std::string& b);
std::string to_lower(const std::string& s);

// strips SP and HTAB from both ends
std::string trim_whitespace(const std::string& s);

// case-insensitive ordering for header names
struct ci_less
{
    bool operator()(const std::string& a, const std::string& b) const
    {
        return ::strcasecmp(a.c_str(), b.c_str()) < 0;
    }
};

// Owns an open file descriptor, closes it on destruction.
class scoped_fd : muduo::noncopyable
{
public:
    explicit scoped_fd(int fd = -1) : _fd(fd) {}
    ~scoped_fd() { reset(); }

    int get() const { return _fd; }
    bool valid() const { return _fd >= 0; }

    void reset(int fd = -1)
    {
        if (_fd >= 0)
        {
            ::close(_fd);
        }
        _fd = fd;
    }

private:
    int _fd;
};

#endif  // MUDUOSTATIC_UTIL_H
