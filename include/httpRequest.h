#ifndef MUDUOSTATIC_HTTPREQUEST_H
#define MUDUOSTATIC_HTTPREQUEST_H

#include <map>
#include <string>

#include "util.h"

enum class http_method
{
    GET,
    HEAD,
    UNSUPPORTED,    // a recognized method we do not serve, answered with 405
};

enum class http_version
{
    HTTP_1_0,
    HTTP_1_1,
};

typedef std::map<std::string, std::string, ci_less> header_map;

struct http_request
{
    http_method method = http_method::UNSUPPORTED;
    std::string method_token;   // method as received, kept for logging
    std::string target;         // raw request-target, still percent-encoded
    http_version version = http_version::HTTP_1_1;
    header_map headers;         // duplicate names: last one wins
    bool keep_alive = false;

    // nullptr when the header is absent
    const std::string* header(const std::string& name) const
    {
        header_map::const_iterator it = headers.find(name);
        return it == headers.end() ? nullptr : &it->second;
    }
};

#endif  // MUDUOSTATIC_HTTPREQUEST_H
