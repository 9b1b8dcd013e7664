#ifndef MUDUOSTATIC_REQUESTPARSER_H
#define MUDUOSTATIC_REQUESTPARSER_H

#include <stddef.h>

#include "httpRequest.h"

enum class parse_status
{
    COMPLETE,       // request filled in, `consumed` bytes belong to it
    INCOMPLETE,     // need more bytes, nothing consumed
    ERROR,          // `error_status` says which HTTP status to answer with
};

struct parse_result
{
    parse_status status;
    size_t consumed;
    int error_status;
};

struct parser_limits
{
    size_t max_target_bytes = 4096;
    size_t max_header_bytes = 8192;    // request line + headers + blank line
};

// Parse one request head from the front of [data, data + len).
// Never reads a body: GET and HEAD carry none.
parse_result parse_request(const char* data, size_t len,
                           const parser_limits& limits,
                           http_request* request);

#endif  // MUDUOSTATIC_REQUESTPARSER_H
