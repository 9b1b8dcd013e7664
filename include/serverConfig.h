#ifndef MUDUOSTATIC_SERVERCONFIG_H
#define MUDUOSTATIC_SERVERCONFIG_H

#include <stdint.h>

#include <string>

#include "requestParser.h"

struct server_config
{
    std::string document_root = "./static";
    uint16_t port = 80;
    int workers = 1;            // independent processes sharing the port
    int threads = 0;            // extra I/O loops per worker
    bool debug = false;
    double idle_timeout = 30.0; // seconds
    double drain_timeout = 5.0; // seconds allowed for in-flight responses at shutdown
    parser_limits limits;
};

enum class cli_result
{
    RUN,
    HELP,
    USAGE_ERROR,
};

// -r/--root, -p/--port, -w/--workers, -t/--threads, -i/--idle-timeout,
// -d/--debug, -h/--help
cli_result parse_command_line(int argc, char* argv[], server_config* config,
                              std::string* error);

// Canonicalizes document_root and checks it is a directory.
bool validate_config(server_config* config, std::string* error);

std::string usage(const char* program);

#endif  // MUDUOSTATIC_SERVERCONFIG_H
