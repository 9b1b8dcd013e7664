#include "serverConfig.h"

#include <errno.h>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>

namespace
{

bool parse_long(const char* text, long min, long max, long* value)
{
    char* end = NULL;
    errno = 0;
    long parsed = strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || parsed < min || parsed > max)
    {
        return false;
    }
    *value = parsed;
    return true;
}

bool parse_seconds(const char* text, double* value)
{
    char* end = NULL;
    errno = 0;
    double parsed = strtod(text, &end);
    if (errno != 0 || end == text || *end != '\0' || !(parsed > 0))
    {
        return false;
    }
    *value = parsed;
    return true;
}

}  // namespace

cli_result parse_command_line(int argc, char* argv[], server_config* config,
                              std::string* error)
{
    static const struct option kOptions[] = {
        {"root",         required_argument, NULL, 'r'},
        {"port",         required_argument, NULL, 'p'},
        {"workers",      required_argument, NULL, 'w'},
        {"threads",      required_argument, NULL, 't'},
        {"idle-timeout", required_argument, NULL, 'i'},
        {"debug",        no_argument,       NULL, 'd'},
        {"help",         no_argument,       NULL, 'h'},
        {NULL, 0, NULL, 0},
    };

    // full re-initialization of getopt state
    optind = 0;
    opterr = 0;
    long number = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, ":r:p:w:t:i:dh", kOptions, NULL)) != -1)
    {
        switch (opt)
        {
            case 'r':
                config->document_root = optarg;
                break;
            case 'p':
                if (!parse_long(optarg, 1, 65535, &number))
                {
                    *error = std::string("invalid port: ") + optarg;
                    return cli_result::USAGE_ERROR;
                }
                config->port = static_cast<uint16_t>(number);
                break;
            case 'w':
                if (!parse_long(optarg, 1, 256, &number))
                {
                    *error = std::string("invalid worker count: ") + optarg;
                    return cli_result::USAGE_ERROR;
                }
                config->workers = static_cast<int>(number);
                break;
            case 't':
                if (!parse_long(optarg, 0, 256, &number))
                {
                    *error = std::string("invalid thread count: ") + optarg;
                    return cli_result::USAGE_ERROR;
                }
                config->threads = static_cast<int>(number);
                break;
            case 'i':
                if (!parse_seconds(optarg, &config->idle_timeout))
                {
                    *error = std::string("invalid idle timeout: ") + optarg;
                    return cli_result::USAGE_ERROR;
                }
                break;
            case 'd':
                config->debug = true;
                break;
            case 'h':
                return cli_result::HELP;
            case ':':
                *error = std::string("missing argument for ") + argv[optind - 1];
                return cli_result::USAGE_ERROR;
            default:
                if (optopt != 0)
                {
                    *error = std::string("unknown option -") + static_cast<char>(optopt);
                }
                else
                {
                    *error = std::string("unknown option ") + argv[optind - 1];
                }
                return cli_result::USAGE_ERROR;
        }
    }
    if (optind < argc)
    {
        *error = std::string("unexpected argument ") + argv[optind];
        return cli_result::USAGE_ERROR;
    }
    return cli_result::RUN;
}

bool validate_config(server_config* config, std::string* error)
{
    char* resolved = ::realpath(config->document_root.c_str(), NULL);
    if (resolved == NULL)
    {
        *error = "Document root does not exist: " + config->document_root;
        return false;
    }
    std::string root(resolved);
    free(resolved);

    struct stat st;
    if (::stat(root.c_str(), &st) != 0 || !S_ISDIR(st.st_mode))
    {
        *error = "Document root is not a directory: " + root;
        return false;
    }
    config->document_root = root;
    return true;
}

std::string usage(const char* program)
{
    std::string text = "usage: ";
    text += program;
    text += " [options]\n"
            "  -r, --root DIR            document root (default ./static)\n"
            "  -p, --port PORT           port to listen on (default 80)\n"
            "  -w, --workers N           worker processes (default 1)\n"
            "  -t, --threads N           extra I/O threads per worker (default 0)\n"
            "  -i, --idle-timeout SECS   close idle connections after SECS (default 30)\n"
            "  -d, --debug               enable debug logging\n"
            "  -h, --help                show this help\n";
    return text;
}
