#ifndef MUDUOSTATIC_PATHRESOLVER_H
#define MUDUOSTATIC_PATHRESOLVER_H

#include <stdint.h>

#include <string>

enum class resolve_outcome
{
    FOUND,
    NOT_FOUND,
    FORBIDDEN,
    BAD_REQUEST,    // target is not an origin-form path or has a bad %XX escape
};

struct resolved_target
{
    resolve_outcome outcome = resolve_outcome::NOT_FOUND;
    std::string path;           // canonical absolute path, only set when FOUND
    bool is_directory = false;  // the target named a directory, index.html was substituted
    int64_t size = 0;           // file size when resolved
};

// Map a raw request-target onto a regular readable file inside document_root.
// document_root must be an absolute canonical path (see validate_config).
// Every symlink is followed and the final path has to stay inside the root.
// A directory without index.html is FORBIDDEN.
resolved_target resolve_target(const std::string& rawTarget,
                               const std::string& documentRoot);

// true when `path` is `root` itself or lies below it
bool is_within_root(const std::string& path, const std::string& root);

#endif  // MUDUOSTATIC_PATHRESOLVER_H
