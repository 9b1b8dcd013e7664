#include "pathResolver.h"

#include <errno.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <vector>

#include "util.h"

namespace
{

const char kIndexFile[] = "index.html";

resolved_target outcome_only(resolve_outcome outcome)
{
    resolved_target result;
    result.outcome = outcome;
    return result;
}

resolve_outcome errno_outcome(int err)
{
    switch (err)
    {
        case ENOENT:
        case ENOTDIR:
        case ENAMETOOLONG:
            return resolve_outcome::NOT_FOUND;
        default:
            // EACCES, ELOOP and anything unexpected
            return resolve_outcome::FORBIDDEN;
    }
}

std::string join_path(const std::string& dir, const std::string& name)
{
    std::string joined(dir);
    if (joined.empty() || joined[joined.size() - 1] != '/')
    {
        joined.push_back('/');
    }
    joined += name;
    return joined;
}

// realpath() the candidate, then check it did not leave the jail
resolve_outcome canonicalize(const std::string& candidate,
                             const std::string& root,
                             std::string* real)
{
    char* resolved = ::realpath(candidate.c_str(), NULL);
    if (resolved == NULL)
    {
        return errno_outcome(errno);
    }
    real->assign(resolved);
    free(resolved);

    if (!is_within_root(*real, root))
    {
        return resolve_outcome::FORBIDDEN;
    }
    return resolve_outcome::FOUND;
}

}  // namespace

bool is_within_root(const std::string& path, const std::string& root)
{
    if (root == "/")
    {
        return !path.empty() && path[0] == '/';
    }
    if (path.compare(0, root.size(), root) != 0)
    {
        return false;
    }
    return path.size() == root.size() || path[root.size()] == '/';
}

resolved_target resolve_target(const std::string& rawTarget,
                               const std::string& documentRoot)
{
    std::string path = rawTarget.substr(0, rawTarget.find_first_of("?#"));
    if (path.empty() || path[0] != '/')
    {
        return outcome_only(resolve_outcome::BAD_REQUEST);
    }

    std::string decoded;
    if (!url_decode(path, &decoded) || decoded.find('\0') != std::string::npos)
    {
        return outcome_only(resolve_outcome::BAD_REQUEST);
    }
    bool namesDirectory = decoded[decoded.size() - 1] == '/';

    // lexical normalization; ".." may never climb above the root
    std::vector<std::string> segments;
    size_t start = 0;
    while (start < decoded.size())
    {
        size_t slash = decoded.find('/', start);
        if (slash == std::string::npos)
        {
            slash = decoded.size();
        }
        std::string segment = decoded.substr(start, slash - start);
        start = slash + 1;

        if (segment.empty() || segment == ".")
        {
            continue;
        }
        if (segment == "..")
        {
            if (segments.empty())
            {
                return outcome_only(resolve_outcome::FORBIDDEN);
            }
            segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string candidate = documentRoot;
    for (const std::string& segment : segments)
    {
        candidate = join_path(candidate, segment);
    }

    std::string real;
    resolve_outcome outcome = canonicalize(candidate, documentRoot, &real);
    if (outcome != resolve_outcome::FOUND)
    {
        return outcome_only(outcome);
    }

    struct stat st;
    if (::stat(real.c_str(), &st) != 0)
    {
        return outcome_only(errno_outcome(errno));
    }

    resolved_target result;
    if (S_ISDIR(st.st_mode))
    {
        outcome = canonicalize(join_path(real, kIndexFile), documentRoot, &real);
        if (outcome == resolve_outcome::NOT_FOUND)
        {
            // no directory listings
            return outcome_only(resolve_outcome::FORBIDDEN);
        }
        if (outcome != resolve_outcome::FOUND)
        {
            return outcome_only(outcome);
        }
        if (::stat(real.c_str(), &st) != 0)
        {
            return outcome_only(errno_outcome(errno));
        }
        result.is_directory = true;
    }
    else if (namesDirectory)
    {
        return outcome_only(resolve_outcome::NOT_FOUND);
    }

    if (!S_ISREG(st.st_mode))
    {
        return outcome_only(resolve_outcome::FORBIDDEN);
    }
    if (::access(real.c_str(), R_OK) != 0)
    {
        return outcome_only(errno_outcome(errno));
    }

    result.outcome = resolve_outcome::FOUND;
    result.path.swap(real);
    result.size = static_cast<int64_t>(st.st_size);
    return result;
}
