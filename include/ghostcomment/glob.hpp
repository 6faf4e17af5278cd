#pragma once

#include <ghostcomment/result.hpp>
#include <string>
#include <vector>
#include <filesystem>

namespace ghostcomment {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9],
//           {a,b} alternation (nestable)
bool glob_match(const std::string& pattern, const std::string& path);

// Expand {a,b} alternations into the full list of plain patterns.
// A pattern without braces expands to itself.
std::vector<std::string> glob_expand_braces(const std::string& pattern);

// Check if pattern is a negation pattern (prefixed with '!').
// If so, stores the inner pattern (without '!') in `inner` and returns true.
bool glob_is_negation(const std::string& pattern, std::string& inner);

// Apply ordered include/exclude patterns to a list of paths.
// Patterns prefixed with '!' exclude; others include.
// Returns paths that match at least one include and no subsequent exclude.
std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths);

struct GlobOptions {
    bool dot = false;   // let wildcards reach dot-files and dot-directories
};

// Walk root_dir and return every regular file accepted by glob_filter(patterns).
// Paths are relative to root_dir, forward-slash separated and sorted.
// Directories matched by an exclude pattern ending in "/**" are not descended.
Result<std::vector<std::string>> glob_expand(
    const std::vector<std::string>& patterns,
    const std::filesystem::path& root_dir,
    const GlobOptions& opts = {});

} // namespace ghostcomment
