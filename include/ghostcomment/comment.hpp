#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ghostcomment {

// One discovered marker line.
//
// `original_line` is the full line as read from disk (indentation and any
// trailing '\r' included). The cleaner compares it byte-for-byte against the
// file before deleting anything.
struct GhostComment {
    std::string file_path;      // relative to the scan root, '/' separated
    int line_number = 0;        // 1-based
    std::string content;        // trimmed text after the prefix
    std::string prefix;
    std::string original_line;

    bool operator==(const GhostComment& o) const {
        return file_path == o.file_path && line_number == o.line_number &&
               content == o.content && prefix == o.prefix &&
               original_line == o.original_line;
    }
    bool operator!=(const GhostComment& o) const { return !(*this == o); }
};

struct ScanConfig {
    std::string prefix;
    std::vector<std::string> include;
    std::vector<std::string> exclude;
    bool fail_on_found = false;   // consumed by the caller, not the scanner

    // prefix "//_gc_" and the default language include/exclude sets
    static ScanConfig defaults();
};

namespace limits {

constexpr std::uint64_t kMaxFileSize = 10ull * 1024 * 1024;
constexpr std::size_t kMaxFiles = 10000;
constexpr std::size_t kMaxPrefixLength = 20;
constexpr std::size_t kMaxIncludePatterns = 50;
constexpr std::size_t kMaxExcludePatterns = 100;

} // namespace limits

// Split on '\n' only; a trailing newline yields a final empty line, so
// joining the pieces with '\n' reproduces the input exactly. The scanner and
// the cleaner's drift check must agree on line numbering.
std::vector<std::string> split_lines(const std::string& text);

} // namespace ghostcomment
