#pragma once

#include <ghostcomment/comment.hpp>
#include <ghostcomment/enumerator.hpp>
#include <ghostcomment/file_store.hpp>
#include <ghostcomment/log.hpp>
#include <ghostcomment/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace ghostcomment {

// Check a ScanConfig against the static limits before any I/O.
// Fails with CONFIG_ERROR describing the first violation.
Status validate_scan_config(const ScanConfig& config);

// True if `prefix` is a comment opener (//, #, --, ;, %, /*) followed only by
// [A-Za-z0-9_:@!-].
bool is_valid_prefix(const std::string& prefix);

// Extract the ghost comment on one line, if any. `content` receives the
// trimmed remainder after the first occurrence of `prefix`.
bool extract_marker(const std::string& line, const std::string& prefix,
                    std::string& content);

class Scanner {
public:
    Scanner(FileEnumerator& enumerator, FileStore& store,
            log::Sink& sink = log::stderr_sink());

    // Enumerate, guard and scan every candidate file under working_dir.
    // Unreadable or oversize files are skipped with a warning.
    Result<std::vector<GhostComment>> scan(const ScanConfig& config,
                                           const std::filesystem::path& working_dir);

    // Scan one file given relative to working_dir or as an absolute path
    // under it. Errors on that file are returned, not skipped.
    Result<std::vector<GhostComment>> scan_single_file(
        const std::string& file_path,
        const ScanConfig& config,
        const std::filesystem::path& working_dir);

    // Same walk as scan() but only counts matches.
    Result<std::size_t> count(const ScanConfig& config,
                              const std::filesystem::path& working_dir);

private:
    FileEnumerator& enumerator_;
    FileStore& store_;
    log::Sink& sink_;

    Result<std::vector<std::string>> candidates(const ScanConfig& config,
                                                const std::filesystem::path& root);
    Status check_size(const std::filesystem::path& path);
    Status scan_file(const std::filesystem::path& abs_path,
                     const std::filesystem::path& root,
                     const std::string& prefix,
                     std::vector<GhostComment>& out);
};

} // namespace ghostcomment
