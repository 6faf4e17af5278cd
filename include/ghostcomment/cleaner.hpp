#pragma once

#include <ghostcomment/comment.hpp>
#include <ghostcomment/file_store.hpp>
#include <ghostcomment/grouper.hpp>
#include <ghostcomment/log.hpp>
#include <ghostcomment/result.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ghostcomment {

struct CleanOptions {
    bool create_backups = true;
    bool restore_on_error = true;
    bool remove_backups = false;
    bool dry_run = false;
};

struct FileFailure {
    std::string file_path;
    GcError error;
};

struct CleanResult {
    std::size_t files_processed = 0;
    std::size_t comments_removed = 0;
    std::vector<std::string> modified_files;
    std::vector<std::string> error_files;
    std::vector<std::string> restored_files;   // rolled back from backup
    std::vector<FileFailure> failures;         // one per entry in error_files
    bool has_errors = false;
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
};

// ".<basename>.ghostcomment-backup-<UTC timestamp>" where the timestamp is
// ISO-8601 with microseconds and every ':' and '.' replaced by '-'.
std::string backup_file_name(const std::string& basename,
                             std::chrono::system_clock::time_point when);

// Removes ghost comment lines from files.
//
// Each file is handled as its own transaction: stats captured, optional
// backup, every comment verified against the current content, then a single
// rewrite with the stats restored. A failed file is reported in the result
// and the batch moves on; with restore_on_error the files already cleaned in
// the batch are rolled back from their backups.
class Cleaner {
public:
    explicit Cleaner(FileStore& store, log::Sink& sink = log::stderr_sink());

    Result<CleanResult> remove_comments(const std::vector<GhostComment>& comments,
                                        const CleanOptions& options,
                                        const std::filesystem::path& working_dir);

    // Range and drift checks without touching the disk. Collects every
    // problem instead of stopping at the first.
    ValidationResult validate_for_cleaning(const std::vector<GhostComment>& comments,
                                           const std::filesystem::path& working_dir);

    // Sibling backup path for `file` that does not exist yet.
    std::filesystem::path backup_path_for(const std::filesystem::path& file);

private:
    struct CleanedFile {
        std::string file_path;
        std::filesystem::path abs_path;
        std::filesystem::path backup_path;   // empty when no backup was made
        std::size_t comments_removed = 0;
        FileStats original_stats;
    };

    FileStore& store_;
    log::Sink& sink_;

    Result<CleanedFile> clean_file(const FileComments& group,
                                   const CleanOptions& options,
                                   const std::filesystem::path& root);
    void restore_stats(const std::filesystem::path& path, const FileStats& stats);
    void rollback(const std::vector<CleanedFile>& cleaned, CleanResult& result);
    void discard_backup(const std::filesystem::path& backup_path);
};

} // namespace ghostcomment
