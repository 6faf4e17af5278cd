#include <ghostcomment/cleaner.hpp>
#include <cstdio>
#include <ctime>
#include <exception>
#include <set>

namespace ghostcomment {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::string join_lines(const std::vector<std::string>& lines,
                              const std::set<size_t>& skip) {
    std::string out;
    bool first = true;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (skip.count(i)) continue;
        if (!first) out.push_back('\n');
        out += lines[i];
        first = false;
    }
    return out;
}

static std::string describe(const GcError& err) {
    if (err.cause.empty()) return err.message;
    return err.message + ": " + err.cause;
}

std::string backup_file_name(const std::string& basename,
                             std::chrono::system_clock::time_point when) {
    using namespace std::chrono;
    auto secs = time_point_cast<seconds>(when);
    auto micros = duration_cast<microseconds>(when - secs).count();

    std::time_t t = system_clock::to_time_t(secs);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H-%M-%S", &utc);
    char frac[16];
    std::snprintf(frac, sizeof(frac), "-%06lldZ", static_cast<long long>(micros));

    return "." + basename + ".ghostcomment-backup-" + stamp + frac;
}

// ---------------------------------------------------------------------------
// Cleaner
// ---------------------------------------------------------------------------

Cleaner::Cleaner(FileStore& store, log::Sink& sink)
    : store_(store), sink_(sink) {}

fs::path Cleaner::backup_path_for(const fs::path& file) {
    auto base = file.parent_path() /
        backup_file_name(file.filename().string(), std::chrono::system_clock::now());
    if (!store_.exists(base)) return base;

    // Same microsecond: disambiguate with a counter
    for (int n = 1;; ++n) {
        fs::path candidate = base.string() + "-" + std::to_string(n);
        if (!store_.exists(candidate)) return candidate;
    }
}

// Best effort: a failure here is logged and never fails the file.
void Cleaner::restore_stats(const fs::path& path, const FileStats& stats) {
    try {
        auto mode = store_.chmod(path, stats.mode);
        auto times = store_.set_times(path, stats.atime_ns, stats.mtime_ns);
        if (mode.is_err() || times.is_err()) {
            const auto& err = mode.is_err() ? mode.error() : times.error();
            sink_.write(log::Warn, log::format("Failed to restore file stats for %s: %s",
                path.c_str(), describe(err).c_str()));
        }
    } catch (const std::exception& e) {
        sink_.write(log::Warn, log::format("Failed to restore file stats for %s: %s",
            path.c_str(), e.what()));
    }
}

// Best effort, like restore_stats.
void Cleaner::discard_backup(const fs::path& backup_path) {
    try {
        auto st = store_.remove(backup_path);
        if (st.is_err()) {
            sink_.write(log::Warn, log::format("Failed to remove backup %s: %s",
                backup_path.c_str(), describe(st.error()).c_str()));
        }
    } catch (const std::exception& e) {
        sink_.write(log::Warn, log::format("Failed to remove backup %s: %s",
            backup_path.c_str(), e.what()));
    }
}

Result<Cleaner::CleanedFile> Cleaner::clean_file(const FileComments& group,
                                                 const CleanOptions& options,
                                                 const fs::path& root) {
    CleanedFile cleaned;
    cleaned.file_path = group.file_path;
    cleaned.abs_path = (root / group.file_path).lexically_normal();
    const auto& path = cleaned.abs_path;

    auto stats = store_.stat(path);
    if (stats.is_err()) {
        return GcError{GcError::File,
            "failed to get file stats for " + group.file_path}
            .caused_by(describe(stats.error()));
    }
    cleaned.original_stats = stats.value();

    if (options.create_backups && !options.dry_run) {
        auto backup = backup_path_for(path);
        auto st = store_.copy(path, backup);
        if (st.is_err()) {
            return GcError{GcError::File,
                "failed to create backup for " + group.file_path}
                .caused_by(describe(st.error()));
        }
        cleaned.backup_path = backup;
    }

    auto text = store_.read(path);
    if (text.is_err()) {
        if (!cleaned.backup_path.empty()) discard_backup(cleaned.backup_path);
        return GcError{GcError::File, "failed to read " + group.file_path}
            .caused_by(describe(text.error()));
    }

    auto lines = split_lines(text.value());
    std::set<size_t> to_remove;

    // Verify every comment before touching the file
    for (const auto& c : group.comments) {
        long index = static_cast<long>(c.line_number) - 1;
        if (index < 0 || index >= static_cast<long>(lines.size())) {
            if (!cleaned.backup_path.empty()) discard_backup(cleaned.backup_path);
            return GcError{GcError::File,
                "Comment line " + std::to_string(c.line_number) +
                " is out of range in " + group.file_path +
                " (file has " + std::to_string(lines.size()) + " lines)",
                "", group.file_path, c.line_number};
        }
        const auto& actual = lines[static_cast<size_t>(index)];
        if (actual != c.original_line) {
            if (!cleaned.backup_path.empty()) discard_backup(cleaned.backup_path);
            return GcError{GcError::File,
                "Line " + std::to_string(c.line_number) + " in " + group.file_path +
                " has changed since scanning. Expected: \"" + c.original_line +
                "\", Found: \"" + actual + "\"",
                "re-run the scan before cleaning", group.file_path, c.line_number};
        }
        to_remove.insert(static_cast<size_t>(index));
    }
    cleaned.comments_removed = to_remove.size();

    if (options.dry_run) {
        sink_.write(log::Info, log::format("[dry-run] would remove %zu line(s) from %s",
            cleaned.comments_removed, group.file_path.c_str()));
        return Result<CleanedFile>::ok(std::move(cleaned));
    }

    auto st = store_.write(path, join_lines(lines, to_remove));
    if (st.is_err()) {
        return GcError{GcError::File, "failed to write " + group.file_path}
            .caused_by(describe(st.error()));
    }
    restore_stats(path, cleaned.original_stats);

    sink_.write(log::Debug, log::format("removed %zu line(s) from %s",
        cleaned.comments_removed, group.file_path.c_str()));
    return Result<CleanedFile>::ok(std::move(cleaned));
}

void Cleaner::rollback(const std::vector<CleanedFile>& cleaned, CleanResult& result) {
    sink_.write(log::Warn, "Errors occurred during cleaning. Restoring files from backups...");

    for (const auto& f : cleaned) {
        if (f.backup_path.empty()) {
            sink_.write(log::Warn, log::format("No backup for %s; it stays cleaned",
                f.file_path.c_str()));
            continue;
        }
        Status st = ok_status();
        try {
            st = store_.copy(f.backup_path, f.abs_path);
        } catch (const std::exception& e) {
            st = GcError{GcError::File, "copy failed"}.caused_by(e.what());
        }
        if (st.is_err()) {
            sink_.write(log::Error, log::format("Failed to restore %s from backup %s: %s",
                f.file_path.c_str(), f.backup_path.c_str(), describe(st.error()).c_str()));
            continue;
        }
        restore_stats(f.abs_path, f.original_stats);
        result.restored_files.push_back(f.file_path);
        sink_.write(log::Info, log::format("Restored %s from backup", f.file_path.c_str()));
    }
}

Result<CleanResult> Cleaner::remove_comments(const std::vector<GhostComment>& comments,
                                             const CleanOptions& options,
                                             const fs::path& working_dir) {
    CleanResult result;
    if (comments.empty()) {
        return Result<CleanResult>::ok(std::move(result));
    }

    if (options.restore_on_error && !options.create_backups && !options.dry_run) {
        sink_.write(log::Warn,
            "restore-on-error is set without backups; cleaned files cannot be rolled back");
    }

    auto resolved = resolve_working_dir(working_dir);
    GC_TRY(resolved);
    const auto& root = resolved.value();
    auto groups = group_by_file(comments);
    std::vector<CleanedFile> cleaned;

    try {
        for (const auto& group : groups) {
            Result<CleanedFile> r = GcError{GcError::File, ""};
            try {
                r = clean_file(group, options, root);
            } catch (const std::exception& e) {
                r = GcError{GcError::File, "Failed to clean file " + group.file_path}
                    .caused_by(e.what());
            }

            if (r.is_ok()) {
                result.comments_removed += r.value().comments_removed;
                cleaned.push_back(std::move(r).value());
            } else {
                sink_.write(log::Error, log::format("Error cleaning %s: %s",
                    group.file_path.c_str(), describe(r.error()).c_str()));
                result.error_files.push_back(group.file_path);
                result.failures.push_back(FileFailure{group.file_path, std::move(r).error()});
            }
        }

        bool failed = !result.error_files.empty();

        if (failed && options.restore_on_error && !options.dry_run) {
            rollback(cleaned, result);
            result.comments_removed = 0;
        }

        if (!failed && options.remove_backups && !options.dry_run) {
            for (const auto& f : cleaned) {
                if (!f.backup_path.empty()) discard_backup(f.backup_path);
            }
        }
    } catch (const std::exception& e) {
        if (options.restore_on_error && !options.dry_run) {
            rollback(cleaned, result);
        }
        return GcError{GcError::File, "failed to remove ghost comments"}.caused_by(e.what());
    }

    result.files_processed = groups.size();
    for (const auto& f : cleaned) {
        result.modified_files.push_back(f.file_path);
    }
    result.has_errors = !result.error_files.empty();
    return Result<CleanResult>::ok(std::move(result));
}

ValidationResult Cleaner::validate_for_cleaning(const std::vector<GhostComment>& comments,
                                                const fs::path& working_dir) {
    ValidationResult out;
    if (comments.empty()) return out;

    auto resolved = resolve_working_dir(working_dir);
    if (resolved.is_err()) {
        out.valid = false;
        out.errors.push_back("Validation error: " + describe(resolved.error()));
        return out;
    }
    const auto& root = resolved.value();

    try {
        for (const auto& group : group_by_file(comments)) {
            auto path = (root / group.file_path).lexically_normal();

            auto access = store_.access(path, true, true);
            if (access.is_err()) {
                out.errors.push_back(group.file_path + " - File access error: " +
                                     describe(access.error()));
                continue;
            }
            auto text = store_.read(path);
            if (text.is_err()) {
                out.errors.push_back(group.file_path + " - File access error: " +
                                     describe(text.error()));
                continue;
            }

            auto lines = split_lines(text.value());
            for (const auto& c : group.comments) {
                std::string where = group.file_path + ":" + std::to_string(c.line_number);
                long index = static_cast<long>(c.line_number) - 1;
                if (index < 0 || index >= static_cast<long>(lines.size())) {
                    out.errors.push_back(where + " - Line number out of range (file has " +
                                         std::to_string(lines.size()) + " lines)");
                    continue;
                }
                if (lines[static_cast<size_t>(index)] != c.original_line) {
                    out.errors.push_back(where + " - Line content has changed since scanning");
                }
            }
        }
    } catch (const std::exception& e) {
        out.errors.push_back(std::string("Validation error: ") + e.what());
    }

    out.valid = out.errors.empty();
    return out;
}

} // namespace ghostcomment
