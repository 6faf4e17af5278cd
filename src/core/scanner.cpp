#include <ghostcomment/scanner.hpp>
#include <cctype>

namespace ghostcomment {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Config validation
// ---------------------------------------------------------------------------

static const char* const kCommentOpeners[] = {"//", "/*", "#", "--", ";", "%"};

bool is_valid_prefix(const std::string& prefix) {
    size_t body = 0;
    for (const char* opener : kCommentOpeners) {
        std::string op(opener);
        if (prefix.compare(0, op.size(), op) == 0) {
            body = op.size();
            break;
        }
    }
    if (body == 0) return false;

    for (size_t i = body; i < prefix.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(prefix[i]);
        if (!std::isalnum(c) && c != '_' && c != ':' && c != '@' &&
            c != '!' && c != '-') {
            return false;
        }
    }
    return true;
}

Status validate_scan_config(const ScanConfig& config) {
    if (config.prefix.empty()) {
        return GcError{GcError::Config, "prefix cannot be empty",
            "set 'prefix' to a comment marker such as \"//_gc_\""};
    }
    if (config.prefix.size() > limits::kMaxPrefixLength) {
        return GcError{GcError::Config,
            "prefix '" + config.prefix + "' is too long (" +
            std::to_string(config.prefix.size()) + " characters, max " +
            std::to_string(limits::kMaxPrefixLength) + ")"};
    }
    if (!is_valid_prefix(config.prefix)) {
        return GcError{GcError::Config,
            "invalid prefix '" + config.prefix + "'",
            "a prefix starts with //, /*, #, --, ; or % followed by [A-Za-z0-9_:@!-]"};
    }
    if (config.include.empty()) {
        return GcError{GcError::Config, "include patterns cannot be empty",
            "add at least one glob such as \"**/*.ts\""};
    }
    if (config.include.size() > limits::kMaxIncludePatterns) {
        return GcError{GcError::Config,
            "too many include patterns (" + std::to_string(config.include.size()) +
            ", max " + std::to_string(limits::kMaxIncludePatterns) + ")"};
    }
    if (config.exclude.size() > limits::kMaxExcludePatterns) {
        return GcError{GcError::Config,
            "too many exclude patterns (" + std::to_string(config.exclude.size()) +
            ", max " + std::to_string(limits::kMaxExcludePatterns) + ")"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Line extraction
// ---------------------------------------------------------------------------

static std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(start, end - start + 1);
}

bool extract_marker(const std::string& line, const std::string& prefix,
                    std::string& content) {
    auto pos = line.find(prefix);
    if (pos == std::string::npos) return false;
    content = trim(line.substr(pos + prefix.size()));
    return true;
}

static std::string relative_to(const fs::path& abs_path, const fs::path& root) {
    return abs_path.lexically_relative(root).generic_string();
}

// ---------------------------------------------------------------------------
// Scanner
// ---------------------------------------------------------------------------

Scanner::Scanner(FileEnumerator& enumerator, FileStore& store, log::Sink& sink)
    : enumerator_(enumerator), store_(store), sink_(sink) {}

Result<std::vector<std::string>> Scanner::candidates(const ScanConfig& config,
                                                     const fs::path& root) {
    auto files = enumerator_.enumerate(config.include, config.exclude, root);
    if (files.is_err()) {
        auto cause = files.error().format();
        return GcError{GcError::File,
            "failed to enumerate files under " + root.string()}.caused_by(cause);
    }

    if (files.value().size() > limits::kMaxFiles) {
        return GcError{GcError::File,
            "too many files to scan (" + std::to_string(files.value().size()) +
            ", limit " + std::to_string(limits::kMaxFiles) + ")",
            "narrow the include patterns or add exclude patterns"};
    }

    sink_.write(log::Debug, log::format("found %zu candidate files under %s",
        files.value().size(), root.c_str()));
    return files;
}

Status Scanner::check_size(const fs::path& path) {
    auto st = store_.stat(path);
    GC_TRY(st);
    if (st.value().size > limits::kMaxFileSize) {
        return GcError{GcError::File,
            "file too large (" + std::to_string(st.value().size) + " bytes, limit " +
            std::to_string(limits::kMaxFileSize) + ")", "", path.string(), 0};
    }
    return ok_status();
}

Status Scanner::scan_file(const fs::path& abs_path, const fs::path& root,
                          const std::string& prefix,
                          std::vector<GhostComment>& out) {
    GC_TRY(check_size(abs_path));

    auto text = store_.read(abs_path);
    GC_TRY(text);

    auto rel = relative_to(abs_path, root);
    auto lines = split_lines(text.value());
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string content;
        if (!extract_marker(lines[i], prefix, content)) continue;

        GhostComment gc;
        gc.file_path = rel;
        gc.line_number = static_cast<int>(i + 1);
        gc.content = std::move(content);
        gc.prefix = prefix;
        gc.original_line = lines[i];
        out.push_back(std::move(gc));
    }
    return ok_status();
}

Result<std::vector<GhostComment>> Scanner::scan(const ScanConfig& config,
                                                const fs::path& working_dir) {
    GC_TRY(validate_scan_config(config));

    auto resolved = resolve_working_dir(working_dir);
    GC_TRY(resolved);
    const auto& root = resolved.value();
    auto files = candidates(config, root);
    GC_TRY(files);

    std::vector<GhostComment> comments;
    for (const auto& file : files.value()) {
        auto st = scan_file(fs::path(file), root, config.prefix, comments);
        if (st.is_err()) {
            sink_.write(log::Warn, log::format("Failed to scan %s: %s",
                file.c_str(), st.error().message.c_str()));
        }
    }

    sink_.write(log::Debug, log::format("found %zu ghost comments", comments.size()));
    return Result<std::vector<GhostComment>>::ok(std::move(comments));
}

Result<std::vector<GhostComment>> Scanner::scan_single_file(
    const std::string& file_path,
    const ScanConfig& config,
    const fs::path& working_dir)
{
    GC_TRY(validate_scan_config(config));

    auto resolved = resolve_working_dir(working_dir);
    GC_TRY(resolved);
    const auto& root = resolved.value();
    fs::path p(file_path);
    auto abs_path = (p.is_absolute() ? p : root / p).lexically_normal();

    auto rel = abs_path.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return GcError{GcError::File,
            "file is outside the working directory: " + file_path,
            "working directory is " + root.string()};
    }

    std::vector<GhostComment> comments;
    auto st = scan_file(abs_path, root, config.prefix, comments);
    if (st.is_err()) {
        auto err = std::move(st).error();
        return GcError{GcError::File, "failed to scan " + file_path}
            .caused_by(err.message + (err.cause.empty() ? "" : ": " + err.cause));
    }
    return Result<std::vector<GhostComment>>::ok(std::move(comments));
}

Result<std::size_t> Scanner::count(const ScanConfig& config,
                                   const fs::path& working_dir) {
    GC_TRY(validate_scan_config(config));

    auto resolved = resolve_working_dir(working_dir);
    GC_TRY(resolved);
    const auto& root = resolved.value();
    auto files = candidates(config, root);
    GC_TRY(files);

    std::size_t total = 0;
    for (const auto& file : files.value()) {
        auto size_ok = check_size(fs::path(file));
        if (size_ok.is_err()) {
            sink_.write(log::Warn, log::format("Failed to scan %s: %s",
                file.c_str(), size_ok.error().message.c_str()));
            continue;
        }

        std::size_t in_file = 0;
        auto st = store_.for_each_line(fs::path(file), [&](const std::string& line) {
            if (line.find(config.prefix) != std::string::npos) ++in_file;
        });
        if (st.is_err()) {
            sink_.write(log::Warn, log::format("Failed to scan %s: %s",
                file.c_str(), st.error().message.c_str()));
            continue;
        }
        total += in_file;
    }
    return Result<std::size_t>::ok(total);
}

} // namespace ghostcomment
