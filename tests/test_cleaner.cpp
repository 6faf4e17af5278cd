#include <catch2/catch.hpp>
#include <ghostcomment/cleaner.hpp>
#include <ghostcomment/scanner.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace ghostcomment;
namespace fs = std::filesystem;

// RAII temp directory
struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("gc_clean_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    fs::path write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full, std::ios::binary);
        f << content;
        return full;
    }

    std::string read_file(const std::string& rel) const {
        std::ifstream f(path / rel, std::ios::binary);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    std::vector<std::string> backups(const std::string& dir = "src") const {
        std::vector<std::string> out;
        for (const auto& e : fs::directory_iterator(path / dir)) {
            auto name = e.path().filename().string();
            if (name.find(".ghostcomment-backup-") != std::string::npos) out.push_back(name);
        }
        return out;
    }
};

struct CaptureSink : log::Sink {
    std::vector<std::pair<log::Level, std::string>> events;

    void write(log::Level lvl, const std::string& msg) override {
        events.emplace_back(lvl, msg);
    }

    bool has(log::Level lvl, const std::string& needle) const {
        for (const auto& e : events) {
            if (e.first == lvl && e.second.find(needle) != std::string::npos) return true;
        }
        return false;
    }
};

// Disk store that records mutating calls
struct RecordingStore : DiskFileStore {
    std::vector<std::pair<std::string, std::string>> copies;
    int writes = 0;
    std::string throw_on_read;   // path suffix that makes read() throw
    bool throw_on_remove = false;
    bool throw_on_chmod = false;

    Status copy(const fs::path& from, const fs::path& to) override {
        copies.emplace_back(from.string(), to.string());
        return DiskFileStore::copy(from, to);
    }

    Status write(const fs::path& path, const std::string& content) override {
        ++writes;
        return DiskFileStore::write(path, content);
    }

    Result<std::string> read(const fs::path& path) override {
        if (!throw_on_read.empty() && path.string().find(throw_on_read) != std::string::npos) {
            throw std::runtime_error("simulated I/O fault");
        }
        return DiskFileStore::read(path);
    }

    Status remove(const fs::path& path) override {
        if (throw_on_remove) throw std::runtime_error("unlink fault");
        return DiskFileStore::remove(path);
    }

    Status chmod(const fs::path& path, std::uint32_t mode) override {
        if (throw_on_chmod) throw std::runtime_error("chmod fault");
        return DiskFileStore::chmod(path, mode);
    }
};

// Sink whose first error-level write throws
struct FaultySink : CaptureSink {
    bool armed = true;

    void write(log::Level lvl, const std::string& msg) override {
        CaptureSink::write(lvl, msg);
        if (armed && lvl == log::Error) {
            armed = false;
            throw std::runtime_error("sink fault");
        }
    }
};

// Switch the process working directory for one test
struct ScopedCwd {
    fs::path saved;

    explicit ScopedCwd(const fs::path& dir) : saved(fs::current_path()) {
        fs::current_path(dir);
    }

    ~ScopedCwd() {
        std::error_code ec;
        fs::current_path(saved, ec);
    }
};

static GhostComment marker(const std::string& file, int line, const std::string& text) {
    GhostComment c;
    c.file_path = file;
    c.line_number = line;
    c.content = text;
    c.prefix = "//_gc_";
    c.original_line = "  //_gc_ " + text;
    return c;
}

static const char* kFile1 =
    "function a() {\n"
    "  //_gc_ Comment in file 1\n"
    "  return 1;\n"
    "}\n";

static const char* kFile2 =
    "function b() {\n"
    "  const x = 2;\n"
    "  //_gc_ Comment in file 2\n"
    "  return x;\n"
    "}\n";

static CleanOptions no_backup_options() {
    CleanOptions o;
    o.create_backups = false;
    o.restore_on_error = false;
    return o;
}

// ===== Backup naming =====

TEST_CASE("backup_file_name uses a dashed UTC timestamp", "[cleaner]") {
    auto when = std::chrono::system_clock::time_point(
        std::chrono::seconds(1672531200) + std::chrono::microseconds(123456));
    REQUIRE(backup_file_name("app.ts", when) ==
            ".app.ts.ghostcomment-backup-2023-01-01T00-00-00-123456Z");
}

TEST_CASE("backup_path_for adds a counter on collision", "[cleaner]") {
    struct CollidingStore : DiskFileStore {
        int collisions = 2;
        bool exists(const fs::path&) override {
            if (collisions > 0) {
                --collisions;
                return true;
            }
            return false;
        }
    };

    CollidingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);
    auto p = cleaner.backup_path_for("/work/src/app.ts");
    REQUIRE(p.parent_path() == fs::path("/work/src"));
    auto name = p.filename().string();
    REQUIRE(name.rfind(".app.ts.ghostcomment-backup-", 0) == 0);
    REQUIRE(name.substr(name.size() - 2) == "-2");
}

// ===== remove_comments =====

TEST_CASE("empty input yields a zero result", "[cleaner]") {
    TempDir td;
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({}, CleanOptions{}, td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files_processed == 0);
    REQUIRE(r.value().comments_removed == 0);
    REQUIRE_FALSE(r.value().has_errors);
    REQUIRE(store.copies.empty());
}

TEST_CASE("removes a marked line and keeps the rest", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                     no_backup_options(), td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files_processed == 1);
    REQUIRE(r.value().comments_removed == 1);
    REQUIRE_FALSE(r.value().has_errors);
    REQUIRE(r.value().modified_files == std::vector<std::string>{"src/file1.ts"});
    REQUIRE(td.read_file("src/file1.ts") == "function a() {\n  return 1;\n}\n");
}

TEST_CASE("removes several lines from one file", "[cleaner]") {
    TempDir td;
    td.write_file("src/multi.ts",
        "a\n  //_gc_ First comment\nb\n  //_gc_ Second comment\nc");
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({
        marker("src/multi.ts", 2, "First comment"),
        marker("src/multi.ts", 4, "Second comment"),
    }, no_backup_options(), td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files_processed == 1);
    REQUIRE(r.value().comments_removed == 2);
    REQUIRE(td.read_file("src/multi.ts") == "a\nb\nc");
}

TEST_CASE("creates a sibling backup holding the original content", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                     opts, td.path);
    REQUIRE(r.is_ok());
    REQUIRE(store.copies.size() == 1);

    auto names = td.backups();
    REQUIRE(names.size() == 1);
    REQUIRE(names[0].rfind(".file1.ts.ghostcomment-backup-", 0) == 0);
    REQUIRE(td.read_file("src/" + names[0]) == kFile1);
}

TEST_CASE("remove_backups deletes backups after a clean batch", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    opts.remove_backups = true;
    auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                     opts, td.path);
    REQUIRE(r.is_ok());
    REQUIRE(store.copies.size() == 1);
    REQUIRE(td.backups().empty());
}

TEST_CASE("file mode and mtime survive the rewrite", "[cleaner]") {
    TempDir td;
    auto p = td.write_file("src/file1.ts", kFile1);
    fs::permissions(p, fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read);
    auto old_time = fs::last_write_time(p) - std::chrono::hours(48);
    fs::last_write_time(p, old_time);

    DiskFileStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);
    auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                     no_backup_options(), td.path);
    REQUIRE(r.is_ok());
    REQUIRE(fs::status(p).permissions() ==
            (fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read));
    REQUIRE(fs::last_write_time(p) == old_time);
}

TEST_CASE("scan, clean, re-scan leaves no ghost comments", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);

    GlobEnumerator en;
    DiskFileStore store;
    CaptureSink sink;
    Scanner scanner(en, store, sink);
    Cleaner cleaner(store, sink);

    auto cfg = ScanConfig::defaults();
    auto found = scanner.scan(cfg, td.path);
    REQUIRE(found.is_ok());
    REQUIRE(found.value().size() == 2);

    CleanOptions opts;
    opts.remove_backups = true;
    auto r = cleaner.remove_comments(found.value(), opts, td.path);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_errors);
    REQUIRE(r.value().files_processed == 2);
    REQUIRE(r.value().comments_removed == found.value().size());

    auto again = scanner.scan(cfg, td.path);
    REQUIRE(again.is_ok());
    REQUIRE(again.value().empty());
}

// ===== Verification failures =====

TEST_CASE("drift between scan and clean is a FILE_ERROR", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto comment = marker("src/file1.ts", 2, "Comment in file 1");
    std::string edited = "function a() {\n  //_gc_ Comment edited later\n  return 1;\n}\n";
    td.write_file("src/file1.ts", edited);

    auto r = cleaner.remove_comments({comment}, CleanOptions{}, td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_errors);
    REQUIRE(r.value().error_files == std::vector<std::string>{"src/file1.ts"});
    REQUIRE(r.value().failures.size() == 1);

    const auto& err = r.value().failures[0].error;
    REQUIRE(err.code == GcError::File);
    REQUIRE(err.message.find("has changed since scanning") != std::string::npos);
    REQUIRE(err.message.find("Expected: \"  //_gc_ Comment in file 1\"") != std::string::npos);
    REQUIRE(err.message.find("Found: \"  //_gc_ Comment edited later\"") != std::string::npos);

    REQUIRE(store.writes == 0);
    REQUIRE(td.read_file("src/file1.ts") == edited);
    REQUIRE(td.backups().empty());
}

TEST_CASE("drift on a middle comment names that line", "[cleaner]") {
    TempDir td;
    td.write_file("src/three.ts",
        "  //_gc_ one\nx\n  //_gc_ two\ny\n  //_gc_ three\n");
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto two = marker("src/three.ts", 3, "two");
    two.original_line = "  //_gc_ two (old)";
    auto r = cleaner.remove_comments({
        marker("src/three.ts", 1, "one"),
        two,
        marker("src/three.ts", 5, "three"),
    }, no_backup_options(), td.path);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_errors);
    REQUIRE(r.value().failures[0].error.line == 3);
    REQUIRE(r.value().failures[0].error.message.find("Line 3 in src/three.ts") != std::string::npos);
    REQUIRE(store.writes == 0);
}

TEST_CASE("line number past the end is out of range", "[cleaner]") {
    TempDir td;
    td.write_file("src/short.ts", "a\nb\nc");
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({marker("src/short.ts", 100, "gone")},
                                     no_backup_options(), td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_errors);
    const auto& err = r.value().failures[0].error;
    REQUIRE(err.code == GcError::File);
    REQUIRE(err.message.find("out of range") != std::string::npos);
    REQUIRE(err.message.find("file has 3 lines") != std::string::npos);
    REQUIRE(sink.has(log::Error, "src/short.ts"));
}

TEST_CASE("missing file fails its group only", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({
        marker("src/gone.ts", 1, "x"),
        marker("src/file1.ts", 2, "Comment in file 1"),
    }, no_backup_options(), td.path);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().files_processed == 2);
    REQUIRE(r.value().error_files == std::vector<std::string>{"src/gone.ts"});
    REQUIRE(r.value().modified_files == std::vector<std::string>{"src/file1.ts"});
    REQUIRE(r.value().comments_removed == 1);
    REQUIRE(r.value().failures[0].error.message.find("failed to get file stats") != std::string::npos);
}

// ===== Rollback =====

TEST_CASE("failure in a later file rolls back earlier files from backup", "[cleaner]") {
    TempDir td;
    auto p1 = td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    fs::permissions(p1, fs::perms::owner_read | fs::perms::owner_write | fs::perms::others_read);
    auto perms_before = fs::status(p1).permissions();

    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    opts.restore_on_error = true;
    auto r = cleaner.remove_comments({
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 99, "Comment in file 2"),
    }, opts, td.path);

    REQUIRE(r.is_ok());
    const auto& res = r.value();
    REQUIRE(res.has_errors);
    REQUIRE(res.error_files.size() == 1);
    REQUIRE(res.error_files[0] == "src/file2.ts");
    REQUIRE(res.comments_removed == 0);
    REQUIRE(res.restored_files == std::vector<std::string>{"src/file1.ts"});

    REQUIRE(td.read_file("src/file1.ts") == kFile1);
    REQUIRE(td.read_file("src/file2.ts") == kFile2);
    REQUIRE(fs::status(p1).permissions() == perms_before);

    // backup of file1, backup of file2 (discarded), then the restore copy
    REQUIRE(store.copies.size() == 3);
    const auto& restore = store.copies.back();
    REQUIRE(restore.first.find(".file1.ts.ghostcomment-backup-") != std::string::npos);
    REQUIRE(fs::path(restore.second) == (td.path / "src/file1.ts").lexically_normal());
    REQUIRE(sink.has(log::Info, "Restored src/file1.ts from backup"));
}

TEST_CASE("rollback without backups leaves cleaned files as they are", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = false;
    opts.restore_on_error = true;
    auto r = cleaner.remove_comments({
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 99, "Comment in file 2"),
    }, opts, td.path);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_errors);
    REQUIRE(r.value().restored_files.empty());
    REQUIRE(store.copies.empty());
    REQUIRE(td.read_file("src/file1.ts") == "function a() {\n  return 1;\n}\n");
    REQUIRE(sink.has(log::Warn, "without backups"));
}

TEST_CASE("restore_on_error off keeps partial results", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    opts.restore_on_error = false;
    opts.remove_backups = true;
    auto r = cleaner.remove_comments({
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 99, "Comment in file 2"),
    }, opts, td.path);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_errors);
    REQUIRE(r.value().comments_removed == 1);
    REQUIRE(td.read_file("src/file1.ts") == "function a() {\n  return 1;\n}\n");
    // batch had errors, so the backup of file1 is kept
    REQUIRE(td.backups().size() == 1);
}

TEST_CASE("exception from the store fails that file and the batch goes on", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    RecordingStore store;
    store.throw_on_read = "file1.ts";
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto r = cleaner.remove_comments({
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 3, "Comment in file 2"),
    }, no_backup_options(), td.path);

    REQUIRE(r.is_ok());
    REQUIRE(r.value().error_files == std::vector<std::string>{"src/file1.ts"});
    REQUIRE(r.value().failures[0].error.cause == "simulated I/O fault");
    REQUIRE(r.value().modified_files == std::vector<std::string>{"src/file2.ts"});
}

TEST_CASE("throwing backup removal is only a warning", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    store.throw_on_remove = true;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    opts.remove_backups = true;
    opts.restore_on_error = true;
    auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                     opts, td.path);

    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_errors);
    REQUIRE(r.value().comments_removed == 1);
    REQUIRE(r.value().restored_files.empty());
    REQUIRE(td.read_file("src/file1.ts").find("//_gc_") == std::string::npos);
    REQUIRE(td.backups().size() == 1);
    REQUIRE(sink.has(log::Warn, "Failed to remove backup"));
}

TEST_CASE("throwing stat restore keeps the file cleaned and rollback-eligible", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    RecordingStore store;
    store.throw_on_chmod = true;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    SECTION("single file succeeds with a warning") {
        auto r = cleaner.remove_comments({marker("src/file1.ts", 2, "Comment in file 1")},
                                         no_backup_options(), td.path);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.value().has_errors);
        REQUIRE(r.value().modified_files == std::vector<std::string>{"src/file1.ts"});
        REQUIRE(sink.has(log::Warn, "Failed to restore file stats for"));
    }

    SECTION("later failure still restores it from backup") {
        CleanOptions opts;
        opts.create_backups = true;
        opts.restore_on_error = true;
        auto r = cleaner.remove_comments({
            marker("src/file1.ts", 2, "Comment in file 1"),
            marker("src/file2.ts", 99, "Comment in file 2"),
        }, opts, td.path);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().restored_files == std::vector<std::string>{"src/file1.ts"});
        REQUIRE(td.read_file("src/file1.ts") == kFile1);
    }
}

TEST_CASE("fault outside a file transaction rolls back and fails the batch", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    RecordingStore store;
    FaultySink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.create_backups = true;
    opts.restore_on_error = true;
    auto r = cleaner.remove_comments({
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 3, "stale text"),
    }, opts, td.path);

    REQUIRE(r.is_err());
    REQUIRE(r.error().code == GcError::File);
    REQUIRE(r.error().message == "failed to remove ghost comments");
    REQUIRE(r.error().cause == "sink fault");
    REQUIRE(td.read_file("src/file1.ts") == kFile1);
    REQUIRE(td.read_file("src/file2.ts") == kFile2);
    REQUIRE(sink.has(log::Info, "Restored src/file1.ts from backup"));
}

TEST_CASE("empty working directory resolves to the current directory", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    DiskFileStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);
    ScopedCwd cwd(td.path);

    std::vector<GhostComment> comments = {marker("src/file1.ts", 2, "Comment in file 1")};
    auto v = cleaner.validate_for_cleaning(comments, "");
    REQUIRE(v.valid);

    auto r = cleaner.remove_comments(comments, no_backup_options(), "");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().comments_removed == 1);
    REQUIRE(td.read_file("src/file1.ts").find("//_gc_") == std::string::npos);
}

// ===== Dry run =====

TEST_CASE("dry run reports the same counts without writing", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    td.write_file("src/file2.ts", kFile2);
    std::vector<GhostComment> comments = {
        marker("src/file1.ts", 2, "Comment in file 1"),
        marker("src/file2.ts", 3, "Comment in file 2"),
    };

    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    CleanOptions opts;
    opts.dry_run = true;
    auto dry = cleaner.remove_comments(comments, opts, td.path);
    REQUIRE(dry.is_ok());
    REQUIRE(dry.value().files_processed == 2);
    REQUIRE(dry.value().comments_removed == 2);
    REQUIRE(store.writes == 0);
    REQUIRE(store.copies.empty());
    REQUIRE(td.read_file("src/file1.ts") == kFile1);
    REQUIRE(td.backups().empty());

    auto real = cleaner.remove_comments(comments, no_backup_options(), td.path);
    REQUIRE(real.is_ok());
    REQUIRE(real.value().files_processed == dry.value().files_processed);
    REQUIRE(real.value().comments_removed == dry.value().comments_removed);
    REQUIRE(store.writes == 2);
}

// ===== validate_for_cleaning =====

TEST_CASE("validate_for_cleaning accepts untouched files", "[cleaner]") {
    TempDir td;
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto v = cleaner.validate_for_cleaning({marker("src/file1.ts", 2, "Comment in file 1")},
                                           td.path);
    REQUIRE(v.valid);
    REQUIRE(v.errors.empty());
    REQUIRE(cleaner.validate_for_cleaning({}, td.path).valid);
}

TEST_CASE("validate_for_cleaning aggregates every problem", "[cleaner]") {
    TempDir td;
    td.write_file("src/short.ts", "a\nb\nc");
    td.write_file("src/file1.ts", kFile1);
    RecordingStore store;
    CaptureSink sink;
    Cleaner cleaner(store, sink);

    auto drifted = marker("src/file1.ts", 2, "Comment in file 1");
    drifted.original_line = "  //_gc_ older text";

    auto v = cleaner.validate_for_cleaning({
        marker("src/missing.ts", 1, "x"),
        marker("src/short.ts", 100, "y"),
        drifted,
    }, td.path);

    REQUIRE_FALSE(v.valid);
    REQUIRE(v.errors.size() == 3);
    REQUIRE(v.errors[0].find("src/missing.ts - File access error") == 0);
    REQUIRE(v.errors[1] == "src/short.ts:100 - Line number out of range (file has 3 lines)");
    REQUIRE(v.errors[2] == "src/file1.ts:2 - Line content has changed since scanning");
    REQUIRE(store.writes == 0);
    REQUIRE(store.copies.empty());
}
