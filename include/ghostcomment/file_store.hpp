#pragma once

#include <ghostcomment/result.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace ghostcomment {

struct FileStats {
    std::uint64_t size = 0;
    std::uint32_t mode = 0;     // permission bits as reported by stat(2)
    std::int64_t atime_ns = 0;  // nanoseconds since the epoch
    std::int64_t mtime_ns = 0;
};

// Byte-level filesystem capability used by the scanner and cleaner.
// Every operation reports failure as a FILE_ERROR naming the path.
class FileStore {
public:
    virtual ~FileStore() = default;

    virtual Result<std::string> read(const std::filesystem::path& path) = 0;

    // Stream the file one line at a time (split on '\n', terminator dropped).
    virtual Status for_each_line(const std::filesystem::path& path,
                                 const std::function<void(const std::string&)>& fn) = 0;

    // Replace the file content in place (the inode and mode are kept)
    virtual Status write(const std::filesystem::path& path, const std::string& content) = 0;

    virtual Result<FileStats> stat(const std::filesystem::path& path) = 0;
    virtual bool exists(const std::filesystem::path& path) = 0;

    // Copy `from` over `to`, overwriting an existing destination
    virtual Status copy(const std::filesystem::path& from, const std::filesystem::path& to) = 0;
    virtual Status remove(const std::filesystem::path& path) = 0;

    virtual Status chmod(const std::filesystem::path& path, std::uint32_t mode) = 0;
    virtual Status set_times(const std::filesystem::path& path,
                             std::int64_t atime_ns, std::int64_t mtime_ns) = 0;

    // Succeeds when the file can be opened with the requested access
    virtual Status access(const std::filesystem::path& path, bool read, bool write) = 0;
};

// FileStore backed by the local disk (POSIX stat/chmod/utimensat).
class DiskFileStore : public FileStore {
public:
    Result<std::string> read(const std::filesystem::path& path) override;
    Status for_each_line(const std::filesystem::path& path,
                         const std::function<void(const std::string&)>& fn) override;
    Status write(const std::filesystem::path& path, const std::string& content) override;
    Result<FileStats> stat(const std::filesystem::path& path) override;
    bool exists(const std::filesystem::path& path) override;
    Status copy(const std::filesystem::path& from, const std::filesystem::path& to) override;
    Status remove(const std::filesystem::path& path) override;
    Status chmod(const std::filesystem::path& path, std::uint32_t mode) override;
    Status set_times(const std::filesystem::path& path,
                     std::int64_t atime_ns, std::int64_t mtime_ns) override;
    Status access(const std::filesystem::path& path, bool read, bool write) override;
};

// Absolute, normalized form of a working directory. An empty path means the
// current directory. Fails with FILE_ERROR instead of throwing.
Result<std::filesystem::path> resolve_working_dir(const std::filesystem::path& working_dir);

} // namespace ghostcomment
