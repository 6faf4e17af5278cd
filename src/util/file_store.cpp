#include <ghostcomment/file_store.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace ghostcomment {

namespace fs = std::filesystem;

static GcError io_error(const std::string& what, const fs::path& path, int err) {
    return GcError(GcError::File, what + ": " + path.string())
        .caused_by(std::strerror(err));
}

static constexpr std::int64_t kNanosPerSecond = 1000000000;

static std::int64_t to_ns(const struct timespec& ts) {
    return static_cast<std::int64_t>(ts.tv_sec) * kNanosPerSecond + ts.tv_nsec;
}

static struct timespec from_ns(std::int64_t ns) {
    struct timespec ts;
    ts.tv_sec = static_cast<time_t>(ns / kNanosPerSecond);
    ts.tv_nsec = static_cast<long>(ns % kNanosPerSecond);
    if (ts.tv_nsec < 0) {
        ts.tv_nsec += kNanosPerSecond;
        ts.tv_sec -= 1;
    }
    return ts;
}

Result<std::string> DiskFileStore::read(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_error("cannot open file", path, errno);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return io_error("cannot read file", path, errno);
    }
    return Result<std::string>::ok(ss.str());
}

Status DiskFileStore::for_each_line(const fs::path& path,
                                    const std::function<void(const std::string&)>& fn) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_error("cannot open file", path, errno);
    }
    std::string line;
    while (std::getline(file, line)) {
        fn(line);
    }
    if (file.bad()) {
        return io_error("cannot read file", path, errno);
    }
    return ok_status();
}

Status DiskFileStore::write(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return io_error("cannot open file for writing", path, errno);
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        return io_error("cannot write file", path, errno);
    }
    return ok_status();
}

Result<FileStats> DiskFileStore::stat(const fs::path& path) {
    struct ::stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return io_error("cannot stat file", path, errno);
    }
    FileStats out;
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    out.atime_ns = to_ns(st.st_atim);
    out.mtime_ns = to_ns(st.st_mtim);
    return Result<FileStats>::ok(out);
}

bool DiskFileStore::exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

Status DiskFileStore::copy(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return GcError(GcError::File,
            "cannot copy " + from.string() + " to " + to.string())
            .caused_by(ec.message());
    }
    return ok_status();
}

Status DiskFileStore::remove(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        return GcError(GcError::File, "cannot remove file: " + path.string())
            .caused_by(ec ? ec.message() : "no such file");
    }
    return ok_status();
}

Status DiskFileStore::chmod(const fs::path& path, std::uint32_t mode) {
    if (::chmod(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        return io_error("cannot change mode of", path, errno);
    }
    return ok_status();
}

Status DiskFileStore::set_times(const fs::path& path,
                                std::int64_t atime_ns, std::int64_t mtime_ns) {
    struct timespec times[2] = {from_ns(atime_ns), from_ns(mtime_ns)};
    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
        return io_error("cannot set timestamps of", path, errno);
    }
    return ok_status();
}

Status DiskFileStore::access(const fs::path& path, bool read, bool write) {
    int mode = F_OK;
    if (read) mode |= R_OK;
    if (write) mode |= W_OK;
    if (::access(path.c_str(), mode) != 0) {
        return io_error("file not accessible", path, errno);
    }
    return ok_status();
}

Result<fs::path> resolve_working_dir(const fs::path& working_dir) {
    std::error_code ec;
    fs::path root = working_dir.empty() ? fs::current_path(ec)
                                        : fs::absolute(working_dir, ec);
    if (ec) {
        return GcError{GcError::File,
            "cannot resolve working directory '" + working_dir.string() + "'"}
            .caused_by(ec.message());
    }
    return Result<fs::path>::ok(root.lexically_normal());
}

} // namespace ghostcomment
