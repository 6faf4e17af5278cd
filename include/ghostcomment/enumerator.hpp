#pragma once

#include <ghostcomment/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace ghostcomment {

// Expands include/exclude glob patterns into candidate files.
class FileEnumerator {
public:
    virtual ~FileEnumerator() = default;

    // Returns absolute paths rooted at root_dir.
    virtual Result<std::vector<std::string>> enumerate(
        const std::vector<std::string>& include,
        const std::vector<std::string>& exclude,
        const std::filesystem::path& root_dir) = 0;
};

// Walks the directory tree with glob_expand. Dot-files are skipped unless
// `dot` is set.
class GlobEnumerator : public FileEnumerator {
public:
    explicit GlobEnumerator(bool dot = false) : dot_(dot) {}

    Result<std::vector<std::string>> enumerate(
        const std::vector<std::string>& include,
        const std::vector<std::string>& exclude,
        const std::filesystem::path& root_dir) override;

private:
    bool dot_;
};

} // namespace ghostcomment
