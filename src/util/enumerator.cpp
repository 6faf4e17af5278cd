#include <ghostcomment/enumerator.hpp>
#include <ghostcomment/glob.hpp>

namespace ghostcomment {

namespace fs = std::filesystem;

Result<std::vector<std::string>> GlobEnumerator::enumerate(
    const std::vector<std::string>& include,
    const std::vector<std::string>& exclude,
    const fs::path& root_dir)
{
    // Excludes go last so they win over any include (last match wins)
    std::vector<std::string> patterns = include;
    for (const auto& ex : exclude) {
        patterns.push_back("!" + ex);
    }

    GlobOptions opts;
    opts.dot = dot_;

    auto rel = glob_expand(patterns, root_dir, opts);
    GC_TRY(rel);

    std::vector<std::string> out;
    out.reserve(rel.value().size());
    for (const auto& p : rel.value()) {
        out.push_back((root_dir / p).lexically_normal().string());
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

} // namespace ghostcomment
