#include <ghostcomment/glob.hpp>
#include <algorithm>

namespace ghostcomment {

namespace fs = std::filesystem;

// ---- Helpers ----

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        // Collapse consecutive slashes
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    // Remove trailing slash (unless the entire string is "/")
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs;
    std::string cur;
    for (char c : s) {
        if (c == '/') {
            segs.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    segs.push_back(cur);
    return segs;
}

// Match a single segment against a pattern segment (no '/' in either).
// Supports *, ?, [abc], [a-z], [!...].
static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size() && si < str.size()) {
        char pc = pat[pi];

        if (pc == '*') {
            // '*' matches zero or more chars (not '/')
            pi++;
            // Consecutive stars in a single segment collapse
            while (pi < pat.size() && pat[pi] == '*') pi++;
            // If pattern exhausted, star matches rest of segment
            if (pi == pat.size()) return true;
            // Try advancing str position
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }

        if (pc == '?') {
            // Matches any single char
            pi++;
            si++;
            continue;
        }

        if (pc == '[') {
            // Character class
            pi++; // skip '['
            bool negate = false;
            if (pi < pat.size() && pat[pi] == '!') {
                negate = true;
                pi++;
            }
            bool matched = false;
            char sc = str[si];
            // Parse until ']'
            while (pi < pat.size() && pat[pi] != ']') {
                char lo = pat[pi];
                if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
                    char hi = pat[pi + 2];
                    if (sc >= lo && sc <= hi) matched = true;
                    pi += 3;
                } else {
                    if (sc == lo) matched = true;
                    pi++;
                }
            }
            if (pi < pat.size()) pi++; // skip ']'
            if (negate) matched = !matched;
            if (!matched) return false;
            si++;
            continue;
        }

        // Literal character
        if (pc != str[si]) return false;
        pi++;
        si++;
    }

    // Consume trailing stars in pattern
    while (pi < pat.size() && pat[pi] == '*') pi++;

    return pi == pat.size() && si == str.size();
}

// Recursive matching over path segments, handling '**'.
static bool match_segments(const std::vector<std::string>& pat_segs, size_t pi,
                           const std::vector<std::string>& path_segs, size_t si) {
    while (pi < pat_segs.size() && si < path_segs.size()) {
        const auto& ps = pat_segs[pi];

        if (ps == "**") {
            // Collapse consecutive '**' segments
            while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;
            // If pattern exhausted, '**' matches everything remaining
            if (pi == pat_segs.size()) return true;
            // Try matching remaining pattern from every remaining path position
            for (size_t k = si; k <= path_segs.size(); k++) {
                if (match_segments(pat_segs, pi, path_segs, k)) return true;
            }
            return false;
        }

        if (!match_segment(ps, 0, path_segs[si], 0)) return false;
        pi++;
        si++;
    }

    // Consume trailing '**' in pattern
    while (pi < pat_segs.size() && pat_segs[pi] == "**") pi++;

    return pi == pat_segs.size() && si == path_segs.size();
}

// Find the '}' closing the '{' at `open`, honoring nesting. npos if unbalanced.
static size_t find_closing_brace(const std::string& s, size_t open) {
    int depth = 0;
    for (size_t i = open; i < s.size(); i++) {
        if (s[i] == '{') depth++;
        else if (s[i] == '}') {
            depth--;
            if (depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Split the body of a brace group on top-level commas.
static std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> alts;
    std::string cur;
    int depth = 0;
    for (char c : body) {
        if (c == '{') depth++;
        if (c == '}') depth--;
        if (c == ',' && depth == 0) {
            alts.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    alts.push_back(cur);
    return alts;
}

static bool is_dot_path(const std::string& rel) {
    for (const auto& seg : split_segments(rel)) {
        if (!seg.empty() && seg[0] == '.') return true;
    }
    return false;
}

// Exclude patterns of the form "<dir-pattern>/**" prune whole directories.
static std::vector<std::string> prune_patterns(const std::vector<std::string>& patterns) {
    std::vector<std::string> out;
    for (const auto& pat : patterns) {
        std::string inner;
        if (!glob_is_negation(pat, inner)) continue;
        auto norm = normalize_path(inner);
        if (norm.size() > 3 && norm.compare(norm.size() - 3, 3, "/**") == 0) {
            out.push_back(norm.substr(0, norm.size() - 3));
        }
    }
    return out;
}

// ---- Public API ----

std::vector<std::string> glob_expand_braces(const std::string& pattern) {
    size_t open = pattern.find('{');
    if (open == std::string::npos) return {pattern};

    size_t close = find_closing_brace(pattern, open);
    if (close == std::string::npos) return {pattern};

    std::string head = pattern.substr(0, open);
    std::string body = pattern.substr(open + 1, close - open - 1);
    std::string tail = pattern.substr(close + 1);

    std::vector<std::string> out;
    for (const auto& alt : split_alternatives(body)) {
        // Re-expand: the alternative and the tail may hold further groups
        for (auto& expanded : glob_expand_braces(head + alt + tail)) {
            out.push_back(std::move(expanded));
        }
    }
    return out;
}

bool glob_match(const std::string& pattern, const std::string& path) {
    auto norm_path = normalize_path(path);
    auto path_segs = split_segments(norm_path);

    for (const auto& alt : glob_expand_braces(pattern)) {
        auto pat_segs = split_segments(normalize_path(alt));
        if (match_segments(pat_segs, 0, path_segs, 0)) return true;
    }
    return false;
}

bool glob_is_negation(const std::string& pattern, std::string& inner) {
    if (!pattern.empty() && pattern[0] == '!') {
        inner = pattern.substr(1);
        return true;
    }
    return false;
}

std::vector<std::string> glob_filter(
    const std::vector<std::string>& patterns,
    const std::vector<std::string>& paths)
{
    std::vector<std::string> result;

    for (const auto& path : paths) {
        bool included = false;
        // Process patterns in order; last matching pattern wins
        for (const auto& pat : patterns) {
            std::string inner;
            if (glob_is_negation(pat, inner)) {
                // Exclude pattern
                if (glob_match(inner, path)) {
                    included = false;
                }
            } else {
                // Include pattern
                if (glob_match(pat, path)) {
                    included = true;
                }
            }
        }
        if (included) {
            result.push_back(path);
        }
    }

    return result;
}

Result<std::vector<std::string>> glob_expand(
    const std::vector<std::string>& patterns,
    const fs::path& root_dir,
    const GlobOptions& opts)
{
    std::error_code ec;
    if (!fs::is_directory(root_dir, ec)) {
        return GcError(GcError::File,
            "glob_expand: root directory does not exist: " + root_dir.string());
    }

    auto prunes = prune_patterns(patterns);
    std::vector<std::string> candidates;

    fs::recursive_directory_iterator it(root_dir,
        fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return GcError(GcError::File,
            "glob_expand: cannot open directory: " + root_dir.string())
            .caused_by(ec.message());
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            return GcError(GcError::File,
                "glob_expand: error iterating directory: " + root_dir.string())
                .caused_by(ec.message());
        }

        // Path relative to root_dir, '/' separated
        auto rel = fs::relative(it->path(), root_dir, ec);
        if (ec) {
            ec.clear();
            continue;
        }
        auto rel_str = normalize_path(rel.generic_string());

        if (!opts.dot && is_dot_path(rel_str)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }

        if (it->is_directory(ec)) {
            for (const auto& p : prunes) {
                if (glob_match(p, rel_str)) {
                    it.disable_recursion_pending();
                    break;
                }
            }
            continue;
        }

        if (!it->is_regular_file(ec)) continue;
        candidates.push_back(rel_str);
    }

    auto results = glob_filter(patterns, candidates);
    std::sort(results.begin(), results.end());
    results.erase(std::unique(results.begin(), results.end()), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace ghostcomment
