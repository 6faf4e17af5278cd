#include <ghostcomment/comment.hpp>

namespace ghostcomment {

ScanConfig ScanConfig::defaults() {
    ScanConfig cfg;
    cfg.prefix = "//_gc_";
    cfg.include = {
        "**/*.{js,ts,tsx,jsx}",
        "**/*.py",
        "**/*.go",
        "**/*.rs",
        "**/*.{java,kt}",
        "**/*.swift",
        "**/*.rb",
        "**/*.php",
        "**/*.{c,cpp,cc,cxx,h,hpp}",
        "**/*.cs",
    };
    cfg.exclude = {
        "**/node_modules/**",
        "**/dist/**",
        "**/build/**",
        "**/.git/**",
        "**/coverage/**",
        "**/*.min.js",
        "**/*.bundle.js",
        "**/vendor/**",
        "**/target/**",
        "**/bin/**",
        "**/obj/**",
        "**/__pycache__/**",
        "**/*.pyc",
        "**/venv/**",
        "**/env/**",
    };
    cfg.fail_on_found = false;
    return cfg;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace ghostcomment
