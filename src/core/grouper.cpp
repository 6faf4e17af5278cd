#include <ghostcomment/grouper.hpp>
#include <algorithm>
#include <unordered_map>

namespace ghostcomment {

std::vector<FileComments> group_by_file(const std::vector<GhostComment>& comments) {
    std::vector<FileComments> groups;
    std::unordered_map<std::string, size_t> index;

    for (const auto& c : comments) {
        auto it = index.find(c.file_path);
        if (it == index.end()) {
            index.emplace(c.file_path, groups.size());
            groups.push_back(FileComments{c.file_path, {c}});
        } else {
            groups[it->second].comments.push_back(c);
        }
    }

    for (auto& g : groups) {
        std::stable_sort(g.comments.begin(), g.comments.end(),
            [](const GhostComment& a, const GhostComment& b) {
                return a.line_number > b.line_number;
            });
    }
    return groups;
}

} // namespace ghostcomment
