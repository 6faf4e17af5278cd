#pragma once

#include <ghostcomment/comment.hpp>
#include <string>
#include <vector>

namespace ghostcomment {

struct FileComments {
    std::string file_path;
    std::vector<GhostComment> comments;   // descending line_number
};

// Partition comments by file_path.
//
// Groups appear in order of each file's first occurrence in the input.
// Within a group comments are stably sorted by descending line number, so a
// caller deleting lines one at a time from the front of the list never shifts
// the index of a line it has yet to delete.
std::vector<FileComments> group_by_file(const std::vector<GhostComment>& comments);

} // namespace ghostcomment
