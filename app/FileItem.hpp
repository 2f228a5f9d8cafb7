// One row of a panel listing and the sort keys panels understand.
#pragma once

#include <cstdint>
#include <string>

namespace opendir {

enum class SortField { Name, Type, Size, Modified };
enum class SortOrder { Asc, Desc };

bool parseSortField(const std::string &text, SortField &out);
const char *sortFieldName(SortField field);
bool parseSortOrder(const std::string &text, SortOrder &out);
const char *sortOrderName(SortOrder order);

struct FileItem {
    std::string name;
    bool is_dir = false;
    bool is_symlink = false;
    std::uint64_t size = 0;
    std::int64_t modified = 0; // epoch seconds
    std::string permissions;   // "rwxr-xr-x"

    bool isParentLink() const { return name == ".."; }

    static FileItem parentLink() {
        FileItem item;
        item.name = "..";
        item.is_dir = true;
        return item;
    }
};

} // namespace opendir
