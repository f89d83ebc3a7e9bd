#include "directory_iterator.hpp"

#include <algorithm>

namespace fsutils {

sorted_directory_iterator::sorted_directory_iterator(const std::filesystem::path& path, bool recursive)
    : sorted_directory_iterator(
          path, [](const dir_entry& a, const dir_entry& b) { return a.path() < b.path(); }, recursive) {}

sorted_directory_iterator::sorted_directory_iterator(
    const std::filesystem::path& path, compare_function compare, bool recursive)
    : _recursive(recursive) {
  // Read the root directory and maybe recursively read the subdirectories
  read_directory(path);

  // Sort the entries by path
  std::sort(_entries.begin(), _entries.end(), compare);
}

}  // namespace fsutils
