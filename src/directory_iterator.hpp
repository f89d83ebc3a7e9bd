#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace fsutils {

// One entry found while walking a directory tree
class dir_entry {
 private:
  std::filesystem::path _path;
  std::filesystem::file_type _type = std::filesystem::file_type::none;

 public:
  dir_entry() = default;
  dir_entry(std::filesystem::path path, std::filesystem::file_type type) : _path(std::move(path)), _type(type) {}

  // Path as it is displayed, starting with the walk root
  const std::filesystem::path& path() const { return _path; }

  // Final path component
  std::string name() const { return _path.filename().string(); }

  std::filesystem::file_type type() const { return _type; }
  bool is_file() const { return _type == std::filesystem::file_type::regular; }
  bool is_directory() const { return _type == std::filesystem::file_type::directory; }
  bool is_symlink() const { return _type == std::filesystem::file_type::symlink; }
};

// Recursive directory iterator
// Reads the directory tree up front and sorts the entries by path. Symbolic
// links are reported but never followed. Directories that cannot be opened
// and entries that cannot be stat'ed are skipped.
class sorted_directory_iterator {
 public:
  using compare_function = std::function<bool(const dir_entry&, const dir_entry&)>;

 private:
  std::vector<dir_entry> _entries;

  // Decend into subdirectories
  bool _recursive = true;

  // Number of directories or entries that could not be read
  size_t _skipped = 0;

 public:
  explicit sorted_directory_iterator(const std::filesystem::path& path, bool recursive = true);

  explicit sorted_directory_iterator(const std::filesystem::path& path, compare_function compare,
                                     bool recursive = true);

  // begin and end functions
  std::vector<dir_entry>::const_iterator begin() const { return _entries.begin(); }
  std::vector<dir_entry>::const_iterator end() const { return _entries.end(); }

  size_t size() const { return _entries.size(); }
  size_t skipped() const { return _skipped; }

 private:
  void read_directory(const std::filesystem::path& path);
};

}  // namespace fsutils
