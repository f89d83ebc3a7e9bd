#include "directory_iterator.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <memory>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

namespace fsutils {

namespace {

struct dir_closer {
  void operator()(DIR* dir) const { ::closedir(dir); }
};

using dir_handle = std::unique_ptr<DIR, dir_closer>;

std::filesystem::file_type file_type_of(mode_t mode) {
  switch (mode & S_IFMT) {
    case S_IFDIR:
      return std::filesystem::file_type::directory;
    case S_IFREG:
      return std::filesystem::file_type::regular;
    case S_IFLNK:
      return std::filesystem::file_type::symlink;
    case S_IFIFO:
      return std::filesystem::file_type::fifo;
    case S_IFSOCK:
      return std::filesystem::file_type::socket;
    case S_IFBLK:
      return std::filesystem::file_type::block;
    case S_IFCHR:
      return std::filesystem::file_type::character;
    default:
      return std::filesystem::file_type::unknown;
  }
}

}  // namespace

void sorted_directory_iterator::read_directory(const std::filesystem::path& path) {
  // Open the directory
  dir_handle dir(::opendir(path.c_str()));
  if (!dir) {
    int err = errno;
    log(log_level::debug) << "skipping directory " << path.string() << ": " << std::strerror(err);
    ++_skipped;
    return;
  }

  std::vector<std::filesystem::path> subdirs;

  // Iterate the directory
  const struct dirent* entry;
  while ((entry = ::readdir(dir.get())) != nullptr) {
    // Skip . and ..
    if (std::strcmp(entry->d_name, ".") == 0 || std::strcmp(entry->d_name, "..") == 0) {
      continue;
    }

    std::filesystem::path entry_path = path / entry->d_name;

    // Stat the entry without following symlinks
    struct stat st;
    if (::lstat(entry_path.c_str(), &st) != 0) {
      int err = errno;
      log(log_level::debug) << "skipping " << entry_path.string() << ": " << std::strerror(err);
      ++_skipped;
      continue;
    }

    std::filesystem::file_type type = file_type_of(st.st_mode);
    _entries.emplace_back(entry_path, type);

    if (_recursive && type == std::filesystem::file_type::directory) {
      subdirs.push_back(entry_path);
    }
  }

  // Close the handle before descending
  dir.reset();

  for (const auto& subdir : subdirs) {
    read_directory(subdir);
  }
}

}  // namespace fsutils
