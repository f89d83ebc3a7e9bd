#ifndef FILESYSTEM_HPP
#define FILESYSTEM_HPP

#include <cstdint>
#include <filesystem>
#include <string>

namespace fsutils {

// Which timestamps to set
enum class time_target {
  access,
  modification,
  both,
};

struct file_times {
  // Nanoseconds since the epoch
  uint64_t access_time;
  uint64_t modification_time;
};

// Owns a POSIX file descriptor and closes it on destruction
class file_descriptor {
  int _fd = -1;

 public:
  file_descriptor() = default;
  explicit file_descriptor(int fd) : _fd(fd) {}
  file_descriptor(const file_descriptor&) = delete;
  file_descriptor& operator=(const file_descriptor&) = delete;
  file_descriptor(file_descriptor&& other) noexcept : _fd(other._fd) { other._fd = -1; }
  file_descriptor& operator=(file_descriptor&& other) noexcept;
  ~file_descriptor();

  int get() const { return _fd; }
  explicit operator bool() const { return _fd != -1; }
  void close();
};

// Returns true if something exists at path. Errors count as "does not exist".
bool exists(const std::filesystem::path& path);

// Creates an empty file only if nothing exists at path.
// Returns false if the path already exists, throws io_error on any other failure.
bool create_new_file(const std::filesystem::path& path);

// Sets the selected timestamps of path to the current time. Throws io_error.
void touch_times(const std::filesystem::path& path, time_target target);

// Reads the access and modification time of path. Throws io_error.
file_times get_file_times(const std::filesystem::path& path);

// Creates a directory and all missing parents. Throws io_error.
void create_directories(const std::filesystem::path& path);

// Reads the whole file. Throws io_error.
std::string read_file(const std::filesystem::path& path);

// Reads at most the last num_bytes bytes of the file. Throws io_error.
std::string read_tail(const std::filesystem::path& path, uint64_t num_bytes);

}  // namespace fsutils

#endif  // FILESYSTEM_HPP
