#include "filesystem.hpp"
#include "exception.hpp"

#include <cerrno>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fsutils {

namespace {

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

[[noreturn]] void throw_io_error(const std::string& what, const std::filesystem::path& path) {
  std::error_code ec = last_error();
  throw io_error(what + ": " + path.string() + ": " + ec.message(), ec);
}

// Reads from fd until count bytes were read or end of file
std::string read_all(int fd, const std::filesystem::path& path, uint64_t count) {
  std::string data;
  char buffer[64 * 1024];

  while (count > 0) {
    size_t chunk = count < sizeof(buffer) ? static_cast<size_t>(count) : sizeof(buffer);
    ssize_t n = ::read(fd, buffer, chunk);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw_io_error("failed to read file", path);
    }
    if (n == 0) {
      break;
    }
    data.append(buffer, static_cast<size_t>(n));
    count -= static_cast<uint64_t>(n);
  }
  return data;
}

file_descriptor open_for_reading(const std::filesystem::path& path) {
  file_descriptor fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd) {
    throw_io_error("failed to open file", path);
  }
  return fd;
}

}  // namespace

file_descriptor& file_descriptor::operator=(file_descriptor&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other._fd;
    other._fd = -1;
  }
  return *this;
}

file_descriptor::~file_descriptor() { close(); }

void file_descriptor::close() {
  if (_fd != -1) {
    ::close(_fd);
    _fd = -1;
  }
}

bool exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec) && !ec;
}

bool create_new_file(const std::filesystem::path& path) {
  file_descriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666));
  if (!fd) {
    if (errno == EEXIST) {
      return false;
    }
    throw_io_error("failed to create file", path);
  }
  return true;
}

void touch_times(const std::filesystem::path& path, time_target target) {
  // UTIME_NOW for the selected timestamps, UTIME_OMIT leaves the other untouched
  struct timespec times[2];
  times[0].tv_sec = 0;
  times[0].tv_nsec = target == time_target::modification ? UTIME_OMIT : UTIME_NOW;
  times[1].tv_sec = 0;
  times[1].tv_nsec = target == time_target::access ? UTIME_OMIT : UTIME_NOW;

  if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
    throw_io_error("failed to update timestamps", path);
  }
}

file_times get_file_times(const std::filesystem::path& path) {
  struct ::stat st;
  if (::stat(path.c_str(), &st) != 0) {
    throw_io_error("failed to stat file", path);
  }

#ifdef __APPLE__
  uint64_t atime = uint64_t(st.st_atimespec.tv_sec) * 1000000000 + st.st_atimespec.tv_nsec;
  uint64_t mtime = uint64_t(st.st_mtimespec.tv_sec) * 1000000000 + st.st_mtimespec.tv_nsec;
#else
  uint64_t atime = uint64_t(st.st_atim.tv_sec) * 1000000000 + st.st_atim.tv_nsec;
  uint64_t mtime = uint64_t(st.st_mtim.tv_sec) * 1000000000 + st.st_mtim.tv_nsec;
#endif
  return file_times{atime, mtime};
}

void create_directories(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw io_error("failed to create directory: " + path.string() + ": " + ec.message(), ec);
  }
}

std::string read_file(const std::filesystem::path& path) {
  file_descriptor fd = open_for_reading(path);
  return read_all(fd.get(), path, UINT64_MAX);
}

std::string read_tail(const std::filesystem::path& path, uint64_t num_bytes) {
  file_descriptor fd = open_for_reading(path);

  struct ::stat st;
  if (::fstat(fd.get(), &st) != 0) {
    throw_io_error("failed to stat file", path);
  }

  uint64_t length = static_cast<uint64_t>(st.st_size);
  uint64_t start = length > num_bytes ? length - num_bytes : 0;

  if (start > 0 && ::lseek(fd.get(), static_cast<off_t>(start), SEEK_SET) == static_cast<off_t>(-1)) {
    throw_io_error("failed to seek file", path);
  }

  return read_all(fd.get(), path, num_bytes);
}

}  // namespace fsutils
