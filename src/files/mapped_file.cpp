#include "files/mapped_file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace bridge_fs {

#ifdef O_PATH
// Traversal needs search permission only, not read permission.
constexpr int kDirOpenFlags = O_PATH | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
#else
constexpr int kDirOpenFlags = O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC;
#endif

static std::vector<std::string> split_components(const std::string &path) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (start < path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > start) {
      parts.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return parts;
}

// Returns an fd for path opened read-only, or -1 with errno set.
static int open_no_follow(const std::string &path) {
  if (path.empty() || path[0] != '/') {
    errno = EINVAL;
    return -1;
  }

  const std::vector<std::string> parts = split_components(path);
  if (parts.empty()) {
    return ::open("/", O_RDONLY | O_CLOEXEC);
  }

  int dir_fd = ::open("/", kDirOpenFlags);
  if (dir_fd < 0) {
    return -1;
  }

  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    const int next = ::openat(dir_fd, parts[i].c_str(), kDirOpenFlags);
    const int saved = errno;
    ::close(dir_fd);
    if (next < 0) {
      errno = saved;
      return -1;
    }
    dir_fd = next;
  }

  const int fd = ::openat(dir_fd, parts.back().c_str(),
                          O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
  const int saved = errno;
  ::close(dir_fd);
  errno = saved;
  return fd;
}

MappedFile::~MappedFile() { reset(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_),
      open_(other.open_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
  other.open_ = false;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    reset();
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    fd_ = std::exchange(other.fd_, -1);
    open_ = std::exchange(other.open_, false);
  }
  return *this;
}

void MappedFile::reset() {
  if (data_ != nullptr) {
    ::munmap(const_cast<uint8_t *>(data_), static_cast<size_t>(size_));
  }
  if (fd_ >= 0) {
    ::close(fd_);
  }
  data_ = nullptr;
  size_ = 0;
  fd_ = -1;
  open_ = false;
}

bool MappedFile::open(const std::string &path, MapFailure &failure) {
  reset();

  const int fd = open_no_follow(path);
  if (fd < 0) {
    failure = {MapFailure::Stage::Open, errno};
    return false;
  }

  struct stat st;
  if (::fstat(fd, &st) != 0) {
    failure = {MapFailure::Stage::Stat, errno};
    ::close(fd);
    return false;
  }

  if (!S_ISREG(st.st_mode)) {
    failure = {MapFailure::Stage::NotRegular, 0};
    ::close(fd);
    return false;
  }

  const uint64_t size = static_cast<uint64_t>(st.st_size);
  if (size == 0) {
    fd_ = fd;
    open_ = true;
    return true;
  }

  void *addr = ::mmap(nullptr, static_cast<size_t>(size), PROT_READ,
                      MAP_PRIVATE, fd, 0);
  if (addr == MAP_FAILED) {
    failure = {MapFailure::Stage::Map, errno};
    ::close(fd);
    return false;
  }

  data_ = static_cast<const uint8_t *>(addr);
  size_ = size;
  fd_ = fd;
  open_ = true;
  return true;
}

bool MappedFile::covers(uint64_t end, int &error_number) const {
  error_number = 0;
  if (fd_ < 0) {
    return end == 0;
  }

  struct stat st;
  if (::fstat(fd_, &st) != 0) {
    error_number = errno;
    return false;
  }
  return static_cast<uint64_t>(st.st_size) >= end;
}

} // namespace bridge_fs
