#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bridge_fs {

// Why MappedFile::open() failed. error_number is the errno of the failing
// call (0 for NotRegular).
struct MapFailure {
  enum class Stage { Open, Stat, NotRegular, Map };

  Stage stage = Stage::Open;
  int error_number = 0;
};

// Read-only private mapping of a whole regular file. Move-only; the mapping
// and its descriptor are released on destruction. A zero-length file is
// opened without mapping.
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  // Opens an absolute, symlink-free path, walking it one component at a time
  // with O_NOFOLLOW: a symlink anywhere along the path fails with ELOOP (or
  // ENOTDIR for a directory component). Replaces any current mapping.
  // Returns false and fills failure on error.
  bool open(const std::string &path, MapFailure &failure);

  void reset();

  // True while the file on disk still holds at least end bytes. Touching
  // mapped pages past a truncated end raises SIGBUS, so readers check this
  // before copying. error_number is set when fstat fails.
  bool covers(uint64_t end, int &error_number) const;

  bool is_open() const { return open_; }
  const uint8_t *data() const { return data_; }
  uint64_t size() const { return size_; }

private:
  const uint8_t *data_ = nullptr;
  uint64_t size_ = 0;
  int fd_ = -1;
  bool open_ = false;
};

} // namespace bridge_fs
