#ifndef PATCHSET_IO_MMAP_HH
#define PATCHSET_IO_MMAP_HH

#include <cstddef>
#include <cstdint>
#include <string>

namespace patchset {
namespace io {

using std::string;

class Datum {
public:
  Datum(const uint8_t* ptr, size_t sz)
    : buffer(ptr), size(sz) {}

  const uint8_t* buffer;
  size_t size;
};

class MmapROFile {
public:
  explicit MmapROFile(const string& source);
  ~MmapROFile();

  MmapROFile(const MmapROFile&) = delete;
  MmapROFile& operator=(const MmapROFile&) = delete;

  bool is_open() const {
    return NULL != mem_addr_;
  }
  const uint8_t* const_ptr() const {
    return reinterpret_cast<const uint8_t*>(mem_addr_);
  }
  size_t size() const {
    return mem_sz_;
  }
  Datum datum() const {
    return Datum(const_ptr(), mem_sz_);
  }

private:
  int mem_fd_;
  size_t mem_sz_;
  void* mem_addr_;
};

} // namespace io
} // namespace patchset

#endif
