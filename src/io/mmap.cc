#include "patchset/io/mmap.hh"

#include <string>

extern "C" {
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
}

namespace patchset {
namespace io {

// A file that cannot be opened or mapped leaves the object closed; callers
// check `is_open()` and classify the failure themselves.
MmapROFile::MmapROFile(const string& source) {
  mem_fd_ = -1;
  mem_sz_ = 0;
  mem_addr_ = NULL;

  mem_fd_ = open(source.c_str(), O_RDONLY);
  if (-1 == mem_fd_) {
    return;
  }

  struct stat stat_buf;
  if (-1 == fstat(mem_fd_, &stat_buf) || !S_ISREG(stat_buf.st_mode) || 0 == stat_buf.st_size) {
    close(mem_fd_);
    mem_fd_ = -1;
    return;
  }
  mem_sz_ = stat_buf.st_size;

  void* addr = mmap(NULL, mem_sz_, PROT_READ, MAP_SHARED, mem_fd_, 0);
  if (MAP_FAILED == addr) {
    close(mem_fd_);
    mem_fd_ = -1;
    mem_sz_ = 0;
    return;
  }
  mem_addr_ = addr;
}

MmapROFile::~MmapROFile() {
  if (NULL != mem_addr_) {
    munmap(mem_addr_, mem_sz_);
  }
  if (-1 != mem_fd_) {
    close(mem_fd_);
  }
}

} // namespace io
} // namespace patchset
