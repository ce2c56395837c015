#ifndef PATCHSET_IO_ENUMERATE_HH
#define PATCHSET_IO_ENUMERATE_HH

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace patchset {
namespace io {

using std::string;
using std::vector;

class EnumerateFilter {
public:
  static vector<string> DefaultExtensions();

  EnumerateFilter()
    : extensions(DefaultExtensions()) {}

  /**
    * True if the file at `path` should be indexed: its extension is in
    * `extensions` (case-insensitive), its file name does not match
    * `exclude_file` (case-insensitive glob) and the full path does not match
    * `exclude_dir` (glob where `*` also matches `/`).
    */
  bool matches(const string& path) const;

  // Lower case, without the leading dot.
  vector<string> extensions;
  string exclude_file;
  string exclude_dir;
};

/**
  * Bulk file enumeration. `enumerate` appends every regular file below `dir`
  * accepted by `filter` to `out`. Implementations throw `EnumerationError`
  * when the tree cannot be scanned.
  */
class FileEnumerator {
public:
  virtual ~FileEnumerator() {}

  virtual void enumerate(const string& dir, const EnumerateFilter& filter, vector<string>* out) const = 0;
};

/**
  * Line reader over the standard output of a shell command (`popen`).
  * `close` reaps the child and throws `EnumerationError` on a non-zero exit;
  * the destructor reaps it silently.
  */
class PipeReader {
public:
  explicit PipeReader(const string& command);
  ~PipeReader();

  PipeReader(const PipeReader&) = delete;
  PipeReader& operator=(const PipeReader&) = delete;

  // Next line without its trailing newline; false at end of output.
  bool next_line(string* line);
  void close();

private:
  string command_;
  FILE* pipe_;
  char* line_;
  size_t line_cap_;
};

// In-process recursive walk. Entries are visited in sorted order.
class NativeFileEnumerator : public virtual FileEnumerator {
public:
  virtual ~NativeFileEnumerator() {}

  virtual void enumerate(const string& dir, const EnumerateFilter& filter, vector<string>* out) const;
};

// Streams the output of GNU find through a pipe, one process per directory.
class FindFileEnumerator : public virtual FileEnumerator {
public:
  explicit FindFileEnumerator(const string& find_executable = "find")
    : find_executable_(find_executable) {}
  virtual ~FindFileEnumerator() {}

  virtual void enumerate(const string& dir, const EnumerateFilter& filter, vector<string>* out) const;

  string command(const string& dir, const EnumerateFilter& filter) const;

private:
  string find_executable_;
};

} // namespace io
} // namespace patchset

#endif
