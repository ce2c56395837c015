#include "patchset/io/enumerate.hh"
#include "patchset/error.hh"
#include "patchset/str_util.hh"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <dirent.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
}

namespace patchset {
namespace io {

using std::pair;
using std::string;
using std::unique_ptr;
using std::vector;

vector<string> EnumerateFilter::DefaultExtensions() {
  return {"jpg", "jpeg", "png", "ppm", "bmp"};
}

bool EnumerateFilter::matches(const string& path) const {
  const string name = base_name(path);
  size_t dot = name.find_last_of('.');
  if (string::npos == dot) {
    return false;
  }
  const string ext = to_lower(name.substr(dot + 1));
  if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
    return false;
  }
  if (!exclude_file.empty() && 0 == fnmatch(exclude_file.c_str(), name.c_str(), FNM_CASEFOLD)) {
    return false;
  }
  if (!exclude_dir.empty() && 0 == fnmatch(exclude_dir.c_str(), path.c_str(), 0)) {
    return false;
  }
  return true;
}

namespace {

class DirEntry {
public:
  string name;
  bool is_dir;
  bool is_file;
};

void ListDirectory(const string& dir, vector<DirEntry>* entries) {
  unique_ptr<DIR, int (*)(DIR*)> handle(opendir(dir.c_str()), closedir);
  if (!handle) {
    throw EnumerationError("failed to open directory " + dir + ": " + std::strerror(errno));
  }
  for (struct dirent* ent = readdir(handle.get()); NULL != ent; ent = readdir(handle.get())) {
    if (0 == std::strcmp(ent->d_name, ".") || 0 == std::strcmp(ent->d_name, "..")) {
      continue;
    }
    DirEntry entry;
    entry.name = ent->d_name;
    entry.is_dir = (DT_DIR == ent->d_type);
    entry.is_file = (DT_REG == ent->d_type);
    if (DT_UNKNOWN == ent->d_type) {
      struct stat stat_buf;
      const string path = join_path(dir, entry.name);
      if (0 == lstat(path.c_str(), &stat_buf)) {
        entry.is_dir = S_ISDIR(stat_buf.st_mode);
        entry.is_file = S_ISREG(stat_buf.st_mode);
      }
    }
    entries->push_back(entry);
  }
  std::sort(entries->begin(), entries->end(), [](const DirEntry& lhs, const DirEntry& rhs) {
    return lhs.name < rhs.name;
  });
}

void WalkDirectory(const string& dir, const EnumerateFilter& filter, vector<string>* out) {
  // The handle is closed before descending so deep trees do not pile up
  // open descriptors.
  vector<DirEntry> entries;
  ListDirectory(dir, &entries);
  for (auto iter = entries.begin(); iter != entries.end(); ++iter) {
    const string path = join_path(dir, iter->name);
    if (iter->is_dir) {
      WalkDirectory(path, filter, out);
    } else if (iter->is_file && filter.matches(path)) {
      out->push_back(path);
    }
  }
}

} // namespace

PipeReader::PipeReader(const string& command)
  : command_(command), pipe_(popen(command.c_str(), "r")), line_(NULL), line_cap_(0)
{
  if (NULL == pipe_) {
    throw EnumerationError("failed to spawn: " + command_);
  }
}

PipeReader::~PipeReader() {
  if (NULL != pipe_) {
    pclose(pipe_);
  }
  std::free(line_);
}

bool PipeReader::next_line(string* line) {
  if (NULL == pipe_) {
    return false;
  }
  ssize_t len = getline(&line_, &line_cap_, pipe_);
  if (len < 0) {
    return false;
  }
  while (len > 0 && ('\n' == line_[len - 1] || '\r' == line_[len - 1])) {
    --len;
  }
  line->assign(line_, len);
  return true;
}

void PipeReader::close() {
  if (NULL == pipe_) {
    return;
  }
  int status = pclose(pipe_);
  pipe_ = NULL;
  if (-1 == status || !WIFEXITED(status) || 0 != WEXITSTATUS(status)) {
    throw EnumerationError("command failed with status " + std::to_string(status) + ": " + command_);
  }
}

void NativeFileEnumerator::enumerate(const string& dir, const EnumerateFilter& filter, vector<string>* out) const {
  WalkDirectory(dir, filter, out);
}

string FindFileEnumerator::command(const string& dir, const EnumerateFilter& filter) const {
  string cmd = find_executable_ + " -H " + shell_quote(dir) + " -type f";
  if (!filter.exclude_dir.empty()) {
    cmd += " -not -path " + shell_quote(filter.exclude_dir);
  }
  if (!filter.exclude_file.empty()) {
    cmd += " ! -iname " + shell_quote(filter.exclude_file);
  }
  cmd += " \\(";
  for (size_t i = 0; i < filter.extensions.size(); ++i) {
    if (i > 0) {
      cmd += " -o";
    }
    cmd += " -iname " + shell_quote("*." + filter.extensions.at(i));
  }
  cmd += " \\)";
  return cmd;
}

void FindFileEnumerator::enumerate(const string& dir, const EnumerateFilter& filter, vector<string>* out) const {
  if (filter.extensions.empty()) {
    return;
  }
  PipeReader reader(command(dir, filter));
  string line;
  while (reader.next_line(&line)) {
    if (!line.empty()) {
      out->push_back(line);
    }
  }
  reader.close();
}

} // namespace io
} // namespace patchset
