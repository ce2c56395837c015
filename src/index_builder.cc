#include "patchset/index_builder.hh"
#include "patchset/error.hh"
#include "patchset/index.hh"
#include "patchset/io/enumerate.hh"
#include "patchset/str_util.hh"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

extern "C" {
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
}

namespace patchset {

using std::make_shared;
using std::string;
using std::unique_ptr;
using std::unordered_map;
using std::vector;

namespace {

const size_t kPathProgressInterval = 10000;

string AbsolutePath(const string& path) {
  if (!path.empty() && '/' == path[0]) {
    return path;
  }
  vector<char> cwd(4096);
  while (NULL == getcwd(cwd.data(), cwd.size())) {
    if (ERANGE != errno) {
      throw std::runtime_error(string("getcwd failed: ") + std::strerror(errno));
    }
    cwd.resize(cwd.size() * 2);
  }
  return join_path(string(cwd.data()), path);
}

bool IsDirectory(const string& path) {
  struct stat stat_buf;
  return 0 == stat(path.c_str(), &stat_buf) && S_ISDIR(stat_buf.st_mode);
}

// Immediate, non-hidden subdirectories of `root`, sorted by name.
vector<string> ListClassDirectories(const string& root) {
  unique_ptr<DIR, int (*)(DIR*)> handle(opendir(root.c_str()), closedir);
  if (!handle) {
    throw std::runtime_error("failed to open dataset root " + root + ": " + std::strerror(errno));
  }
  vector<string> names;
  for (struct dirent* ent = readdir(handle.get()); NULL != ent; ent = readdir(handle.get())) {
    if ('.' == ent->d_name[0]) {
      continue;
    }
    const string name(ent->d_name);
    if (IsDirectory(join_path(root, name))) {
      names.push_back(name);
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::tuple<int, size_t, string, string> NumericKey(const string& name) {
  size_t begin = 0;
  while (begin < name.size() && !std::isdigit(static_cast<unsigned char>(name[begin]))) {
    ++begin;
  }
  if (begin == name.size()) {
    return std::make_tuple(1, 0UL, string(), name);
  }
  size_t end = begin;
  while (end < name.size() && std::isdigit(static_cast<unsigned char>(name[end]))) {
    ++end;
  }
  while (begin + 1 < end && '0' == name[begin]) {
    ++begin;
  }
  // Numbers of any width: fewer significant digits is smaller.
  const string digits = name.substr(begin, end - begin);
  return std::make_tuple(0, digits.size(), digits, name);
}

} // namespace

bool NumericClassOrder(const string& lhs, const string& rhs) {
  return NumericKey(lhs) < NumericKey(rhs);
}

IndexBuilder::IndexBuilder(const IndexBuilderConfig& config)
  : config_(config), enumerator_(config.enumerator)
{
  if (!enumerator_) {
    enumerator_ = make_shared<io::FindFileEnumerator>();
  }
}

void IndexBuilder::report(const string& stage, size_t done, size_t total) const {
  if (config_.progress) {
    config_.progress(stage, done, total);
  }
}

void IndexBuilder::discover_classes(vector<string>* class_names, vector<vector<string>>* class_dirs) const {
  unordered_map<string, vector<string>> dirs_by_name;
  vector<string> names;
  for (auto root_iter = config_.roots.begin(); root_iter != config_.roots.end(); ++root_iter) {
    const string root = AbsolutePath(*root_iter);
    if (!IsDirectory(root)) {
      throw std::runtime_error("dataset root is not a directory: " + root);
    }
    const vector<string> root_classes = ListClassDirectories(root);
    for (auto iter = root_classes.begin(); iter != root_classes.end(); ++iter) {
      auto search = dirs_by_name.find(*iter);
      if (search == dirs_by_name.end()) {
        names.push_back(*iter);
        dirs_by_name.emplace(*iter, vector<string>(1, join_path(root, *iter)));
      } else {
        search->second.push_back(join_path(root, *iter));
      }
    }
  }

  if (config_.class_order) {
    std::stable_sort(names.begin(), names.end(), config_.class_order);
  } else {
    std::sort(names.begin(), names.end());
  }

  class_names->clear();
  class_dirs->clear();
  for (auto iter = names.begin(); iter != names.end(); ++iter) {
    class_names->push_back(*iter);
    class_dirs->push_back(dirs_by_name.at(*iter));
  }
}

ImageIndex IndexBuilder::build() const {
  if (config_.roots.empty()) {
    throw std::invalid_argument("IndexBuilder needs at least one dataset root");
  }

  vector<string> class_names;
  vector<vector<string>> class_dirs;
  discover_classes(&class_names, &class_dirs);
  const size_t num_classes = class_names.size();
  if (config_.verbose) {
    std::clog << "DEBUG: found " << num_classes << " classes" << std::endl;
  }

  io::EnumerateFilter filter;
  filter.exclude_file = config_.exclude_file;
  filter.exclude_dir = config_.exclude_dir;

  if (config_.verbose) {
    std::clog << "DEBUG: enumerating image files of each class directory" << std::endl;
  }
  vector<vector<string>> class_paths(num_classes);
  size_t num_paths = 0;
  size_t max_path_length = 0;
  for (size_t class_index = 0; class_index < num_classes; ++class_index) {
    vector<string>& paths = class_paths[class_index];
    const vector<string>& dirs = class_dirs[class_index];
    for (auto dir_iter = dirs.begin(); dir_iter != dirs.end(); ++dir_iter) {
      enumerator_->enumerate(*dir_iter, filter, &paths);
    }
    for (auto iter = paths.begin(); iter != paths.end(); ++iter) {
      max_path_length = std::max(max_path_length, iter->size());
    }
    num_paths += paths.size();
    report("classes", class_index + 1, num_classes);
  }

  if (0 == num_paths) {
    throw NoImagesFoundError("could not find any image file in the given input paths");
  }
  for (size_t class_index = 0; class_index < num_classes; ++class_index) {
    if (class_paths[class_index].empty()) {
      throw EmptyClassError(class_names[class_index]);
    }
  }

  if (config_.verbose) {
    std::clog << "DEBUG: loading " << num_paths << " sample paths"
        << " (max path length: " << max_path_length << ")" << std::endl;
  }
  PathStore store;
  store.reserve(num_paths, max_path_length);
  size_t count = 0;
  for (size_t class_index = 0; class_index < num_classes; ++class_index) {
    vector<string>& paths = class_paths[class_index];
    for (auto iter = paths.begin(); iter != paths.end(); ++iter) {
      store.append(*iter, static_cast<uint32_t>(class_index));
      ++count;
      if (0 == count % kPathProgressInterval) {
        report("paths", count, num_paths);
      }
    }
    vector<string>().swap(paths);
  }
  report("paths", count, num_paths);

  return ImageIndex(ClassCatalog(class_names, class_dirs), std::move(store));
}

ImageIndex BuildIndex(
    const vector<string>& roots,
    const string& exclude_file,
    const string& exclude_dir,
    ClassOrder class_order)
{
  IndexBuilderConfig config;
  config.roots = roots;
  config.exclude_file = exclude_file;
  config.exclude_dir = exclude_dir;
  config.class_order = class_order;
  return IndexBuilder(config).build();
}

} // namespace patchset
