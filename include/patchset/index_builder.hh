#ifndef PATCHSET_INDEX_BUILDER_HH
#define PATCHSET_INDEX_BUILDER_HH

#include "patchset/index.hh"
#include "patchset/io/enumerate.hh"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace patchset {

using std::function;
using std::shared_ptr;
using std::string;
using std::vector;

// Strict weak ordering over class names; fixes the class index assignment.
typedef function<bool(const string&, const string&)> ClassOrder;

// Advisory progress: `stage` is "classes" or "paths".
typedef function<void(const string& stage, size_t done, size_t total)> ProgressFn;

/**
  * Orders class names by the value of their first run of decimal digits
  * ("n01440764" < "n01443537", "class2" < "class10"). Names without digits
  * sort after all numbered names; ties fall back to lexicographic order.
  */
bool NumericClassOrder(const string& lhs, const string& rhs);

class IndexBuilderConfig {
public:
  IndexBuilderConfig()
    : verbose(true) {}

  // One or many dataset roots laid out as root/class_name/.../image_file.
  vector<string> roots;
  // Glob on file names to skip, case-insensitive. Empty disables.
  string exclude_file;
  // Glob on full paths to skip. Empty disables.
  string exclude_dir;
  // Empty means plain `operator<`.
  ClassOrder class_order;
  // Empty means `io::FindFileEnumerator`.
  shared_ptr<const io::FileEnumerator> enumerator;
  bool verbose;
  ProgressFn progress;
};

class IndexBuilder {
public:
  explicit IndexBuilder(const IndexBuilderConfig& config);

  /**
    * Scan the configured roots and build the index. Not reentrant.
    *
    * Throws `NoImagesFoundError` if no image was found under any class,
    * `EmptyClassError` if one class directory holds no image, and
    * `std::runtime_error` if a root is not a directory.
    */
  ImageIndex build() const;

private:
  void discover_classes(vector<string>* class_names, vector<vector<string>>* class_dirs) const;
  void report(const string& stage, size_t done, size_t total) const;

  IndexBuilderConfig config_;
  shared_ptr<const io::FileEnumerator> enumerator_;
};

ImageIndex BuildIndex(
    const vector<string>& roots,
    const string& exclude_file = string(),
    const string& exclude_dir = string(),
    ClassOrder class_order = ClassOrder());

} // namespace patchset

#endif
