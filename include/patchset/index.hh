#ifndef PATCHSET_INDEX_HH
#define PATCHSET_INDEX_HH

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace patchset {

using std::shared_ptr;
using std::string;
using std::unordered_map;
using std::vector;

class ClassInfo;

/**
  * Fixed-stride path storage with a parallel label array. Paths are appended
  * in class order, so every class owns one contiguous run of positions.
  */
class PathStore {
public:
  PathStore()
    : stride_(0), size_(0) {}

  /**
    * Fix the stride and reserve room for `num_paths` paths. Must be called
    * once, before the first `append`.
    *
    * @param num_paths: Number of paths that will be appended.
    * @param max_path_length: Length of the longest path, without terminator.
    */
  void reserve(size_t num_paths, size_t max_path_length);
  void append(const string& path, uint32_t label);

  size_t size() const {
    return size_;
  }
  size_t stride() const {
    return stride_;
  }
  const char* c_path(size_t index) const {
    return buffer_.data() + index * stride_;
  }
  string path(size_t index) const;
  uint32_t label(size_t index) const {
    return labels_.at(index);
  }

  size_t num_classes() const {
    return class_begin_.size();
  }
  size_t class_offset(uint32_t class_index) const {
    return class_begin_.at(class_index);
  }
  size_t class_size(uint32_t class_index) const;
  size_t class_position(uint32_t class_index, size_t k) const;

private:
  size_t stride_;
  size_t size_;
  vector<char> buffer_;
  vector<uint32_t> labels_;
  vector<size_t> class_begin_;
};

class ClassCatalog {
public:
  ClassCatalog() {}
  ClassCatalog(const vector<string>& class_names, const vector<vector<string>>& class_dirs);

  size_t num_classes() const {
    return class_names_.size();
  }
  const vector<string>& names() const {
    return class_names_;
  }
  const string& name(uint32_t class_index) const {
    return class_names_.at(class_index);
  }
  const vector<string>& dirs(uint32_t class_index) const {
    return class_dirs_.at(class_index);
  }
  bool contains(const string& class_name) const {
    return name_to_index_.find(class_name) != name_to_index_.end();
  }
  uint32_t index_of(const string& class_name) const;

private:
  vector<string> class_names_;
  unordered_map<string, uint32_t> name_to_index_;
  vector<vector<string>> class_dirs_;
};

/**
  * The result of an index build. Immutable once shared: samplers hold it
  * through `shared_ptr<const ImageIndex>`.
  */
class ImageIndex {
public:
  ImageIndex(ClassCatalog catalog, PathStore store);

  const ClassCatalog& catalog() const {
    return catalog_;
  }
  const PathStore& store() const {
    return store_;
  }

  size_t size() const {
    return store_.size();
  }
  size_t size(const string& class_name) const {
    return store_.class_size(catalog_.index_of(class_name));
  }
  size_t num_classes() const {
    return catalog_.num_classes();
  }

  const shared_ptr<const ClassInfo>& class_info() const {
    return class_info_;
  }
  void set_class_info(shared_ptr<const ClassInfo> class_info) {
    class_info_ = class_info;
  }

private:
  ClassCatalog catalog_;
  PathStore store_;
  shared_ptr<const ClassInfo> class_info_;
};

} // namespace patchset

#endif
