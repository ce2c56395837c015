#include "patchset/index.hh"

#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace patchset {

using std::string;
using std::vector;

void PathStore::reserve(size_t num_paths, size_t max_path_length) {
  if (0 != stride_) {
    throw std::logic_error("PathStore stride is already fixed");
  }
  stride_ = max_path_length + 1;
  buffer_.reserve(num_paths * stride_);
  labels_.reserve(num_paths);
}

void PathStore::append(const string& path, uint32_t label) {
  if (0 == stride_) {
    throw std::logic_error("PathStore::append before reserve");
  }
  if (path.size() >= stride_) {
    throw std::length_error("path longer than the store stride: " + path);
  }
  if (!class_begin_.empty() && label + 1 < class_begin_.size()) {
    throw std::invalid_argument("PathStore labels must be appended in class order");
  }
  while (class_begin_.size() <= label) {
    class_begin_.push_back(size_);
  }
  buffer_.resize(buffer_.size() + stride_, '\0');
  std::memcpy(buffer_.data() + size_ * stride_, path.data(), path.size());
  labels_.push_back(label);
  ++size_;
}

string PathStore::path(size_t index) const {
  if (index >= size_) {
    throw std::out_of_range("path index " + std::to_string(index) + " out of range");
  }
  return string(c_path(index));
}

size_t PathStore::class_size(uint32_t class_index) const {
  const size_t begin = class_begin_.at(class_index);
  const size_t end = class_index + 1 < class_begin_.size() ? class_begin_[class_index + 1] : size_;
  return end - begin;
}

size_t PathStore::class_position(uint32_t class_index, size_t k) const {
  if (k >= class_size(class_index)) {
    throw std::out_of_range("class position out of range");
  }
  return class_begin_[class_index] + k;
}

ClassCatalog::ClassCatalog(const vector<string>& class_names, const vector<vector<string>>& class_dirs)
  : class_names_(class_names), class_dirs_(class_dirs)
{
  if (class_names_.size() != class_dirs_.size()) {
    throw std::invalid_argument("ClassCatalog needs one directory list per class");
  }
  for (size_t i = 0; i < class_names_.size(); ++i) {
    auto inserted = name_to_index_.emplace(class_names_[i], static_cast<uint32_t>(i));
    if (!inserted.second) {
      throw std::invalid_argument("duplicate class name: " + class_names_[i]);
    }
  }
}

uint32_t ClassCatalog::index_of(const string& class_name) const {
  auto search = name_to_index_.find(class_name);
  if (search == name_to_index_.end()) {
    throw std::out_of_range("unknown class: " + class_name);
  }
  return search->second;
}

ImageIndex::ImageIndex(ClassCatalog catalog, PathStore store)
  : catalog_(std::move(catalog)), store_(std::move(store))
{
  if (catalog_.num_classes() != store_.num_classes()) {
    throw std::invalid_argument("class catalog and path store disagree on the number of classes");
  }
}

} // namespace patchset
