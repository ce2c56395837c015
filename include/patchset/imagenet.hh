#ifndef PATCHSET_IMAGENET_HH
#define PATCHSET_IMAGENET_HH

#include "patchset/index.hh"
#include "patchset/io/enumerate.hh"
#include "patchset/io/image.hh"
#include "patchset/sampler.hh"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace patchset {

using std::shared_ptr;
using std::string;
using std::unordered_map;
using std::vector;

class ClassInfo {
public:
  /**
    * Open a class description file. Each line holds a class name and its
    * human readable description separated by a tab, e.g. as written by the
    * dataset harmonization scripts.
    *
    * @param path: Path to the text file.
    */
  explicit ClassInfo(const string& path);

  size_t size() const {
    return class_names_.size();
  }
  const vector<string>& class_names() const {
    return class_names_;
  }
  bool contains(const string& class_name) const {
    return descriptions_.find(class_name) != descriptions_.end();
  }
  const string& description(const string& class_name) const {
    return descriptions_.at(class_name);
  }

private:
  vector<string> class_names_;
  unordered_map<string, string> descriptions_;
};

class ImagenetConfig {
public:
  ImagenetConfig()
    : normalize(false),
      train_samples_per_image(1),
      test_samples_per_image(1),
      train_center_first(false),
      test_center_first(false),
      verbose(true)
  {
    sample_shape.width = 17 * 3;
    sample_shape.height = 17 * 3;
    sample_shape.channels = 3;
  }

  io::ImageDim sample_shape;
  bool normalize;
  size_t train_samples_per_image;
  size_t test_samples_per_image;
  bool train_center_first;
  bool test_center_first;
  bool verbose;
  // Empty means `io::FindFileEnumerator`.
  shared_ptr<const io::FileEnumerator> enumerator;
};

class ImagenetPatchSets {
public:
  shared_ptr<const ImageIndex> train_index;
  shared_ptr<const ImageIndex> valid_index;
  SamplerConfig train_config;
  SamplerConfig valid_config;
};

/**
  * Open the ILSVRC2012 classification images (A.K.A. ImageNet) prepared by
  * the download and harmonization scripts. `datapath` holds the training
  * images in "ILSVRC2012_img_train" (or "Train"), the validation images in
  * "ILSVRC2012_img_val" (or "Test"), one directory per WordNet ID, and
  * optionally "metadata/class_info.txt".
  */
ImagenetPatchSets OpenImagenetPatchSets(const string& datapath, const ImagenetConfig& config);

} // namespace patchset

#endif
