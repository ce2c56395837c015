#include "patchset/imagenet.hh"
#include "patchset/index_builder.hh"
#include "patchset/str_util.hh"

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <sys/stat.h>
#include <sys/types.h>
}

namespace patchset {

using std::make_shared;
using std::string;
using std::vector;

namespace {

bool IsDirectory(const string& path) {
  struct stat stat_buf;
  return 0 == stat(path.c_str(), &stat_buf) && S_ISDIR(stat_buf.st_mode);
}

bool IsFile(const string& path) {
  struct stat stat_buf;
  return 0 == stat(path.c_str(), &stat_buf) && S_ISREG(stat_buf.st_mode);
}

string FirstDirectory(const string& datapath, const string& name, const string& fallback) {
  const string path = join_path(datapath, name);
  if (IsDirectory(path)) {
    return path;
  }
  return join_path(datapath, fallback);
}

shared_ptr<ImageIndex> BuildSplit(const string& path, const ImagenetConfig& config) {
  IndexBuilderConfig builder_config;
  builder_config.roots.push_back(path);
  builder_config.class_order = NumericClassOrder;
  builder_config.enumerator = config.enumerator;
  builder_config.verbose = config.verbose;
  return make_shared<ImageIndex>(IndexBuilder(builder_config).build());
}

} // namespace

ClassInfo::ClassInfo(const string& path) {
  std::ifstream file(path);
  if (!file) {
    throw std::runtime_error("failed to open class info " + path);
  }
  string buf;
  while (std::getline(file, buf)) {
    if (!buf.empty() && '\r' == buf.back()) {
      buf.pop_back();
    }
    if (buf.empty()) {
      continue;
    }
    vector<string> fields = split(buf, '\t');
    const string description = fields.size() > 1 ? fields.at(1) : string();
    if (descriptions_.emplace(fields.at(0), description).second) {
      class_names_.push_back(fields.at(0));
    }
  }
}

ImagenetPatchSets OpenImagenetPatchSets(const string& datapath, const ImagenetConfig& config) {
  if (!IsDirectory(datapath)) {
    throw std::runtime_error("expecting path to ILSVRC2012 data: " + datapath);
  }
  const string train_path = FirstDirectory(datapath, "ILSVRC2012_img_train", "Train");
  const string valid_path = FirstDirectory(datapath, "ILSVRC2012_img_val", "Test");
  const string class_info_path = join_path(join_path(datapath, "metadata"), "class_info.txt");

  shared_ptr<ImageIndex> train_index = BuildSplit(train_path, config);
  shared_ptr<ImageIndex> valid_index = BuildSplit(valid_path, config);

  if (IsFile(class_info_path)) {
    shared_ptr<const ClassInfo> class_info = make_shared<ClassInfo>(class_info_path);
    train_index->set_class_info(class_info);
    valid_index->set_class_info(class_info);
  } else if (config.verbose) {
    std::clog << "DEBUG: ImageNet: skipping " << class_info_path << std::endl;
  }

  ImagenetPatchSets sets;
  sets.train_index = train_index;
  sets.valid_index = valid_index;

  SamplerConfig sampler_config;
  sampler_config.shape = config.sample_shape;
  sampler_config.normalize = config.normalize;
  sampler_config.train_center_first = config.train_center_first;
  sampler_config.test_center_first = config.test_center_first;
  sampler_config.verbose = config.verbose;

  sets.train_config = sampler_config;
  sets.train_config.mode = SampleMode::kTrain;
  sets.train_config.samples_per_image = config.train_samples_per_image;
  sets.valid_config = sampler_config;
  sets.valid_config.mode = SampleMode::kTest;
  sets.valid_config.samples_per_image = config.test_samples_per_image;
  return sets;
}

} // namespace patchset
