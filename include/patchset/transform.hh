#ifndef PATCHSET_TRANSFORM_HH
#define PATCHSET_TRANSFORM_HH

#include "patchset/error.hh"
#include "patchset/io/image.hh"

#include <opencv2/core/core.hpp>

#include <cstddef>
#include <memory>
#include <random>
#include <string>

namespace patchset {

using std::shared_ptr;
using std::string;

// The crop strategies a sampler can be configured with.
enum class SampleMode {
  kDefault = 0,
  kTrain,
  kTest,
  kTenCrop,
};

enum class CropPolicy {
  kCenter = 0,
  kRandom,
};

const char* SampleModeName(SampleMode mode);

/**
  * Crop origin for one crop of an image. Train and test modes center the
  * first crop of every image when their `center_first` flag is set; every
  * other crop is random.
  */
CropPolicy ResolveCropPolicy(SampleMode mode, bool first_crop, bool train_center_first, bool test_center_first);

class TransformPipeline {
public:
  /**
    * @param decoder: Decoder boundary used by `load`.
    * @param shape: Target sample shape; channels must be 1 (luma only) or 3.
    */
  TransformPipeline(shared_ptr<const io::ImageDecoder> decoder, const io::ImageDim& shape);

  const io::ImageDim& shape() const {
    return shape_;
  }
  size_t sample_size() const {
    return shape_.channels * shape_.height * shape_.width;
  }

  // Decode `path` into a float YUV (or Y) raster.
  SampleStatus load(const string& path, cv::Mat& img) const;

  // Writes one planar sample to `dst` on success; `dst` is untouched otherwise.
  SampleStatus crop(const cv::Mat& img, CropPolicy policy, std::mt19937_64* rng, float* dst) const;

  /**
    * Writes ten planar samples to `dst`: center, top-left, top-right,
    * bottom-left and bottom-right crops, each followed by its horizontal
    * mirror. Throws `ShapeMismatchError` if `img` cannot provide them.
    */
  void ten_crop(const cv::Mat& img, float* dst) const;

private:
  shared_ptr<const io::ImageDecoder> decoder_;
  io::ImageDim shape_;
};

} // namespace patchset

#endif
