#include "patchset/transform.hh"
#include "patchset/error.hh"
#include "patchset/io/image.hh"

#include <opencv2/core/core.hpp>

#include <cassert>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

namespace patchset {

using std::string;

const char* SampleModeName(SampleMode mode) {
  switch (mode) {
    case SampleMode::kDefault:
      return "default";
    case SampleMode::kTrain:
      return "train";
    case SampleMode::kTest:
      return "test";
    case SampleMode::kTenCrop:
      return "tencrop";
  }
  return "unknown";
}

CropPolicy ResolveCropPolicy(SampleMode mode, bool first_crop, bool train_center_first, bool test_center_first) {
  if (!first_crop) {
    return CropPolicy::kRandom;
  }
  switch (mode) {
    case SampleMode::kTrain:
      return train_center_first ? CropPolicy::kCenter : CropPolicy::kRandom;
    case SampleMode::kTest:
      return test_center_first ? CropPolicy::kCenter : CropPolicy::kRandom;
    case SampleMode::kTenCrop:
      return CropPolicy::kCenter;
    case SampleMode::kDefault:
      break;
  }
  return CropPolicy::kRandom;
}

TransformPipeline::TransformPipeline(shared_ptr<const io::ImageDecoder> decoder, const io::ImageDim& shape)
  : decoder_(decoder), shape_(shape)
{
  if (!decoder_) {
    throw std::invalid_argument("TransformPipeline needs a decoder");
  }
  if (1 != shape_.channels && 3 != shape_.channels) {
    throw std::invalid_argument("sample shape must have 1 or 3 channels");
  }
  if (0 == shape_.width || 0 == shape_.height) {
    throw std::invalid_argument("sample shape must have a non-zero width and height");
  }
}

SampleStatus TransformPipeline::load(const string& path, cv::Mat& img) const {
  if (!decoder_->decode(path, img) || img.empty()) {
    return SampleStatus::kDecodeFailure;
  }
  const int img_channels = img.channels();
  if (CV_8U != img.depth() || (1 != img_channels && 3 != img_channels && 4 != img_channels)) {
    return SampleStatus::kDecodeFailure;
  }
  io::ReplicateGrayChannels(img);
  io::ConvertByteToFloatImage(img);
  io::ConvertFloatImageToYUV(img, 1 == shape_.channels);
  return SampleStatus::kOk;
}

SampleStatus TransformPipeline::crop(const cv::Mat& img, CropPolicy policy, std::mt19937_64* rng, float* dst) const {
  if (static_cast<size_t>(img.channels()) != shape_.channels) {
    return SampleStatus::kShapeMismatch;
  }
  if (static_cast<size_t>(img.cols) < shape_.width || static_cast<size_t>(img.rows) < shape_.height) {
    return SampleStatus::kUndersizedSource;
  }
  cv::Mat patch = img;
  if (CropPolicy::kCenter == policy) {
    io::CenterCrop crop_cfg = { shape_.width, shape_.height };
    io::TransformImage(crop_cfg, patch, rng);
  } else {
    io::UniformRandomCrop crop_cfg = { shape_.width, shape_.height };
    io::TransformImage(crop_cfg, patch, rng);
  }
  io::ImageToPlanarFloat(patch, dst);
  return SampleStatus::kOk;
}

void TransformPipeline::ten_crop(const cv::Mat& img, float* dst) const {
  const size_t img_width = img.cols;
  const size_t img_height = img.rows;
  if (static_cast<size_t>(img.channels()) != shape_.channels
      || img_width < shape_.width || img_height < shape_.height) {
    std::stringstream msg;
    msg << "ten-crop needs a " << shape_.channels << "x" << shape_.height << "x" << shape_.width
        << " window, source is " << img.channels() << "x" << img_height << "x" << img_width;
    throw ShapeMismatchError(msg.str());
  }
  const size_t right = img_width - shape_.width;
  const size_t bottom = img_height - shape_.height;
  const size_t offsets[5][2] = {
    { right / 2, bottom / 2 },
    { 0, 0 },
    { right, 0 },
    { 0, bottom },
    { right, bottom },
  };
  const size_t stride = sample_size();
  cv::Mat flipped;
  for (size_t k = 0; k < 5; ++k) {
    io::OffsetCrop crop_cfg = { offsets[k][0], offsets[k][1], shape_.width, shape_.height };
    cv::Mat patch = img;
    io::TransformImage(crop_cfg, patch, NULL);
    io::ImageToPlanarFloat(patch, dst + (2 * k) * stride);
    io::XFlipImage(io::XFlip(), patch, flipped);
    io::ImageToPlanarFloat(flipped, dst + (2 * k + 1) * stride);
  }
}

} // namespace patchset
