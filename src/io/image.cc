#include "patchset/io/image.hh"
#include "patchset/io/mmap.hh"

#include <opencv2/core/core.hpp>
#include <opencv2/imgcodecs/imgcodecs.hpp>
#include <opencv2/imgproc/imgproc.hpp>

#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace patchset {
namespace io {

using std::string;
using std::vector;

bool OpenCVDecoder::decode(const string& path, cv::Mat& img) const {
  img.release();
  MmapROFile mapped_file(path);
  if (!mapped_file.is_open()) {
    if (verbose_) {
      std::clog << "WARNING: failed to open " << path << std::endl;
    }
    return false;
  }
  try {
    if (!DecodeImage(mapped_file.datum(), img)) {
      if (verbose_) {
        std::clog << "WARNING: failed to load " << path << std::endl;
      }
      return false;
    }
  } catch (const cv::Exception& e) {
    if (verbose_) {
      std::clog << "WARNING: opencv failed to decode " << path << ": " << e.what() << std::endl;
    }
    img.release();
    return false;
  }
  return true;
}

bool DecodeImage(Datum datum, cv::Mat& img) {
  cv::_InputArray buf(datum.buffer, datum.size);
  img = cv::imdecode(buf, cv::IMREAD_ANYCOLOR);
  return !img.empty();
}

void ReplicateGrayChannels(cv::Mat& img) {
  const size_t img_channels = img.channels();
  if (3 == img_channels) {
    return;
  }
  cv::Mat src_img = img;
  img.release();
  if (1 == img_channels) {
    cv::cvtColor(src_img, img, cv::COLOR_GRAY2BGR);
  } else if (4 == img_channels) {
    cv::cvtColor(src_img, img, cv::COLOR_BGRA2BGR);
  } else {
    assert(0 && "unreachable");
  }
  src_img.release();
}

void ConvertByteToFloatImage(cv::Mat& img) {
  const size_t img_channels = img.channels();
  assert(img_channels == 3);
  cv::Mat src_img = img;
  img.release();
  src_img.convertTo(img, CV_32FC3, 1.0 / 255.0);
  src_img.release();
}

void ConvertFloatImageToYUV(cv::Mat& img, bool keep_luma_only) {
  assert(img.type() == CV_32FC3);
  cv::Mat src_img = img;
  img.release();
  cv::cvtColor(src_img, img, cv::COLOR_BGR2YUV);
  src_img.release();
  if (keep_luma_only) {
    src_img = img;
    img.release();
    cv::extractChannel(src_img, img, 0);
    src_img.release();
  }
}

// Writes the (float) raster as planar channel-height-width.
void ImageToPlanarFloat(const cv::Mat& img, float* dst) {
  const size_t channels = img.channels();
  const size_t width = img.cols;
  const size_t height = img.rows;
  assert(img.depth() == CV_32F);
  const size_t plane = width * height;
  for (size_t h = 0; h < height; ++h) {
    const float* row_ptr = img.ptr<float>(h);
    for (size_t w = 0; w < width; ++w) {
      for (size_t c = 0; c < channels; ++c) {
        dst[c * plane + h * width + w] = row_ptr[c + channels * w];
      }
    }
  }
}

template <>
void TransformImage(const UniformRandomCrop& cfg, cv::Mat& img, std::mt19937_64* rng) {
  const size_t width = img.cols;
  const size_t height = img.rows;
  assert(cfg.crop_width <= width);
  assert(cfg.crop_height <= height);
  std::uniform_int_distribution<size_t> dist_w_(0UL, width - cfg.crop_width);
  std::uniform_int_distribution<size_t> dist_h_(0UL, height - cfg.crop_height);
  size_t offset_h = dist_h_(*rng);
  size_t offset_w = dist_w_(*rng);
  cv::Mat src_img = img;
  cv::Rect crop_roi = cv::Rect(offset_w, offset_h, cfg.crop_width, cfg.crop_height);
  img.release();
  img = src_img(crop_roi);
  src_img.release();
}

template <>
void TransformImage(const CenterCrop& cfg, cv::Mat& img, std::mt19937_64* rng) {
  const size_t width = img.cols;
  const size_t height = img.rows;
  assert(cfg.crop_width <= width);
  assert(cfg.crop_height <= height);
  size_t offset_w = (width - cfg.crop_width) / 2;
  size_t offset_h = (height - cfg.crop_height) / 2;
  cv::Mat src_img = img;
  cv::Rect crop_roi = cv::Rect(offset_w, offset_h, cfg.crop_width, cfg.crop_height);
  img.release();
  img = src_img(crop_roi);
  src_img.release();
}

template <>
void TransformImage(const OffsetCrop& cfg, cv::Mat& img, std::mt19937_64* rng) {
  assert(cfg.offset_w + cfg.crop_width <= static_cast<size_t>(img.cols));
  assert(cfg.offset_h + cfg.crop_height <= static_cast<size_t>(img.rows));
  cv::Mat src_img = img;
  cv::Rect crop_roi = cv::Rect(cfg.offset_w, cfg.offset_h, cfg.crop_width, cfg.crop_height);
  img.release();
  img = src_img(crop_roi);
  src_img.release();
}

template <>
void XFlipImage(const XFlip& cfg, const cv::Mat& src_img, cv::Mat& img) {
  cv::flip(src_img, img, 1);
}

} // namespace io
} // namespace patchset
