#ifndef PATCHSET_IO_IMAGE_HH
#define PATCHSET_IO_IMAGE_HH

#include "patchset/io/mmap.hh"

#include <opencv2/core/core.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

namespace patchset {
namespace io {

using std::string;

class ImageDim {
public:
  size_t width;
  size_t height;
  size_t channels;
};

/**
  * Decoder boundary. Implementations fill `img` with an 8-bit raster of 1, 3
  * or 4 channels (OpenCV BGR order) and return false on any failure; they
  * never throw for malformed input.
  */
class ImageDecoder {
public:
  virtual ~ImageDecoder() {}

  virtual bool decode(const string& path, cv::Mat& img) const = 0;
};

class OpenCVDecoder : public virtual ImageDecoder {
public:
  explicit OpenCVDecoder(bool verbose = false)
    : verbose_(verbose) {}
  virtual ~OpenCVDecoder() {}

  virtual bool decode(const string& path, cv::Mat& img) const;

private:
  bool verbose_;
};

bool DecodeImage(Datum datum, cv::Mat& img);
void ReplicateGrayChannels(cv::Mat& img);
void ConvertByteToFloatImage(cv::Mat& img);
void ConvertFloatImageToYUV(cv::Mat& img, bool keep_luma_only);
void ImageToPlanarFloat(const cv::Mat& img, float* dst);

class UniformRandomCrop {
public:
  size_t crop_width;
  size_t crop_height;
};

class CenterCrop {
public:
  size_t crop_width;
  size_t crop_height;
};

class OffsetCrop {
public:
  size_t offset_w;
  size_t offset_h;
  size_t crop_width;
  size_t crop_height;
};

template <typename TransformConfig>
void TransformImage(const TransformConfig& cfg, cv::Mat& img, std::mt19937_64* rng);

template <>
void TransformImage(const UniformRandomCrop& cfg, cv::Mat& img, std::mt19937_64* rng);
template <>
void TransformImage(const CenterCrop& cfg, cv::Mat& img, std::mt19937_64* rng);
template <>
void TransformImage(const OffsetCrop& cfg, cv::Mat& img, std::mt19937_64* rng);

class XFlip {};

template <typename XFlipConfig>
void XFlipImage(const XFlipConfig& cfg, const cv::Mat& src_img, cv::Mat& img);

template <>
void XFlipImage(const XFlip& cfg, const cv::Mat& src_img, cv::Mat& img);

} // namespace io
} // namespace patchset

#endif
