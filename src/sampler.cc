#include "patchset/sampler.hh"
#include "patchset/error.hh"
#include "patchset/normalizer.hh"
#include "patchset/transform.hh"

#include <opencv2/core/core.hpp>

#include <algorithm>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace patchset {

using std::string;
using std::vector;

SampleBatch::SampleBatch(const io::ImageDim& shape, size_t num_samples)
  : shape(shape),
    samples(num_samples * shape.channels * shape.height * shape.width, 0.0f),
    labels(num_samples, 0),
    paths(num_samples),
    status(num_samples, SampleStatus::kOk),
    num_failed_draws(0) {}

Sampler::Sampler(shared_ptr<const ImageIndex> index, shared_ptr<const io::ImageDecoder> decoder, const SamplerConfig& config)
  : Sampler(index, decoder, config, std::random_device()()) {}

Sampler::Sampler(shared_ptr<const ImageIndex> index, shared_ptr<const io::ImageDecoder> decoder, const SamplerConfig& config, uint64_t seed)
  : index_(index), config_(config), transform_(decoder, config.shape), rng_(seed)
{
  if (!index_) {
    throw std::invalid_argument("Sampler needs an index");
  }
  if (0 == index_->size()) {
    throw std::invalid_argument("Sampler needs a non-empty index");
  }
  if (0 == config_.samples_per_image) {
    throw std::invalid_argument("samples_per_image must be at least 1");
  }
}

void Sampler::normalize(SampleBatch* batch) const {
  if (config_.normalize && normalizer_) {
    normalizer_->apply(batch);
  }
}

SampleBatch Sampler::index(const vector<size_t>& indices) {
  return index(indices, config_.mode);
}

SampleBatch Sampler::index(const vector<size_t>& indices, SampleMode mode) {
  const PathStore& store = index_->store();
  const bool ten_crop = (SampleMode::kTenCrop == mode);
  const size_t per_image = ten_crop ? 10 : 1;
  const CropPolicy policy = ResolveCropPolicy(
      mode, true, config_.train_center_first, config_.test_center_first);

  SampleBatch batch(transform_.shape(), indices.size() * per_image);
  cv::Mat img;
  for (size_t i = 0; i < indices.size(); ++i) {
    const size_t idx = indices[i];
    const string path = store.path(idx);
    const uint32_t label = store.label(idx);
    for (size_t j = 0; j < per_image; ++j) {
      batch.paths[i * per_image + j] = path;
      batch.labels[i * per_image + j] = label;
    }

    SampleStatus status = transform_.load(path, img);
    if (SampleStatus::kOk == status) {
      if (ten_crop) {
        transform_.ten_crop(img, batch.sample(i * per_image));
      } else {
        status = transform_.crop(img, policy, &rng_, batch.sample(i));
      }
    }
    if (SampleStatus::kOk != status) {
      float* dst = batch.sample(i * per_image);
      std::fill(dst, dst + per_image * batch.sample_size(), 0.0f);
      for (size_t j = 0; j < per_image; ++j) {
        batch.status[i * per_image + j] = status;
      }
      if (config_.verbose) {
        std::clog << "WARNING: index: " << SampleStatusName(status) << ": " << path << std::endl;
      }
    }
  }

  normalize(&batch);
  return batch;
}

SampleBatch Sampler::sample(size_t batch_size) {
  return sample(batch_size, config_.samples_per_image, config_.mode);
}

SampleBatch Sampler::sample(size_t batch_size, size_t samples_per_image) {
  return sample(batch_size, samples_per_image, config_.mode);
}

SampleBatch Sampler::sample(size_t batch_size, size_t samples_per_image, SampleMode mode) {
  if (SampleMode::kTenCrop == mode) {
    throw std::invalid_argument("ten-crop samples are only produced by indexed access");
  }
  if (0 == batch_size || 0 == samples_per_image) {
    throw std::invalid_argument("batch_size and samples_per_image must be at least 1");
  }
  const PathStore& store = index_->store();
  const size_t num_samples = batch_size * samples_per_image;

  SampleBatch batch(transform_.shape(), num_samples);
  vector<size_t> slots(num_samples);
  std::iota(slots.begin(), slots.end(), 0UL);
  std::shuffle(slots.begin(), slots.end(), rng_);

  std::uniform_int_distribution<uint32_t> dist_class(0, static_cast<uint32_t>(store.num_classes() - 1));
  cv::Mat img;
  size_t i = 0;
  while (i < batch_size) {
    const uint32_t class_index = dist_class(rng_);
    std::uniform_int_distribution<size_t> dist_pos(0UL, store.class_size(class_index) - 1UL);
    const size_t idx = store.class_position(class_index, dist_pos(rng_));
    const char* path = store.c_path(idx);

    SampleStatus status = transform_.load(path, img);
    for (size_t j = 0; j < samples_per_image && SampleStatus::kOk == status; ++j) {
      const size_t slot = slots[i * samples_per_image + j];
      const CropPolicy policy = ResolveCropPolicy(
          mode, 0 == j, config_.train_center_first, config_.test_center_first);
      // Every crop of one image has the same size, so only the first can fail.
      status = transform_.crop(img, policy, &rng_, batch.sample(slot));
      if (SampleStatus::kOk == status) {
        batch.paths[slot] = path;
        batch.labels[slot] = class_index;
      }
    }
    if (SampleStatus::kOk != status) {
      ++batch.num_failed_draws;
      if (config_.verbose) {
        std::clog << "WARNING: sample: " << SampleStatusName(status) << ": " << path << std::endl;
      }
      if (0 != config_.max_retries && batch.num_failed_draws > config_.max_retries) {
        throw SamplingExhaustedError(
            "gave up after " + std::to_string(batch.num_failed_draws) + " failed draws");
      }
      continue;
    }
    ++i;
  }

  normalize(&batch);
  return batch;
}

} // namespace patchset
