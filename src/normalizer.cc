#include "patchset/normalizer.hh"
#include "patchset/sampler.hh"

#include <cmath>
#include <experimental/optional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace patchset {

using std::vector;

NormalizationStats Normalizer::BatchStats(const SampleBatch& batch) {
  const size_t channels = batch.shape.channels;
  const size_t plane = batch.shape.height * batch.shape.width;
  NormalizationStats stats;
  stats.mean.assign(channels, 0.0);
  stats.std.assign(channels, 0.0);
  vector<size_t> counts(channels, 0);

  for (size_t i = 0; i < batch.size(); ++i) {
    if (SampleStatus::kOk != batch.status[i]) {
      continue;
    }
    const float* sample = batch.sample(i);
    for (size_t c = 0; c < channels; ++c) {
      for (size_t p = 0; p < plane; ++p) {
        stats.mean[c] += sample[c * plane + p];
      }
      counts[c] += plane;
    }
  }
  for (size_t c = 0; c < channels; ++c) {
    if (counts[c] > 0) {
      stats.mean[c] /= static_cast<double>(counts[c]);
    }
  }

  for (size_t i = 0; i < batch.size(); ++i) {
    if (SampleStatus::kOk != batch.status[i]) {
      continue;
    }
    const float* sample = batch.sample(i);
    for (size_t c = 0; c < channels; ++c) {
      for (size_t p = 0; p < plane; ++p) {
        const double diff = sample[c * plane + p] - stats.mean[c];
        stats.std[c] += diff * diff;
      }
    }
  }
  for (size_t c = 0; c < channels; ++c) {
    if (counts[c] > 1) {
      stats.std[c] = std::sqrt(stats.std[c] / static_cast<double>(counts[c] - 1));
    } else {
      stats.std[c] = 0.0;
    }
  }
  return stats;
}

NormalizationStats Normalizer::fit(
    Sampler* sampler,
    size_t target_image_count,
    size_t batch_size,
    size_t samples_per_image)
{
  std::lock_guard<std::mutex> fit_lock(fit_mutex_);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (stats_) {
      if (verbose_) {
        std::clog << "DEBUG: return pre-computed mean std" << std::endl;
      }
      return *stats_;
    }
  }
  if (0 == target_image_count || 0 == batch_size) {
    throw std::invalid_argument("normalization needs a non-zero image count and batch size");
  }

  const size_t channels = sampler->config().shape.channels;
  const size_t num_batches = (target_image_count + batch_size - 1) / batch_size;
  if (verbose_) {
    std::clog << "DEBUG: normalization on " << target_image_count << " images x "
        << samples_per_image << " samples per image (batch size " << batch_size << ")" << std::endl;
  }
  NormalizationStats fitted;
  fitted.mean.assign(channels, 0.0);
  fitted.std.assign(channels, 0.0);
  for (size_t b = 0; b < num_batches; ++b) {
    SampleBatch batch = sampler->sample(batch_size, samples_per_image, SampleMode::kDefault);
    NormalizationStats batch_stats = BatchStats(batch);
    for (size_t c = 0; c < channels; ++c) {
      fitted.mean[c] += batch_stats.mean[c];
      fitted.std[c] += batch_stats.std[c];
    }
  }
  for (size_t c = 0; c < channels; ++c) {
    fitted.mean[c] /= static_cast<double>(num_batches);
    fitted.std[c] /= static_cast<double>(num_batches);
  }
  if (verbose_) {
    for (size_t c = 0; c < channels; ++c) {
      std::clog << "DEBUG: channel " << c << " mean: " << fitted.mean[c] << " std: " << fitted.std[c] << std::endl;
    }
  }

  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = fitted;
  return fitted;
}

bool Normalizer::fitted() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return static_cast<bool>(stats_);
}

optional<NormalizationStats> Normalizer::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

void Normalizer::set_stats(const NormalizationStats& stats) {
  if (stats.mean.size() != stats.std.size()) {
    throw std::invalid_argument("mean and std must have one entry per channel");
  }
  std::lock_guard<std::mutex> lock(stats_mutex_);
  if (stats_) {
    throw std::logic_error("normalization statistics are already set");
  }
  stats_ = stats;
}

void Normalizer::apply(SampleBatch* batch) const {
  optional<NormalizationStats> stats = this->stats();
  if (!stats) {
    return;
  }
  const size_t channels = batch->shape.channels;
  if (stats->mean.size() != channels) {
    throw std::invalid_argument("normalization statistics do not match the sample channels");
  }
  const size_t plane = batch->shape.height * batch->shape.width;
  for (size_t i = 0; i < batch->size(); ++i) {
    if (SampleStatus::kOk != batch->status[i]) {
      continue;
    }
    float* sample = batch->sample(i);
    for (size_t c = 0; c < channels; ++c) {
      const double mean = stats->mean[c];
      const double stddev = stats->std[c] > 0.0 ? stats->std[c] : 1.0;
      for (size_t p = 0; p < plane; ++p) {
        sample[c * plane + p] = static_cast<float>((sample[c * plane + p] - mean) / stddev);
      }
    }
  }
}

} // namespace patchset
