#ifndef PATCHSET_SAMPLER_HH
#define PATCHSET_SAMPLER_HH

#include "patchset/error.hh"
#include "patchset/index.hh"
#include "patchset/io/image.hh"
#include "patchset/transform.hh"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace patchset {

using std::shared_ptr;
using std::string;
using std::vector;

class Normalizer;

class SampleBatch {
public:
  SampleBatch()
    : num_failed_draws(0) {}
  SampleBatch(const io::ImageDim& shape, size_t num_samples);

  size_t size() const {
    return labels.size();
  }
  size_t sample_size() const {
    return shape.channels * shape.height * shape.width;
  }
  float* sample(size_t i) {
    return samples.data() + i * sample_size();
  }
  const float* sample(size_t i) const {
    return samples.data() + i * sample_size();
  }

  io::ImageDim shape;
  // size() planar samples, back to back.
  vector<float> samples;
  vector<uint32_t> labels;
  vector<string> paths;
  // Per slot; indexed access leaves failed slots zero-filled.
  vector<SampleStatus> status;
  // Draws that were retried while filling the batch.
  size_t num_failed_draws;
};

class SamplerConfig {
public:
  SamplerConfig()
    : mode(SampleMode::kDefault),
      samples_per_image(1),
      train_center_first(false),
      test_center_first(false),
      normalize(false),
      max_retries(0),
      verbose(false)
  {
    shape.width = 0;
    shape.height = 0;
    shape.channels = 3;
  }

  io::ImageDim shape;
  SampleMode mode;
  size_t samples_per_image;
  bool train_center_first;
  bool test_center_first;
  // Apply the attached normalizer to every batch.
  bool normalize;
  // Failed draws tolerated by one `sample` call; 0 retries forever.
  size_t max_retries;
  bool verbose;
};

/**
  * Indexed and class-balanced access to an immutable index. A sampler owns
  * its random generator and is meant to be used by one thread; concurrent
  * workers each create their own sampler over the same index.
  */
class Sampler {
public:
  Sampler(shared_ptr<const ImageIndex> index, shared_ptr<const io::ImageDecoder> decoder, const SamplerConfig& config);
  Sampler(shared_ptr<const ImageIndex> index, shared_ptr<const io::ImageDecoder> decoder, const SamplerConfig& config, uint64_t seed);

  const SamplerConfig& config() const {
    return config_;
  }
  const ImageIndex& image_index() const {
    return *index_;
  }
  const TransformPipeline& transform() const {
    return transform_;
  }

  void seed(uint64_t seed) {
    rng_.seed(seed);
  }
  void set_normalizer(shared_ptr<const Normalizer> normalizer) {
    normalizer_ = normalizer;
  }

  /**
    * Materialize the samples at `indices`, in order. Samples that cannot be
    * produced are zero-filled and flagged in `SampleBatch::status`.
    * Throws `std::out_of_range` for a position past the end of the index.
    */
  SampleBatch index(const vector<size_t>& indices);
  SampleBatch index(const vector<size_t>& indices, SampleMode mode);

  /**
    * Draw `batch_size` images by picking a class uniformly, then an image of
    * that class uniformly, and cut `samples_per_image` crops from each. Crops
    * are scattered over a random permutation of the output slots. Failed
    * draws are retried, so the batch is never short.
    */
  SampleBatch sample(size_t batch_size);
  SampleBatch sample(size_t batch_size, size_t samples_per_image);
  SampleBatch sample(size_t batch_size, size_t samples_per_image, SampleMode mode);

private:
  void normalize(SampleBatch* batch) const;

  shared_ptr<const ImageIndex> index_;
  SamplerConfig config_;
  TransformPipeline transform_;
  shared_ptr<const Normalizer> normalizer_;
  std::mt19937_64 rng_;
};

} // namespace patchset

#endif
