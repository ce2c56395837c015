#ifndef PATCHSET_NORMALIZER_HH
#define PATCHSET_NORMALIZER_HH

#include "patchset/sampler.hh"

#include <cstddef>
#include <experimental/optional>
#include <mutex>
#include <vector>

namespace patchset {

using std::experimental::optional;
using std::vector;

class NormalizationStats {
public:
  vector<double> mean;
  vector<double> std;
};

/**
  * Per-channel mean/std normalization. Starts unfitted; `fit` or `set_stats`
  * installs the statistics exactly once, after which they are read-only.
  * While unfitted, `apply` leaves batches unchanged.
  */
class Normalizer {
public:
  explicit Normalizer(bool verbose = false)
    : verbose_(verbose) {}

  /**
    * Estimate statistics from `ceil(target_image_count / batch_size)`
    * balanced batches drawn in default mode. The estimate is the average of
    * the per-batch means and standard deviations, not the exact moments of
    * the pooled data. Returns the cached statistics if already fitted;
    * concurrent calls serialize.
    */
  NormalizationStats fit(
      Sampler* sampler,
      size_t target_image_count = 10000,
      size_t batch_size = 128,
      size_t samples_per_image = 2);

  // Mean and unbiased std of every channel over the valid slots of `batch`.
  static NormalizationStats BatchStats(const SampleBatch& batch);

  bool fitted() const;
  optional<NormalizationStats> stats() const;
  void set_stats(const NormalizationStats& stats);

  // (x - mean) / std per channel, in place, skipping failed slots.
  void apply(SampleBatch* batch) const;

private:
  bool verbose_;
  std::mutex fit_mutex_;
  mutable std::mutex stats_mutex_;
  optional<NormalizationStats> stats_;
};

} // namespace patchset

#endif
