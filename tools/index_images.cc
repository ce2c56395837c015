#include "patchset/index.hh"
#include "patchset/index_builder.hh"
#include "patchset/io/enumerate.hh"
#include "patchset/io/image.hh"
#include "patchset/normalizer.hh"
#include "patchset/sampler.hh"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace patchset;
using std::make_shared;
using std::shared_ptr;
using std::string;

namespace {

int Usage(const char* program) {
  std::cerr << "usage: " << program << " <root> [batch_size] [num_batches] [find|native]" << std::endl;
  return 1;
}

// Positive decimal count, or 0 if `arg` is not one.
size_t ParseCount(const char* arg) {
  char* end = NULL;
  const unsigned long value = std::strtoul(arg, &end, 10);
  if (end == arg || '\0' != *end || '-' == arg[0]) {
    return 0;
  }
  return value;
}

} // namespace

int main(int argc, const char** argv) {
  if (argc < 2 || argc > 5) {
    return Usage(argv[0]);
  }
  const string root = argv[1];
  const size_t batch_size = argc > 2 ? ParseCount(argv[2]) : 128;
  const size_t num_batches = argc > 3 ? ParseCount(argv[3]) : 10;
  const string enumerator = argc > 4 ? argv[4] : "find";
  if (0 == batch_size || 0 == num_batches || ("find" != enumerator && "native" != enumerator)) {
    return Usage(argv[0]);
  }

  IndexBuilderConfig builder_config;
  builder_config.roots.push_back(root);
  if ("native" == enumerator) {
    builder_config.enumerator = make_shared<io::NativeFileEnumerator>();
  }
  builder_config.progress = [](const string& stage, size_t done, size_t total) {
    if ("paths" == stage && done == total) {
      std::clog << "DEBUG: materialized " << done << " paths" << std::endl;
    }
  };

  shared_ptr<const ImageIndex> index;
  try {
    auto start = std::chrono::steady_clock::now();
    index = make_shared<ImageIndex>(IndexBuilder(builder_config).build());
    auto diff = std::chrono::steady_clock::now() - start;
    std::clog << "DEBUG: index build: " << std::chrono::duration<double, std::milli>(diff).count() << " ms" << std::endl;
  } catch (const Error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  const ClassCatalog& catalog = index->catalog();
  for (size_t c = 0; c < catalog.num_classes(); ++c) {
    std::clog << "DEBUG:   class " << c << " " << catalog.name(c)
        << " samples: " << index->store().class_size(c) << std::endl;
  }

  SamplerConfig sampler_config;
  sampler_config.shape.width = 224;
  sampler_config.shape.height = 224;
  sampler_config.shape.channels = 3;
  sampler_config.mode = SampleMode::kTrain;
  sampler_config.normalize = true;
  sampler_config.verbose = true;
  sampler_config.max_retries = 100 * batch_size;

  shared_ptr<const io::ImageDecoder> decoder = make_shared<io::OpenCVDecoder>();
  shared_ptr<Normalizer> normalizer = make_shared<Normalizer>(true);

  try {
    Sampler sampler(index, decoder, sampler_config);
    normalizer->fit(&sampler, 10 * batch_size, batch_size, 2);
    sampler.set_normalizer(normalizer);

    double num_trials = 0.0;
    double avg_elapsed_ms = 0.0;
    auto start = std::chrono::steady_clock::now();
    for (size_t idx = 0; idx < num_batches; ++idx) {
      SampleBatch batch = sampler.sample(batch_size);
      auto lap = std::chrono::steady_clock::now();
      double elapsed_ms = std::chrono::duration<double, std::milli>(lap - start).count();
      start = lap;
      num_trials += 1.0;
      avg_elapsed_ms += (1.0 / num_trials) * (elapsed_ms - avg_elapsed_ms);
      std::clog << "DEBUG:   "
          << " batch: " << idx + 1
          << " failed draws: " << batch.num_failed_draws
          << " avg elapsed: " << avg_elapsed_ms << " ms" << std::endl;
    }
  } catch (const Error& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
