#include "patchset/error.hh"
#include "patchset/index.hh"
#include "patchset/normalizer.hh"
#include "patchset/sampler.hh"
#include "patchset/transform.hh"
#include "test_util.hh"

#include "gtest/gtest.h"

#include <opencv2/core/core.hpp>

#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace patchset;
using patchset::testing::FakeDecoder;
using patchset::testing::MakeIndex;
using patchset::testing::MakePatternImage;
using std::make_shared;
using std::map;
using std::shared_ptr;
using std::string;
using std::vector;

namespace {

SamplerConfig MakeConfig(size_t width, size_t height) {
  SamplerConfig config;
  config.shape.width = width;
  config.shape.height = height;
  config.shape.channels = 3;
  return config;
}

vector<string> NumberedPaths(const string& prefix, size_t count) {
  vector<string> paths;
  for (size_t i = 0; i < count; ++i) {
    paths.push_back(prefix + std::to_string(i) + ".jpg");
  }
  return paths;
}

} // namespace

class SamplerTest : public ::testing::Test {
protected:
  SamplerTest()
    : decoder_(make_shared<FakeDecoder>(MakePatternImage(8, 8, 3, 1))),
      index_(MakeIndex({
          NumberedPaths("/data/class0/a", 2),
          NumberedPaths("/data/class1/b", 3),
          NumberedPaths("/data/class2/c", 4)})) {}

  shared_ptr<FakeDecoder> decoder_;
  shared_ptr<const ImageIndex> index_;
};

TEST_F(SamplerTest, RejectsBadConstruction) {
  SamplerConfig config = MakeConfig(4, 4);
  EXPECT_THROW(Sampler(nullptr, decoder_, config, 0), std::invalid_argument);
  config.samples_per_image = 0;
  EXPECT_THROW(Sampler(index_, decoder_, config, 0), std::invalid_argument);
}

TEST_F(SamplerTest, BatchHasExactSize) {
  Sampler sampler(index_, decoder_, MakeConfig(4, 4), 7);
  SampleBatch batch = sampler.sample(13);
  ASSERT_EQ(13UL, batch.size());
  EXPECT_EQ(13UL * 48UL, batch.samples.size());
  EXPECT_EQ(0UL, batch.num_failed_draws);
  const PathStore& store = index_->store();
  for (size_t i = 0; i < batch.size(); ++i) {
    EXPECT_EQ(SampleStatus::kOk, batch.status[i]);
    bool found = false;
    for (size_t k = 0; k < store.size(); ++k) {
      if (store.path(k) == batch.paths[i]) {
        EXPECT_EQ(store.label(k), batch.labels[i]);
        found = true;
      }
    }
    EXPECT_TRUE(found) << batch.paths[i];
  }
  EXPECT_THROW(sampler.sample(0), std::invalid_argument);
}

TEST(SamplerBalanceTest, ClassesAreDrawnUniformly) {
  auto decoder = make_shared<FakeDecoder>(MakePatternImage(3, 3, 3, 0));
  auto index = MakeIndex({
      NumberedPaths("/data/class0/", 1),
      NumberedPaths("/data/class1/", 9),
      NumberedPaths("/data/class2/", 90)});
  Sampler sampler(index, decoder, MakeConfig(2, 2), 1234);
  const size_t num_draws = 100000;
  SampleBatch batch = sampler.sample(num_draws);
  vector<size_t> counts(3, 0);
  for (size_t i = 0; i < batch.size(); ++i) {
    ++counts.at(batch.labels[i]);
  }
  for (size_t c = 0; c < 3; ++c) {
    EXPECT_NEAR(1.0 / 3.0, counts[c] / static_cast<double>(num_draws), 0.01);
  }
}

TEST(SamplerRetryTest, CorruptFilesAreRedrawn) {
  auto decoder = make_shared<FakeDecoder>(MakePatternImage(8, 8, 3, 0));
  auto index = MakeIndex({
      {"/data/class0/corrupt.jpg", "/data/class0/ok.jpg"},
      {"/data/class1/ok.jpg"}});
  Sampler sampler(index, decoder, MakeConfig(4, 4), 99);
  SampleBatch batch = sampler.sample(200);
  ASSERT_EQ(200UL, batch.size());
  EXPECT_GT(batch.num_failed_draws, 0UL);
  for (size_t i = 0; i < batch.size(); ++i) {
    EXPECT_EQ(string::npos, batch.paths[i].find("corrupt"));
    EXPECT_EQ(SampleStatus::kOk, batch.status[i]);
  }
}

TEST(SamplerRetryTest, UndersizedImagesAreRedrawn) {
  auto decoder = make_shared<FakeDecoder>(MakePatternImage(8, 8, 3, 0));
  decoder->set_image("/data/class1/small.jpg", MakePatternImage(2, 9, 3, 0));
  auto index = MakeIndex({
      {"/data/class0/ok.jpg"},
      {"/data/class1/small.jpg", "/data/class1/ok.jpg"}});
  Sampler sampler(index, decoder, MakeConfig(4, 4), 5);
  SampleBatch batch = sampler.sample(200);
  EXPECT_GT(batch.num_failed_draws, 0UL);
  for (size_t i = 0; i < batch.size(); ++i) {
    EXPECT_NE("/data/class1/small.jpg", batch.paths[i]);
  }
}

TEST(SamplerRetryTest, RetryCeilingThrows) {
  auto decoder = make_shared<FakeDecoder>(MakePatternImage(8, 8, 3, 0));
  auto index = MakeIndex({
      {"/data/class0/corrupt.jpg"},
      {"/data/class1/ok.jpg"}});
  SamplerConfig config = MakeConfig(4, 4);
  config.max_retries = 5;
  Sampler sampler(index, decoder, config, 3);
  EXPECT_THROW(sampler.sample(1000), SamplingExhaustedError);
}

TEST_F(SamplerTest, CropsOfOneImageAreScattered) {
  SamplerConfig config = MakeConfig(4, 4);
  config.samples_per_image = 3;
  Sampler sampler(index_, decoder_, config, 11);
  SampleBatch batch = sampler.sample(20);
  ASSERT_EQ(60UL, batch.size());
  map<string, size_t> counts;
  size_t adjacent_runs = 0;
  for (size_t i = 0; i < batch.size(); ++i) {
    ASSERT_FALSE(batch.paths[i].empty());
    ++counts[batch.paths[i]];
    if (i + 2 < batch.size() && batch.paths[i] == batch.paths[i + 1] && batch.paths[i] == batch.paths[i + 2]) {
      ++adjacent_runs;
    }
  }
  for (auto iter = counts.begin(); iter != counts.end(); ++iter) {
    EXPECT_EQ(0UL, iter->second % 3) << iter->first;
  }
  EXPECT_LT(adjacent_runs, 20UL);

  SampleBatch override_batch = sampler.sample(4, 2);
  EXPECT_EQ(8UL, override_batch.size());
}

TEST_F(SamplerTest, TrainCenterFirstUsesCenterCrop) {
  SamplerConfig config = MakeConfig(4, 4);
  config.mode = SampleMode::kTrain;
  config.train_center_first = true;
  Sampler sampler(index_, decoder_, config, 21);

  cv::Mat img;
  ASSERT_EQ(SampleStatus::kOk, sampler.transform().load("/data/any.jpg", img));
  vector<float> center(sampler.transform().sample_size());
  ASSERT_EQ(SampleStatus::kOk, sampler.transform().crop(img, CropPolicy::kCenter, nullptr, center.data()));

  SampleBatch batch = sampler.sample(10);
  for (size_t i = 0; i < batch.size(); ++i) {
    const vector<float> sample(batch.sample(i), batch.sample(i) + batch.sample_size());
    EXPECT_EQ(center, sample);
  }
}

TEST_F(SamplerTest, IndexFollowsRequestOrder) {
  SamplerConfig config = MakeConfig(4, 4);
  config.mode = SampleMode::kTest;
  config.test_center_first = true;
  Sampler sampler(index_, decoder_, config, 0);
  const PathStore& store = index_->store();

  SampleBatch batch = sampler.index({3, 0, 8, 3});
  ASSERT_EQ(4UL, batch.size());
  EXPECT_EQ(store.path(3), batch.paths[0]);
  EXPECT_EQ(store.path(0), batch.paths[1]);
  EXPECT_EQ(store.path(8), batch.paths[2]);
  EXPECT_EQ(1U, batch.labels[0]);
  EXPECT_EQ(0U, batch.labels[1]);
  EXPECT_EQ(2U, batch.labels[2]);

  EXPECT_EQ(batch.paths[0], batch.paths[3]);

  SampleBatch again = sampler.index({3});
  EXPECT_EQ(batch.paths[0], again.paths[0]);
  EXPECT_EQ(batch.labels[0], again.labels[0]);
  EXPECT_EQ(vector<float>(batch.sample(0), batch.sample(0) + batch.sample_size()), again.samples);
  EXPECT_EQ(9UL, index_->size());

  EXPECT_THROW(sampler.index({store.size()}), std::out_of_range);
  EXPECT_EQ(0UL, sampler.index({}).size());
}

TEST(SamplerIndexTest, FailedSlotsAreZeroFilled) {
  auto decoder = make_shared<FakeDecoder>(MakePatternImage(8, 8, 3, 0));
  decoder->set_image("/data/class1/small.jpg", MakePatternImage(2, 2, 3, 0));
  auto index = MakeIndex({
      {"/data/class0/corrupt.jpg", "/data/class0/ok.jpg"},
      {"/data/class1/small.jpg"}});
  Sampler sampler(index, decoder, MakeConfig(4, 4), 0);
  SampleBatch batch = sampler.index({0, 1, 2});
  EXPECT_EQ(SampleStatus::kDecodeFailure, batch.status[0]);
  EXPECT_EQ(SampleStatus::kOk, batch.status[1]);
  EXPECT_EQ(SampleStatus::kUndersizedSource, batch.status[2]);
  EXPECT_EQ("/data/class0/corrupt.jpg", batch.paths[0]);
  EXPECT_EQ(1U, batch.labels[2]);
  for (size_t k = 0; k < batch.sample_size(); ++k) {
    EXPECT_EQ(0.0f, batch.sample(0)[k]);
    EXPECT_EQ(0.0f, batch.sample(2)[k]);
  }
}

TEST_F(SamplerTest, TenCropIsIndexedOnly) {
  SamplerConfig config = MakeConfig(4, 4);
  config.mode = SampleMode::kTenCrop;
  Sampler sampler(index_, decoder_, config, 0);
  SampleBatch batch = sampler.index({1, 6});
  ASSERT_EQ(20UL, batch.size());
  for (size_t j = 0; j < 10; ++j) {
    EXPECT_EQ(index_->store().path(1), batch.paths[j]);
    EXPECT_EQ(index_->store().path(6), batch.paths[10 + j]);
    EXPECT_EQ(2U, batch.labels[10 + j]);
  }
  EXPECT_THROW(sampler.sample(4), std::invalid_argument);

  Sampler random_sampler(index_, decoder_, MakeConfig(4, 4), 0);
  EXPECT_THROW(random_sampler.sample(4, 1, SampleMode::kTenCrop), std::invalid_argument);
}

TEST_F(SamplerTest, SeedMakesSamplingReproducible) {
  SamplerConfig config = MakeConfig(4, 4);
  config.samples_per_image = 2;
  Sampler first(index_, decoder_, config, 2024);
  Sampler second(index_, decoder_, config, 2024);
  SampleBatch a = first.sample(16);
  SampleBatch b = second.sample(16);
  EXPECT_EQ(a.samples, b.samples);
  EXPECT_EQ(a.labels, b.labels);
  EXPECT_EQ(a.paths, b.paths);

  first.seed(5);
  second.seed(5);
  EXPECT_EQ(first.sample(8).samples, second.sample(8).samples);
}

TEST_F(SamplerTest, AttachedNormalizerIsApplied) {
  SamplerConfig config = MakeConfig(4, 4);
  Sampler raw(index_, decoder_, config, 77);
  config.normalize = true;
  Sampler normalized(index_, decoder_, config, 77);

  NormalizationStats stats;
  stats.mean = {0.5, 0.25, -0.25};
  stats.std = {2.0, 0.5, 0.0};
  auto normalizer = make_shared<Normalizer>();
  normalizer->set_stats(stats);
  normalized.set_normalizer(normalizer);

  SampleBatch expected = raw.sample(6);
  SampleBatch actual = normalized.sample(6);
  ASSERT_EQ(expected.samples.size(), actual.samples.size());
  const size_t plane = 16;
  for (size_t i = 0; i < expected.size(); ++i) {
    for (size_t c = 0; c < 3; ++c) {
      const double stddev = stats.std[c] > 0.0 ? stats.std[c] : 1.0;
      for (size_t p = 0; p < plane; ++p) {
        EXPECT_NEAR((expected.sample(i)[c * plane + p] - stats.mean[c]) / stddev,
            actual.sample(i)[c * plane + p], 1e-5);
      }
    }
  }
}

TEST_F(SamplerTest, IndexModeOverride) {
  SamplerConfig config = MakeConfig(4, 4);
  config.mode = SampleMode::kTest;
  config.test_center_first = true;
  Sampler sampler(index_, decoder_, config, 0);

  SampleBatch ten = sampler.index({1, 6}, SampleMode::kTenCrop);
  ASSERT_EQ(20UL, ten.size());
  EXPECT_EQ(index_->store().path(6), ten.paths[10]);
  EXPECT_EQ(2U, ten.labels[19]);

  // The first of ten crops is the center crop the configured test mode gives.
  SampleBatch center = sampler.index({1});
  ASSERT_EQ(1UL, center.size());
  EXPECT_EQ(center.samples, vector<float>(ten.sample(0), ten.sample(0) + ten.sample_size()));

  SampleBatch same = sampler.index({1}, SampleMode::kTest);
  EXPECT_EQ(center.samples, same.samples);
}
