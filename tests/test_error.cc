#include "patchset/error.hh"

#include "gtest/gtest.h"

#include <stdexcept>
#include <string>

using namespace patchset;

TEST(SampleStatusTest, EveryStatusHasAName) {
  EXPECT_STREQ("ok", SampleStatusName(SampleStatus::kOk));
  EXPECT_STREQ("decode failure", SampleStatusName(SampleStatus::kDecodeFailure));
  EXPECT_STREQ("undersized source", SampleStatusName(SampleStatus::kUndersizedSource));
  EXPECT_STREQ("shape mismatch", SampleStatusName(SampleStatus::kShapeMismatch));
}

TEST(ErrorTest, FatalErrorsAreRuntimeErrors) {
  try {
    throw EmptyClassError("n01440764");
  } catch (const std::runtime_error& e) {
    EXPECT_EQ(std::string("class has zero samples: n01440764"), e.what());
  }
  EXPECT_THROW(throw EnumerationError("find failed"), Error);
  EXPECT_THROW(throw SamplingExhaustedError("gave up"), Error);
}
