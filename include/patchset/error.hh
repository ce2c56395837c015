#ifndef PATCHSET_ERROR_HH
#define PATCHSET_ERROR_HH

#include <stdexcept>
#include <string>

namespace patchset {

using std::string;

class Error : public std::runtime_error {
public:
  explicit Error(const string& what)
    : std::runtime_error(what) {}
};

// No class directory contained a single matching image file.
class NoImagesFoundError : public Error {
public:
  explicit NoImagesFoundError(const string& what)
    : Error(what) {}
};

class EmptyClassError : public Error {
public:
  explicit EmptyClassError(const string& class_name)
    : Error("class has zero samples: " + class_name), class_name_(class_name) {}

  const string& class_name() const {
    return class_name_;
  }

private:
  string class_name_;
};

class ShapeMismatchError : public Error {
public:
  explicit ShapeMismatchError(const string& what)
    : Error(what) {}
};

class SamplingExhaustedError : public Error {
public:
  explicit SamplingExhaustedError(const string& what)
    : Error(what) {}
};

class EnumerationError : public Error {
public:
  explicit EnumerationError(const string& what)
    : Error(what) {}
};

/**
  * Outcome of producing one sample from one path. Anything other than `kOk`
  * is recoverable: balanced sampling retries the draw, indexed access
  * zero-fills the slot.
  */
enum class SampleStatus {
  kOk = 0,
  kDecodeFailure,
  kUndersizedSource,
  kShapeMismatch,
};

const char* SampleStatusName(SampleStatus status);

} // namespace patchset

#endif
