#include "patchset/error.hh"

namespace patchset {

const char* SampleStatusName(SampleStatus status) {
  switch (status) {
    case SampleStatus::kOk:
      return "ok";
    case SampleStatus::kDecodeFailure:
      return "decode failure";
    case SampleStatus::kUndersizedSource:
      return "undersized source";
    case SampleStatus::kShapeMismatch:
      return "shape mismatch";
  }
  return "unknown";
}

} // namespace patchset
