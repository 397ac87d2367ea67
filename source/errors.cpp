#include <cmdgate/errors.hpp>

namespace cmdgate {

const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::PolicyViolation:    return "PolicyViolation";
  case ErrorKind::ToolNotFound:       return "ToolNotFound";
  case ErrorKind::MissingPlaceholder: return "MissingPlaceholder";
  case ErrorKind::DuplicateName:      return "DuplicateName";
  case ErrorKind::NotFound:           return "NotFound";
  case ErrorKind::SpawnFailure:       return "SpawnFailure";
  case ErrorKind::NonZeroExit:        return "NonZeroExit";
  case ErrorKind::Timeout:            return "Timeout";
  case ErrorKind::CheckpointFailure:  return "CheckpointFailure";
  case ErrorKind::InvalidArgument:    return "InvalidArgument";
  case ErrorKind::PolicyStoreFailure: return "PolicyStoreFailure";
  }
  return "Unknown";
}

} // namespace cmdgate
