#pragma once
#include <optional>
#include <string>

namespace cmdgate {

enum class ErrorKind {
  PolicyViolation,
  ToolNotFound,
  MissingPlaceholder,
  DuplicateName,
  NotFound,
  SpawnFailure,
  NonZeroExit,
  Timeout,
  CheckpointFailure,
  InvalidArgument,
  PolicyStoreFailure,
};

const char *to_string(ErrorKind k);

struct Failure {
  ErrorKind kind;
  std::string message;
};

inline Failure make_failure(ErrorKind k, std::string msg) {
  return Failure{k, std::move(msg)};
}

} // namespace cmdgate
