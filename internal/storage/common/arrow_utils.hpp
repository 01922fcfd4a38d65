#pragma once

#include <arrow/result.h>
#include <arrow/status.h>

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace nodeagent::storage::common {

/*
  Rethrows a failed Arrow status as the matching util error.
*/
inline void ThrowStatus(const arrow::Status& status) {
  if (status.IsInvalid()) throw util::InvalidArgument(status.message());
  if (status.IsCapacityError()) throw util::ResourceExhausted(status.message());
  if (status.IsKeyError()) throw util::NotFound(status.message());
  throw std::runtime_error(status.ToString());
}

/*
  Helper: unwrap Arrow Result<T> or throw
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) ThrowStatus(result.status());
  return std::move(result).ValueOrDie();
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) ThrowStatus(status);
}

} // namespace nodeagent::storage::common
