#ifndef DUPLEX_CORE_RESULT_H
#define DUPLEX_CORE_RESULT_H

#include <cstddef>
#include <string>
#include <type_traits>
#include <utility>

#include "duplex/core/compat.h"

namespace duplex {

// Error codes shared by the library. Values are stable so they can be logged
// and compared across components.
enum ErrorCode : int {
  kErrorUnknown = -1,
  kErrorRequestOverlap = 100,
  kErrorBodyTooLarge = 101,
  kErrorPrematureClose = 102,
  kErrorCompressionFailure = 103,
  kErrorDecode = 104,
  kErrorConfigParse = 200,
  kErrorIo = 300
};

struct Error {
  int code{kErrorUnknown};
  std::string message;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<typename std::decay<T>::type> makeSuccess(T&& value) {
  return Result<typename std::decay<T>::type>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool isError(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

}  // namespace duplex

#endif  // DUPLEX_CORE_RESULT_H
