#pragma once

#include <cstddef>
#include <utility>
#include <variant>

namespace simb::core {

// Error enumerations for expected collaborator failures.
// Each value names a condition the caller is expected to branch on.

enum class StorageError {
  kNotFound,
  kConflict,
  kUnavailable,
};

enum class KeyStoreError {
  kNotFound,              // no keystore file in the data directory
  kAuthenticationFailed,  // wrong passphrase or tampered ciphertext
  kCorrupt,               // file exists but is not a readable keystore
  kIoFailure,
};

// Result<T, E> encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace simb::core
