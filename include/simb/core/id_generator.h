#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace simb::core {

// Abstract ID generator interface for dependency injection.
// Production code uses random UUIDs while tests use deterministic IDs.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Generate next ID with given prefix.
  // Contract: returned ID is non-empty and starts with prefix.
  // An empty prefix yields the bare ID with no separator.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// Production ID generator: RFC 4122 version 4 UUID from OS randomness.
// IDs do not encode creation time, so they leak nothing about message ordering.
class UuidIdGenerator final : public IIdGenerator {
 public:
  UuidIdGenerator() = default;
  ~UuidIdGenerator() override = default;

  UuidIdGenerator(const UuidIdGenerator&) = delete;
  UuidIdGenerator& operator=(const UuidIdGenerator&) = delete;
  UuidIdGenerator(UuidIdGenerator&&) = delete;
  UuidIdGenerator& operator=(UuidIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;
};

// Deterministic ID generator: sequential counter only.
// For tests where reproducible output is required.
// Thread-safe. Same sequence of next() calls produces same IDs.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  // Not copyable or movable (contains atomic counter)
  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace simb::core
