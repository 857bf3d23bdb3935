#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace beacon::core {

// IIdGenerator mints trace ids ("trace-...") and audit event ids ("evt-...").
// Pipelines take it by reference so tests can replay a fixed sequence.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with prefix.
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// prefix-<microseconds>-<counter>. Safe to share across feed workers.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  ~SystemIdGenerator() override = default;

  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// prefix-<counter>, one counter for every prefix, starting at 0.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  DeterministicIdGenerator() = default;
  ~DeterministicIdGenerator() override = default;

  DeterministicIdGenerator(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator& operator=(const DeterministicIdGenerator&) = delete;
  DeterministicIdGenerator(DeterministicIdGenerator&&) = delete;
  DeterministicIdGenerator& operator=(DeterministicIdGenerator&&) = delete;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

}  // namespace beacon::core
