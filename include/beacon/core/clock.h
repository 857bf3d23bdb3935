#pragma once

#include <string>

namespace beacon::core {

// Abstract clock for timestamp injection.
// Production code uses system time; tests use a fixed timestamp.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current timestamp in ISO 8601 format (UTC). Never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// Returns a constant timestamp for reproducible audit output.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string fixed_time) : fixed_time_(std::move(fixed_time)) {}

  std::string now_iso8601() override;

 private:
  std::string fixed_time_;
};

}  // namespace beacon::core
