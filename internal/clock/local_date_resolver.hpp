#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>

#include "internal/util/date.hpp"
#include "internal/util/time.hpp"

namespace availability::clock {

/*
  Resolves an instructor's local calendar date ("today").

  Injected into the engine so guardrails never consult a live clock or a
  timezone service directly; tests pin the date.
*/
class LocalDateResolver {
 public:
  virtual ~LocalDateResolver() = default;

  // An empty instructor id resolves with the deployment default.
  virtual util::Date Today(const std::string& instructor_id) const = 0;
};

/*
  One fixed UTC offset per instructor, with a default for everyone else.
*/
class FixedOffsetResolver final : public LocalDateResolver {
 public:
  using NowFn = std::function<util::TimePoint()>;

  FixedOffsetResolver(std::chrono::minutes default_offset, std::unordered_map<std::string, std::chrono::minutes> instructor_offsets,
                      NowFn now = &util::Now);

  util::Date Today(const std::string& instructor_id) const override;

  std::chrono::minutes OffsetFor(const std::string& instructor_id) const;

 private:
  std::chrono::minutes                                  default_offset_;
  std::unordered_map<std::string, std::chrono::minutes> instructor_offsets_;
  NowFn                                                 now_;
};

// Same date for every instructor.
class FixedDateResolver final : public LocalDateResolver {
 public:
  explicit FixedDateResolver(util::Date today) : today_(today) {
  }

  util::Date Today(const std::string&) const override {
    return today_;
  }

  void Set(util::Date today) {
    today_ = today;
  }

 private:
  util::Date today_;
};

} // namespace availability::clock
