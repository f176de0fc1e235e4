// Repository: LogVault
// Component: System time source
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_TIME_SYSTEM_TIME_SOURCE_HPP_
#define LOGVAULT_TIME_SYSTEM_TIME_SOURCE_HPP_

#include <chrono>
#include <memory>

#include "logvault/time/ITimeSource.hpp"

namespace logvault::time {

class SystemTimeSource : public ITimeSource {
 public:
  int64_t NowUtcMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()).count();
  }
};

// Shared default instance for components constructed without an injected
// time source.
inline std::shared_ptr<ITimeSource> DefaultTimeSource() {
  static const std::shared_ptr<ITimeSource> instance =
      std::make_shared<SystemTimeSource>();
  return instance;
}

}  // namespace logvault::time

#endif  // LOGVAULT_TIME_SYSTEM_TIME_SOURCE_HPP_
