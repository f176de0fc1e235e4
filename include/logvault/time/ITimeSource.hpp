// Repository: LogVault
// Component: Time source interface
// Purpose: Wall-clock seam for cache expiry and circuit-breaker timing.
// Copyright (c) 2026 LogVault

#ifndef LOGVAULT_TIME_ITIME_SOURCE_HPP_
#define LOGVAULT_TIME_ITIME_SOURCE_HPP_

#include <cstdint>

namespace logvault::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;
};

}  // namespace logvault::time

#endif  // LOGVAULT_TIME_ITIME_SOURCE_HPP_
