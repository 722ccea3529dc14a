#pragma once

#include <chrono>
#include <functional>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace common {

using Clock = std::function<TimestampSec()>;

inline TimestampSec now_unix_seconds() noexcept {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline Clock system_clock() {
  return [] { return now_unix_seconds(); };
}

}  // namespace common
}  // namespace lendcore
