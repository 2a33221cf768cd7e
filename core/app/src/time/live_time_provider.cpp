#include "auction/time/live_time_provider.hpp"

#include "auction/time/time_utils.hpp"

#include <chrono>

namespace auction {

std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace auction
