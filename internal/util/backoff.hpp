#pragma once

#include <algorithm>
#include <chrono>
#include <thread>

namespace sessionkeeper::util {

/*
  Exponential backoff state for retrying store writes and driver spins.
*/
struct Backoff {
  std::chrono::milliseconds initial{200};
  std::chrono::milliseconds max{5000};
  std::chrono::milliseconds current{200};

  Backoff() = default;
  Backoff(std::chrono::milliseconds initial_delay, std::chrono::milliseconds max_delay)
      : initial(initial_delay), max(std::max(initial_delay, max_delay)), current(initial_delay) {
  }

  void Reset() {
    current = initial;
  }

  std::chrono::milliseconds Next() {
    auto v  = current;
    current = std::min(max, current * 2);
    return v;
  }

  void Wait() {
    std::this_thread::sleep_for(Next());
  }
};

} // namespace sessionkeeper::util
