#include "bumv/time.hpp"

#include <array>

#if defined(_WIN32)
#include <time.h>
#endif

namespace bumv::timeutil {

std::string log_timestamp(std::time_t t) {
  std::tm lt{};
#if defined(_WIN32)
  localtime_s(&lt, &t);
#else
  localtime_r(&t, &lt);
#endif
  std::array<char, 32> buf{};
  const std::size_t n = std::strftime(buf.data(), buf.size(), "%Y%m%d_%H%M%S", &lt);
  return std::string(buf.data(), n);
}

} // namespace bumv::timeutil
