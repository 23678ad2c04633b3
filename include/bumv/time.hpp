#pragma once
#include <ctime>
#include <string>

namespace bumv::timeutil {

// Local time as "YYYYmmdd_HHMMSS" (used in rename log file names)
auto log_timestamp(std::time_t when) -> std::string;

} // namespace bumv::timeutil
