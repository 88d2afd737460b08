#pragma once
#include <cstdint>
#include <ctime>
#include <string>

namespace recstore {

// UTC, second resolution: "2025-08-16T14:32:10Z"
std::string iso_utc(std::time_t t);
std::string now_iso();
int64_t now_epoch();

} // namespace recstore
