#pragma once

#include <spdlog/logger.h>

namespace imginfo::detail {

// Library logger; created on first use with the level from IMGINFO_LOG_LEVEL
[[nodiscard]] spdlog::logger& logger();

} // namespace imginfo::detail
