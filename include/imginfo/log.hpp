#ifndef IMGINFO_LOG_HPP_
#define IMGINFO_LOG_HPP_

#include <imginfo/imginfo_export.h>

namespace imginfo {

enum class log_level {
    off,
    error,
    warn,
    info,
    debug,
    trace
};

/**
 * Set the level of the library logger.
 * The initial level is read from the IMGINFO_LOG_LEVEL environment variable
 * ("off", "error", "warn", "info", "debug" or "trace"); it defaults to off.
 */
IMGINFO_EXPORT void set_log_level(log_level level);

[[nodiscard]] IMGINFO_EXPORT log_level get_log_level();

} // namespace imginfo

#endif // IMGINFO_LOG_HPP_
