#pragma once

namespace LoOP {

/**
 * @brief Log level for controlling output verbosity.
 */
enum class LogLevel {
    LOG_ERROR = 0,  ///< Only errors
    LOG_WARN = 1,   ///< Errors and warnings
    LOG_INFO = 2,   ///< Normal operational messages
    LOG_DEBUG = 3   ///< Per-cluster pipeline progress
};

}  // namespace LoOP
