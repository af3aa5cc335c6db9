#ifndef FRAMESYNC_DEBUG_LOG_HPP
#define FRAMESYNC_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if FRAMESYNC_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [framesync] prefix only when is_debug_enabled().
void log(const std::string &message);

// Always written to stderr, tagged "warning:" / "error:".
void warn(const std::string &message);
void error(const std::string &message);

} // namespace debug_log

#endif // FRAMESYNC_DEBUG_LOG_HPP
