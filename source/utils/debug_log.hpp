#ifndef TOOLGATE_DEBUG_LOG_HPP
#define TOOLGATE_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if TOOLGATE_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [toolgate] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [toolgate] prefix unconditionally.
// Used for operational events (startup, bind, stream open/close, faults).
void notice(const std::string &message);

} // namespace debug_log

#endif // TOOLGATE_DEBUG_LOG_HPP
