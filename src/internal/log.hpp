#ifndef AGENTLINK_INTERNAL_LOG_HPP
#define AGENTLINK_INTERNAL_LOG_HPP

#include <string>

namespace agentlink
{
namespace internal
{

// True when AGENTLINK_DEBUG is set to a non-empty value other than "0"
bool debug_enabled();

// "[DEBUG] agentlink: <message>" on stderr, only when debug is enabled
void debug_log(const std::string& message);

// "Warning: <message>" on stderr
void warn_log(const std::string& message);

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_LOG_HPP
