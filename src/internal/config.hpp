#ifndef AGENTLINK_INTERNAL_CONFIG_HPP
#define AGENTLINK_INTERNAL_CONFIG_HPP

#include <chrono>

namespace agentlink
{
namespace internal
{

// Environment variable holding the stream close timeout in milliseconds
constexpr const char* kStreamCloseTimeoutEnv = "AGENTLINK_STREAM_CLOSE_TIMEOUT";

// Handshake timeout: the configured value, raised by the environment
// override when that is larger
std::chrono::milliseconds resolve_initialize_timeout(std::chrono::milliseconds configured);

// Stream close timeout: a positive environment override replaces the
// configured value
std::chrono::milliseconds resolve_stream_close_timeout(std::chrono::milliseconds configured);

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_CONFIG_HPP
