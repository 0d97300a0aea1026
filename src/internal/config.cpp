#include "config.hpp"

#include "log.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace agentlink
{
namespace internal
{

namespace
{
std::optional<long long> read_timeout_env()
{
    const char* env = std::getenv(kStreamCloseTimeoutEnv);
    if (!env || !*env)
        return std::nullopt;

    try
    {
        std::size_t consumed = 0;
        long long parsed = std::stoll(env, &consumed);
        if (consumed != std::string(env).size())
            throw std::invalid_argument("trailing characters");
        return parsed;
    }
    catch (const std::exception&)
    {
        // Keep the configured value
        debug_log(std::string("ignoring unparseable ") + kStreamCloseTimeoutEnv + "=" + env);
        return std::nullopt;
    }
}
} // namespace

std::chrono::milliseconds resolve_initialize_timeout(std::chrono::milliseconds configured)
{
    auto parsed = read_timeout_env();
    if (parsed && *parsed > configured.count())
        return std::chrono::milliseconds(*parsed);
    return configured;
}

std::chrono::milliseconds resolve_stream_close_timeout(std::chrono::milliseconds configured)
{
    auto parsed = read_timeout_env();
    if (parsed && *parsed > 0)
        return std::chrono::milliseconds(*parsed);
    return configured;
}

} // namespace internal
} // namespace agentlink
