#include "log.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace agentlink
{
namespace internal
{

namespace
{
std::mutex& log_mutex()
{
    static std::mutex mutex;
    return mutex;
}
} // namespace

bool debug_enabled()
{
    const char* env = std::getenv("AGENTLINK_DEBUG");
    return env && *env && std::strcmp(env, "0") != 0;
}

void debug_log(const std::string& message)
{
    if (!debug_enabled())
        return;

    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "[DEBUG] agentlink: " << message << "\n";
}

void warn_log(const std::string& message)
{
    std::lock_guard<std::mutex> lock(log_mutex());
    std::cerr << "Warning: " << message << std::endl;
}

} // namespace internal
} // namespace agentlink
