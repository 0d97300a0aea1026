#include <agentlink/version.hpp>

namespace agentlink
{

// Exported to the agent process as AGENTLINK_SDK_VERSION
std::string version_string()
{
    static const std::string version = std::to_string(VERSION_MAJOR) + "." +
                                       std::to_string(VERSION_MINOR) + "." +
                                       std::to_string(VERSION_PATCH);
    return version;
}

} // namespace agentlink
