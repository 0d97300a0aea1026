#ifndef AGENTLINK_VERSION_HPP
#define AGENTLINK_VERSION_HPP

#include <string>

namespace agentlink
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace agentlink

#endif // AGENTLINK_VERSION_HPP
