#ifndef AGENTCTL_VERSION_HPP
#define AGENTCTL_VERSION_HPP

#include <string>

namespace agentctl
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// Control protocol revision spoken by this library
constexpr int PROTOCOL_REVISION = 1;

std::string version_string();

} // namespace agentctl

#endif // AGENTCTL_VERSION_HPP
