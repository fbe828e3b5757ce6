#include <agentctl/version.hpp>
#include <sstream>

namespace agentctl
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH << " (protocol r"
        << PROTOCOL_REVISION << ")";
    return oss.str();
}

} // namespace agentctl
