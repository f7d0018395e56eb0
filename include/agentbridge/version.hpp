#ifndef AGENTBRIDGE_VERSION_HPP
#define AGENTBRIDGE_VERSION_HPP

#include <string>

namespace agentbridge
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace agentbridge

#endif // AGENTBRIDGE_VERSION_HPP
