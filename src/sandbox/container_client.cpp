#include <sandforge/sandbox/container_client.hpp>

namespace sandforge {

std::string ContainerInspection::host_port(int container_port) const {
    std::map<std::string, PortBinding>::const_iterator it =
        ports.find(std::to_string(container_port) + "/tcp");
    if (it == ports.end()) {
        return "";
    }
    return it->second.host_port;
}

} // namespace sandforge
