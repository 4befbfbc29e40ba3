#include "port_allocator.hpp"
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "errors.hpp"
#include "network_utils.hpp"

int port_base(int remote_port)
{
    switch (remote_port)
    {
    case 443:
        return 4430;
    case 80:
        return 8030;
    case 22:
        return 2230;
    case 554:
        return 5540;
    default:
        return 10000 + remote_port * 10;
    }
}

int local_port_for(const std::string &remote_ip, int remote_port)
{
    return port_base(remote_port) + last_octet(remote_ip);
}

int PortAllocator::allocate(const std::string &remote_ip, int remote_port)
{
    std::lock_guard<std::mutex> lock(mutex);

    int port = local_port_for(remote_ip, remote_port);
    for (int i = 0; i < PORT_PROBE_WINDOW; i++)
    {
        int candidate = port + i;
        if (candidate > MAX_PORT)
            break;

        if (allocated.find(candidate) == allocated.end())
        {
            allocated[candidate] = PortMapping{candidate, remote_ip, remote_port};
            return candidate;
        }
    }

    throw ResourceError("no available local port for " + join_host_port(remote_ip, remote_port));
}

void PortAllocator::release(int local_port)
{
    std::lock_guard<std::mutex> lock(mutex);
    allocated.erase(local_port);
}

std::vector<PortMapping> PortAllocator::mappings() const
{
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<PortMapping> result;
    result.reserve(allocated.size());
    for (const auto &entry : allocated)
        result.push_back(entry.second);
    return result;
}

std::vector<TunnelSpec> specs_for(const std::vector<DeviceSelection> &selection, PortAllocator &allocator)
{
    std::vector<TunnelSpec> specs;
    for (const auto &device : selection)
    {
        for (int remote_port : device.ports)
        {
            try
            {
                int local = allocator.allocate(device.ip, remote_port);
                specs.push_back(TunnelSpec{device.ip, remote_port, local});
            }
            catch (const ResourceError &e)
            {
                spdlog::warn("Skipping {}: {}", join_host_port(device.ip, remote_port), e.what());
            }
        }
    }
    return specs;
}
