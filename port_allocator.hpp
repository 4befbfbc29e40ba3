#ifndef PORT_ALLOCATOR_HPP
#define PORT_ALLOCATOR_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

struct PortMapping
{
    int local_port;
    std::string remote_host;
    int remote_port;
};

struct TunnelSpec
{
    std::string remote_host;
    int remote_port;
    int local_port;
};

// Device picked for tunnelling, with the remote ports to forward
struct DeviceSelection
{
    std::string ip;
    std::string mac;
    std::vector<int> ports;
};

// 443 -> 4430, 80 -> 8030, 22 -> 2230, 554 -> 5540, anything else 10000 + 10 * port
int port_base(int remote_port);

// port_base(remote_port) + last octet of remote_ip
int local_port_for(const std::string &remote_ip, int remote_port);

// Deterministic local port assignment. Collisions bump to the next free
// port within a window of PORT_PROBE_WINDOW ports.
class PortAllocator
{
private:
    std::map<int, PortMapping> allocated;
    mutable std::mutex mutex;

public:
    // Throws ResourceError when the whole window is taken
    int allocate(const std::string &remote_ip, int remote_port);
    void release(int local_port);

    // Sorted by local port
    std::vector<PortMapping> mappings() const;
};

// One spec per selected port. Ports that cannot be allocated are logged
// and skipped.
std::vector<TunnelSpec> specs_for(const std::vector<DeviceSelection> &selection, PortAllocator &allocator);

#endif
