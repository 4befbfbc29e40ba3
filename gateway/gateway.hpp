#ifndef GATEWAY_HPP
#define GATEWAY_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "cancellation.hpp"

enum class GatewayType
{
    MikroTik,
    Ubiquiti,
    Unknown
};

const char *to_string(GatewayType type);

struct WanConfig
{
    std::string public_ip;
    std::string interface_name;
    std::string gateway;
};

struct LanConfig
{
    std::string subnet; // "10.0.0"
    std::string cidr;   // "10.0.0.1/24"
    std::string gateway_ip;
    std::string dhcp_start;
    std::string dhcp_end;
    std::string interface_name;
};

struct ArpEntry
{
    std::string ip;
    std::string mac; // upper case
    std::string interface;
    std::string flags;
};

// Runs one command on the gateway and returns its combined output.
// Throws ExecError.
using CommandRunner = std::function<std::string(const std::string &, const CancellationScope &)>;

// Accepts exactly three dot separated decimal octets, each 0-255 ("10.0.0").
// Must pass before a subnet is put into any command. Throws ValidationError.
void validate_subnet(const std::string &subnet);

// One vendor's command dialect. Chosen once by detect_gateway().
class Gateway
{
protected:
    CommandRunner run;

public:
    explicit Gateway(CommandRunner runner) : run(std::move(runner)) {}
    virtual ~Gateway() = default;

    virtual GatewayType type() const = 0;
    virtual std::string identity(const CancellationScope &cancel) = 0;
    virtual WanConfig wan_info(const CancellationScope &cancel) = 0;
    virtual LanConfig lan_info(const CancellationScope &cancel) = 0;
    // Sweeps subnet.1 to subnet.254 so the ARP table fills up
    virtual void flood_ping(const std::string &subnet, const CancellationScope &cancel) = 0;
    // Empty subnet returns every entry
    virtual std::vector<ArpEntry> arp_table(const std::string &subnet, const CancellationScope &cancel) = 0;
};

#endif
