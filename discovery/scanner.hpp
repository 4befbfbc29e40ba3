#ifndef SCANNER_HPP
#define SCANNER_HPP

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "cancellation.hpp"
#include "device.hpp"
#include "oui_table.hpp"
#include "gateway/gateway.hpp"

// Called once per processed ARP entry with the running count
using ScanProgress = std::function<void(size_t)>;

// Finds LAN hosts through the gateway: flood ping, ARP read, vendor
// lookup and classification.
class DiscoveryScanner
{
private:
    Gateway &gateway;
    const OuiRegistry &registry;

public:
    explicit DiscoveryScanner(Gateway &gateway, const OuiRegistry &registry = system_oui_registry())
        : gateway(gateway), registry(registry)
    {
    }

    // Sorted by last octet. A failed flood ping is only logged; a failed
    // ARP read propagates.
    std::vector<DiscoveredDevice> scan(const std::string &subnet, const CancellationScope &cancel,
                                       const ScanProgress &progress = nullptr);
};

#endif
