#include "scanner.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "network_utils.hpp"

std::vector<DiscoveredDevice> DiscoveryScanner::scan(const std::string &subnet, const CancellationScope &cancel,
                                                     const ScanProgress &progress)
{
    try
    {
        gateway.flood_ping(subnet, cancel);
    }
    catch (const TunnelerError &e)
    {
        spdlog::debug("Flood ping of {}.0/24 failed, reading ARP table anyway: {}", subnet, e.what());
    }

    std::vector<ArpEntry> entries = gateway.arp_table(subnet, cancel);

    std::vector<DiscoveredDevice> devices;
    devices.reserve(entries.size());
    for (const auto &entry : entries)
    {
        DiscoveredDevice device;
        device.ip = entry.ip;
        device.mac = entry.mac;
        device.vendor = lookup_vendor(entry.mac, registry);
        device.device_class = classify_vendor(device.vendor);
        device.default_ports = default_ports(device.device_class);
        device.online = true;
        devices.push_back(device);

        if (progress)
            progress(devices.size());
    }

    std::stable_sort(devices.begin(), devices.end(), [](const DiscoveredDevice &a, const DiscoveredDevice &b) {
        return last_octet(a.ip) < last_octet(b.ip);
    });

    spdlog::info("Discovered {} devices on {}.0/24", devices.size(), subnet);
    return devices;
}
