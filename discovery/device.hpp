#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <string>
#include <vector>

enum class DeviceClass
{
    Unknown,
    Camera,
    NVR,
    Router,
    NetworkDevice,
    Server,
    Custom
};

const char *to_string(DeviceClass cls);

// Ports tunnelled by default for a class
std::vector<int> default_ports(DeviceClass cls);

// Case-insensitive keyword match on the vendor name, first match wins
DeviceClass classify_vendor(const std::string &vendor);

// "SSH", "HTTP", "RTSP", ... or "Port N"
std::string service_name(int port);

struct DiscoveredDevice
{
    std::string ip;
    std::string mac;
    std::string vendor;
    DeviceClass device_class;
    std::vector<int> default_ports;
    bool online;
};

#endif
