#include "device.hpp"
#include "string_utils.hpp"

namespace
{

bool contains_any(const std::string &haystack, const std::vector<std::string> &keywords)
{
    for (const auto &keyword : keywords)
    {
        if (contains(haystack, keyword))
            return true;
    }
    return false;
}

} // namespace

const char *to_string(DeviceClass cls)
{
    switch (cls)
    {
    case DeviceClass::Unknown:
        return "Unknown";
    case DeviceClass::Camera:
        return "Camera";
    case DeviceClass::NVR:
        return "NVR";
    case DeviceClass::Router:
        return "Router";
    case DeviceClass::NetworkDevice:
        return "Network Device";
    case DeviceClass::Server:
        return "Server";
    case DeviceClass::Custom:
        return "Custom";
    }
    return "Unknown";
}

std::vector<int> default_ports(DeviceClass cls)
{
    switch (cls)
    {
    case DeviceClass::Camera:
    case DeviceClass::NVR:
        return {22, 80, 443, 554};
    case DeviceClass::Router:
    case DeviceClass::NetworkDevice:
    case DeviceClass::Server:
        return {22, 80, 443};
    default:
        return {80, 443};
    }
}

DeviceClass classify_vendor(const std::string &vendor)
{
    std::string v = to_lower(vendor);

    if (contains_any(v, {"hikvision", "dahua", "axis", "vivotek", "hanwha", "reolink"}))
        return DeviceClass::Camera;
    if (contains_any(v, {"synology", "qnap"}))
        return DeviceClass::NVR;
    if (contains(v, "mikrotik"))
        return DeviceClass::Router;
    if (contains_any(v, {"ubiquiti", "ui.com", "cisco", "juniper", "aruba", "hpe"}))
        return DeviceClass::NetworkDevice;
    return DeviceClass::Unknown;
}

std::string service_name(int port)
{
    switch (port)
    {
    case 22:
        return "SSH";
    case 80:
    case 8081:
    case 8082:
    case 8083:
        return "HTTP";
    case 443:
        return "HTTPS";
    case 554:
        return "RTSP";
    case 8080:
        return "HTTP-ALT";
    case 8443:
        return "HTTPS-ALT";
    case 5000:
    case 5001:
        return "UPnP";
    default:
        return "Port " + std::to_string(port);
    }
}
