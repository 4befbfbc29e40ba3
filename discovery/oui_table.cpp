#include "oui_table.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <spdlog/spdlog.h>
#include "string_utils.hpp"

namespace
{

const char *HIKVISION = "Hangzhou Hikvision Digital Technology Co.,Ltd.";
const char *DAHUA = "Zhejiang Dahua Technology Co., Ltd.";
const char *AXIS = "Axis Communications AB";
const char *MIKROTIK = "Mikrotikls SIA";
const char *UBIQUITI = "Ubiquiti Inc";
const char *CISCO = "Cisco Systems, Inc";
const char *JUNIPER = "Juniper Networks";
const char *ARUBA = "Aruba, a Hewlett Packard Enterprise Company";
const char *QNAP = "QNAP Systems, Inc.";

// Vendors the classifier knows about, used when no registry file is
// installed or the registry lacks the prefix.
const std::unordered_map<std::string, std::string> &builtin_table()
{
    static const std::unordered_map<std::string, std::string> table = {
        // Cameras
        {"C0:56:E3", HIKVISION},
        {"44:19:B6", HIKVISION},
        {"28:57:BE", HIKVISION},
        {"BC:AD:28", HIKVISION},
        {"4C:BD:8F", HIKVISION},
        {"3C:EF:8C", DAHUA},
        {"90:02:A9", DAHUA},
        {"E0:50:8B", DAHUA},
        {"00:40:8C", AXIS},
        {"AC:CC:8E", AXIS},
        {"B8:A4:4F", AXIS},
        {"00:02:D1", "Vivotek Inc."},
        {"00:09:18", "Hanwha Techwin Co., Ltd."},
        {"EC:71:DB", "Reolink Innovation Limited"},

        // NVR / NAS
        {"00:11:32", "Synology Incorporated"},
        {"24:5E:BE", QNAP},
        {"00:08:9B", QNAP},

        // Routers
        {"4C:5E:0C", MIKROTIK},
        {"64:D1:54", MIKROTIK},
        {"D4:CA:6D", MIKROTIK},
        {"E4:8D:8C", MIKROTIK},
        {"6C:3B:6B", MIKROTIK},
        {"B8:69:F4", MIKROTIK},
        {"CC:2D:E0", MIKROTIK},
        {"74:4D:28", MIKROTIK},
        {"48:8F:5A", MIKROTIK},
        {"DC:2C:6E", MIKROTIK},
        {"18:FD:74", MIKROTIK},
        {"2C:C8:1B", MIKROTIK},

        // Switches, access points, firewalls
        {"24:A4:3C", UBIQUITI},
        {"04:18:D6", UBIQUITI},
        {"68:72:51", UBIQUITI},
        {"80:2A:A8", UBIQUITI},
        {"F0:9F:C2", UBIQUITI},
        {"78:8A:20", UBIQUITI},
        {"B4:FB:E4", UBIQUITI},
        {"FC:EC:DA", UBIQUITI},
        {"74:83:C2", UBIQUITI},
        {"E0:63:DA", UBIQUITI},
        {"24:5A:4C", UBIQUITI},
        {"DC:9F:DB", UBIQUITI},
        {"44:D9:E7", UBIQUITI},
        {"18:E8:29", UBIQUITI},
        {"00:00:0C", CISCO},
        {"00:1A:A1", CISCO},
        {"58:97:BD", CISCO},
        {"00:05:85", JUNIPER},
        {"2C:6B:F5", JUNIPER},
        {"00:0B:86", ARUBA},
        {"24:DE:C6", ARUBA},
    };
    return table;
}

const char *REGISTRY_PATHS[] = {
    "/usr/share/ieee-data/oui.txt",
    "/var/lib/ieee-data/oui.txt",
    "/usr/share/arp-scan/ieee-oui.txt",
    "/usr/share/nmap/nmap-mac-prefixes",
    "/usr/share/wireshark/manuf",
};

// "C0:56:E3" from "C0-56-E3", "C056E3" or "c0:56:e3", empty otherwise
std::string normalize_prefix(const std::string &text)
{
    std::string hex;
    for (char c : text)
    {
        if (std::isxdigit(static_cast<unsigned char>(c)))
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        else if (c != ':' && c != '-' && c != '.')
            return "";
    }
    if (hex.size() != 6)
        return "";
    return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
}

} // namespace

std::string oui_prefix(const std::string &mac)
{
    std::string hex;
    for (char c : mac)
    {
        if (std::isxdigit(static_cast<unsigned char>(c)))
            hex.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        else if (c != ':' && c != '-' && c != '.')
            return "";
    }
    if (hex.size() != 12)
        return "";

    return hex.substr(0, 2) + ":" + hex.substr(2, 2) + ":" + hex.substr(4, 2);
}

size_t OuiRegistry::load(std::istream &in)
{
    std::lock_guard<std::mutex> lock(mutex);
    size_t added = 0;
    bool ieee_layout = false;
    std::string line;

    while (std::getline(in, line))
    {
        std::string text = trim(line);
        if (text.empty() || text[0] == '#')
            continue;

        std::string prefix;
        std::string vendor;
        std::string before;
        std::string after;
        if (cut(text, "(hex)", before, after))
        {
            // IEEE oui.txt; every other line there is an address or a repeat
            ieee_layout = true;
            prefix = trim(before);
            vendor = trim(after);
        }
        else if (ieee_layout)
        {
            continue;
        }
        else
        {
            std::vector<std::string> columns = split(text, '\t');
            if (columns.size() >= 2)
            {
                // arp-scan and Wireshark manuf; manuf keeps the full name last
                prefix = trim(columns.front());
                vendor = trim(columns.back());
            }
            else if (cut(text, " ", before, after))
            {
                // nmap-mac-prefixes
                prefix = before;
                vendor = trim(after);
            }
        }

        std::string key = normalize_prefix(prefix);
        if (key.empty() || vendor.empty())
            continue;
        if (vendors.emplace(key, vendor).second)
            added++;
    }
    return added;
}

size_t OuiRegistry::load_file(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        return 0;
    return load(in);
}

std::string OuiRegistry::find(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex);
    auto it = vendors.find(prefix);
    return it == vendors.end() ? "" : it->second;
}

size_t OuiRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return vendors.size();
}

OuiRegistry &system_oui_registry()
{
    static OuiRegistry registry;
    static std::once_flag loaded;
    std::call_once(loaded, [] {
        std::vector<std::string> candidates;
        if (const char *override_path = std::getenv("LMTM_OUI_FILE"))
            candidates.push_back(override_path);
        candidates.insert(candidates.end(), std::begin(REGISTRY_PATHS), std::end(REGISTRY_PATHS));

        for (const auto &path : candidates)
        {
            size_t count = registry.load_file(path);
            if (count > 0)
            {
                spdlog::debug("Loaded {} OUI prefixes from {}", count, path);
                return;
            }
        }
        spdlog::debug("No OUI registry installed, using the built-in vendor table");
    });
    return registry;
}

std::string lookup_vendor(const std::string &mac, const OuiRegistry &registry)
{
    std::string prefix = oui_prefix(mac);
    if (prefix.empty())
        return "Unknown";

    std::string vendor = registry.find(prefix);
    if (!vendor.empty())
        return vendor;

    const auto &table = builtin_table();
    auto it = table.find(prefix);
    return it == table.end() ? "Unknown" : it->second;
}

std::string lookup_vendor(const std::string &mac)
{
    return lookup_vendor(mac, system_oui_registry());
}
