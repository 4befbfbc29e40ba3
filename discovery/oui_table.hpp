#ifndef OUI_TABLE_HPP
#define OUI_TABLE_HPP

#include <cstddef>
#include <istream>
#include <mutex>
#include <string>
#include <unordered_map>

// MAC prefix to manufacturer, loaded from an IEEE-derived registry file.
class OuiRegistry
{
private:
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::string> vendors;

public:
    // Understands IEEE oui.txt, arp-scan ieee-oui.txt, nmap-mac-prefixes and
    // Wireshark manuf. Returns the number of prefixes added.
    size_t load(std::istream &in);
    // 0 if the file cannot be read
    size_t load_file(const std::string &path);

    // Vendor for a "C0:56:E3" prefix, empty if not registered
    std::string find(const std::string &prefix) const;
    size_t size() const;
};

// Filled on first use from $LMTM_OUI_FILE or the first installed registry
// (ieee-data, arp-scan, nmap, wireshark).
OuiRegistry &system_oui_registry();

// Manufacturer for a MAC address: the registry first, then the compiled-in
// table of vendors the classifier knows.
// Accepts ':', '-' or '.' separated and bare hex forms in any case.
// Returns "Unknown" for unlisted prefixes or malformed input.
std::string lookup_vendor(const std::string &mac, const OuiRegistry &registry);
std::string lookup_vendor(const std::string &mac);

// "C0:56:E3" for any accepted MAC form, empty if malformed
std::string oui_prefix(const std::string &mac);

#endif
