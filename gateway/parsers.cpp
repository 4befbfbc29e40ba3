#include "parsers.hpp"
#include <cstdio>
#include <map>
#include <regex>
#include <set>
#include "string_utils.hpp"

namespace
{

const std::regex ipv4_re(R"(\d+\.\d+\.\d+\.\d+)");
const std::regex mac_re(R"([0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2}:[0-9A-Fa-f]{2})");

bool in_subnet(const std::string &ip, const std::string &subnet)
{
    return subnet.empty() || starts_with(ip, subnet + ".");
}

std::map<std::string, std::string> parse_key_values(const std::string &cfg)
{
    std::map<std::string, std::string> kv;
    for (const auto &raw : split_lines(cfg))
    {
        std::string key, value;
        if (cut(trim(raw), "=", key, value))
            kv[key] = value;
    }
    return kv;
}

std::string lookup(const std::map<std::string, std::string> &kv, const std::string &key)
{
    auto it = kv.find(key);
    return it == kv.end() ? "" : it->second;
}

// Value of the first key=value field named key on any line
std::string first_field_value(const std::string &out, const std::string &key)
{
    for (const auto &line : split_lines(out))
    {
        for (const auto &field : split_fields(line))
        {
            std::string k, v;
            if (cut(field, "=", k, v) && k == key)
                return v;
        }
    }
    return "";
}

} // namespace

std::string strip_cidr_suffix(const std::string &addr)
{
    return addr.substr(0, addr.find('/'));
}

std::string subnet_from_cidr(const std::string &cidr)
{
    std::string ip = strip_cidr_suffix(cidr);
    std::vector<std::string> parts = split(ip, '.');
    if (parts.size() >= 3)
        return parts[0] + "." + parts[1] + "." + parts[2];
    return ip;
}

std::string cidr_from_mask(const std::string &mask)
{
    int octets[4];
    if (mask.empty() || std::sscanf(mask.c_str(), "%d.%d.%d.%d", &octets[0], &octets[1], &octets[2], &octets[3]) != 4)
        return "/24";

    int bits = 0;
    for (int octet : octets)
    {
        for (int i = 7; i >= 0; i--)
        {
            if ((octet & (1 << i)) == 0)
                return "/" + std::to_string(bits);
            bits++;
        }
    }
    return "/" + std::to_string(bits);
}

bool is_private_ipv4(const std::string &ip)
{
    int a, b;
    if (std::sscanf(ip.c_str(), "%d.%d.", &a, &b) < 2)
        return false;
    return a == 10 || (a == 172 && b >= 16 && b <= 31) || (a == 192 && b == 168);
}

std::vector<ArpEntry> parse_arp_fallback(const std::string &out, const std::string &subnet)
{
    std::vector<ArpEntry> entries;
    for (const auto &raw : split_lines(out))
    {
        std::string line = trim(raw);
        if (line.empty() || contains(line, "FAILED"))
            continue;

        std::smatch ip, mac;
        if (!std::regex_search(line, ip, ipv4_re) || !std::regex_search(line, mac, mac_re))
            continue;
        if (!in_subnet(ip.str(), subnet))
            continue;

        ArpEntry entry;
        entry.ip = ip.str();
        entry.mac = to_upper(mac.str());
        entries.push_back(entry);
    }
    return entries;
}

std::pair<std::string, std::string> parse_terse_address(const std::string &out)
{
    for (const auto &raw : split_lines(out))
    {
        std::string addr, iface;
        for (const auto &field : split_fields(raw))
        {
            std::string k, v;
            if (!cut(field, "=", k, v))
                continue;
            if (k == "address" && addr.empty())
                addr = v;
            else if (k == "interface" && iface.empty())
                iface = v;
        }
        if (!addr.empty())
            return {addr, iface};
    }
    return {"", ""};
}

std::string parse_terse_route_gateway(const std::string &out)
{
    return first_field_value(out, "gateway");
}

std::pair<std::string, std::string> parse_terse_pool(const std::string &out)
{
    std::string ranges = first_field_value(out, "ranges");
    std::string start, end;
    if (cut(ranges, "-", start, end))
        return {start, end};
    return {ranges, ""};
}

std::vector<ArpEntry> parse_terse_arp(const std::string &out, const std::string &subnet)
{
    static const std::regex terse_re(R"(^\s*\d+\s+(\S*)\s+(\d+\.\d+\.\d+\.\d+)\s+([0-9A-Fa-f:]{17})\s+(\S+))");

    std::vector<ArpEntry> entries;
    for (const auto &line : split_lines(out))
    {
        std::smatch m;
        if (!std::regex_search(line, m, terse_re))
            continue;
        if (!in_subnet(m[2].str(), subnet))
            continue;

        ArpEntry entry;
        entry.flags = m[1].str();
        entry.ip = m[2].str();
        entry.mac = to_upper(m[3].str());
        entry.interface = m[4].str();
        entries.push_back(entry);
    }
    return entries;
}

std::string parse_system_cfg_wan(const std::string &cfg)
{
    auto kv = parse_key_values(cfg);
    if (lookup(kv, "ppp.1.status") == "enabled")
        return "ppp0";
    return "";
}

SystemCfgLan parse_system_cfg_lan(const std::string &cfg)
{
    auto kv = parse_key_values(cfg);

    for (int i = 1; i <= 10; i++)
    {
        std::string prefix = "netconf." + std::to_string(i);
        std::string ip = lookup(kv, prefix + ".ip");
        if (lookup(kv, prefix + ".role") == "lan" && !ip.empty())
            return SystemCfgLan{lookup(kv, prefix + ".devname"), ip, lookup(kv, prefix + ".netmask")};
    }

    // airOS serves DHCP on the LAN interface
    std::string dhcp_dev = lookup(kv, "dhcpd.1.devname");
    if (!dhcp_dev.empty())
    {
        for (int i = 1; i <= 10; i++)
        {
            std::string prefix = "netconf." + std::to_string(i);
            if (lookup(kv, prefix + ".devname") == dhcp_dev)
                return SystemCfgLan{dhcp_dev, lookup(kv, prefix + ".ip"), lookup(kv, prefix + ".netmask")};
        }
    }

    return SystemCfgLan{};
}

std::pair<std::string, std::string> parse_system_cfg_dhcp(const std::string &cfg)
{
    auto kv = parse_key_values(cfg);
    return {lookup(kv, "dhcpd.1.start"), lookup(kv, "dhcpd.1.end")};
}

std::string parse_ifconfig_inet_addr(const std::string &out)
{
    static const std::regex inet_re(R"(inet addr:(\d+\.\d+\.\d+\.\d+))");
    std::smatch m;
    return std::regex_search(out, m, inet_re) ? m[1].str() : "";
}

std::string parse_ifconfig_mask(const std::string &out)
{
    static const std::regex mask_re(R"(Mask:(\d+\.\d+\.\d+\.\d+))");
    std::smatch m;
    return std::regex_search(out, m, mask_re) ? m[1].str() : "";
}

std::vector<ArpEntry> parse_busybox_arp(const std::string &out, const std::string &subnet)
{
    static const std::regex busybox_re(R"(\((\d+\.\d+\.\d+\.\d+)\)\s+at\s+([0-9A-Fa-f:]{17})\s+\[(\w+)\]\s+on\s+(\S+))");

    std::vector<ArpEntry> entries;
    for (auto it = std::sregex_iterator(out.begin(), out.end(), busybox_re); it != std::sregex_iterator(); ++it)
    {
        const std::smatch &m = *it;
        if (!in_subnet(m[1].str(), subnet))
            continue;

        ArpEntry entry;
        entry.ip = m[1].str();
        entry.mac = to_upper(m[2].str());
        entry.interface = m[4].str();
        entries.push_back(entry);
    }
    return entries;
}

std::string parse_linux_inet_addr(const std::string &out)
{
    static const std::regex inet_re(R"(inet\s+(\d+\.\d+\.\d+\.\d+(?:/\d+)?))");
    std::smatch m;
    return std::regex_search(out, m, inet_re) ? m[1].str() : "";
}

std::vector<LanCandidate> discover_lan_interfaces(const std::string &out, bool has_ppp)
{
    static const std::regex addr_re(R"(\d+:\s+(\S+)\s+inet\s+(\d+\.\d+\.\d+\.\d+(?:/\d+)?))");

    std::set<std::string> wan_ifaces = {"lo", "ppp0", "pppoe0"};
    if (!has_ppp)
        wan_ifaces.insert("eth0");

    std::vector<LanCandidate> results;
    for (auto it = std::sregex_iterator(out.begin(), out.end(), addr_re); it != std::sregex_iterator(); ++it)
    {
        std::string iface = (*it)[1].str();
        std::string addr = (*it)[2].str();
        if (wan_ifaces.count(iface) || !is_private_ipv4(strip_cidr_suffix(addr)))
            continue;
        results.push_back(LanCandidate{iface, addr});
    }
    return results;
}

std::string parse_linux_default_gateway(const std::string &out)
{
    for (const auto &line : split_lines(out))
    {
        std::vector<std::string> fields = split_fields(line);
        for (size_t i = 0; i + 1 < fields.size(); i++)
        {
            if (fields[i] == "via")
                return fields[i + 1];
        }
    }
    return "";
}

std::pair<std::string, std::string> parse_dnsmasq_range(const std::string &out)
{
    for (const auto &raw : split_lines(out))
    {
        std::string line = trim(raw);
        if (!starts_with(line, "dhcp-range"))
            continue;

        std::string key, value;
        if (!cut(line, "=", key, value))
            continue;
        std::vector<std::string> parts = split(value, ',');
        if (parts.size() >= 2)
            return {trim(parts[0]), trim(parts[1])};
    }
    return {"", ""};
}

std::pair<std::string, std::string> parse_config_boot_dhcp(const std::string &out, const std::string &subnet)
{
    std::vector<std::string> lines = split_lines(out);
    for (size_t i = 0; i < lines.size(); i++)
    {
        std::string trimmed = trim(lines[i]);
        if (!starts_with(trimmed, "start "))
            continue;

        std::vector<std::string> fields = split_fields(trimmed);
        if (fields.size() < 2 || !in_subnet(fields[1], subnet))
            continue;

        std::string start = fields[1];
        std::string end;
        for (size_t j = i + 1; j < lines.size() && j < i + 10; j++)
        {
            std::string inner = trim(lines[j]);
            if (starts_with(inner, "stop "))
            {
                std::vector<std::string> parts = split_fields(inner);
                if (parts.size() >= 2)
                    end = parts[1];
                break;
            }
            if (inner == "}")
                break;
        }
        return {start, end};
    }
    return {"", ""};
}

std::vector<ArpEntry> parse_ip_neigh(const std::string &out, const std::string &subnet, bool &matched)
{
    static const std::regex neigh_re(R"(^(\d+\.\d+\.\d+\.\d+)\s+dev\s+(\S+)\s+lladdr\s+([0-9A-Fa-f:]{17})\s+(\S+))");

    matched = false;
    std::vector<ArpEntry> entries;
    for (const auto &line : split_lines(out))
    {
        std::smatch m;
        if (!std::regex_search(line, m, neigh_re))
            continue;
        matched = true;

        std::string state = m[4].str();
        if (!in_subnet(m[1].str(), subnet) || to_upper(state) == "FAILED")
            continue;

        ArpEntry entry;
        entry.ip = m[1].str();
        entry.interface = m[2].str();
        entry.mac = to_upper(m[3].str());
        entry.flags = state;
        entries.push_back(entry);
    }
    return entries;
}
