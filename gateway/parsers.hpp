#ifndef GATEWAY_PARSERS_HPP
#define GATEWAY_PARSERS_HPP

#include <string>
#include <utility>
#include <vector>
#include "gateway.hpp"

// Output parsers for the gateway command dialects. All of them are
// tolerant: unknown lines are skipped and missing values come back empty.
// Wherever a subnet is given, only addresses inside "<subnet>." are kept.

// "10.0.0.1/24" -> "10.0.0.1"
std::string strip_cidr_suffix(const std::string &addr);
// "10.0.0.1/24" -> "10.0.0"
std::string subnet_from_cidr(const std::string &cidr);
// "255.255.255.0" -> "/24"; empty or malformed masks give "/24"
std::string cidr_from_mask(const std::string &mask);
// RFC 1918
bool is_private_ipv4(const std::string &ip);

// Bare IPv4 and MAC tokens, line by line. Lines containing FAILED are skipped.
std::vector<ArpEntry> parse_arp_fallback(const std::string &out, const std::string &subnet);

// RouterOS terse output

// First address= and its interface= (" 0 address=10.0.0.1/24 network=10.0.0.0 interface=bridge1")
std::pair<std::string, std::string> parse_terse_address(const std::string &out);
std::string parse_terse_route_gateway(const std::string &out);
// First ranges=a-b
std::pair<std::string, std::string> parse_terse_pool(const std::string &out);
// " 0 DH 10.0.0.2 AA:BB:CC:DD:EE:FF bridge1"; empty when nothing matched
std::vector<ArpEntry> parse_terse_arp(const std::string &out, const std::string &subnet);

// airOS /tmp/system.cfg

// "ppp0" when PPPoE is enabled, empty otherwise
std::string parse_system_cfg_wan(const std::string &cfg);

struct SystemCfgLan
{
    std::string interface_name;
    std::string ip;
    std::string netmask;
};

// netconf.N with role=lan, falling back to the dhcpd.1 device
SystemCfgLan parse_system_cfg_lan(const std::string &cfg);
std::pair<std::string, std::string> parse_system_cfg_dhcp(const std::string &cfg);

// BusyBox / iproute2 / EdgeOS

std::string parse_ifconfig_inet_addr(const std::string &out);
std::string parse_ifconfig_mask(const std::string &out);
// "? (10.0.0.5) at AA:BB:CC:DD:EE:FF [ether] on eth0"
std::vector<ArpEntry> parse_busybox_arp(const std::string &out, const std::string &subnet);
// First "inet a.b.c.d[/n]" of `ip addr show`
std::string parse_linux_inet_addr(const std::string &out);

struct LanCandidate
{
    std::string interface_name;
    std::string addr; // with prefix when present
};

// Private addresses from `ip -o addr show`, excluding lo, ppp0 and pppoe0,
// and eth0 unless a PPP interface exists.
std::vector<LanCandidate> discover_lan_interfaces(const std::string &out, bool has_ppp);

std::string parse_linux_default_gateway(const std::string &out);
// "dhcp-range=10.0.0.100,10.0.0.200,24h"
std::pair<std::string, std::string> parse_dnsmasq_range(const std::string &out);
// EdgeOS config.boot "start a {" ... "stop b" within subnet
std::pair<std::string, std::string> parse_config_boot_dhcp(const std::string &out, const std::string &subnet);
// "10.0.0.2 dev eth1 lladdr AA:BB:CC:DD:EE:FF REACHABLE"; FAILED entries skipped.
// Sets matched to whether any line had the structured form.
std::vector<ArpEntry> parse_ip_neigh(const std::string &out, const std::string &subnet, bool &matched);

#endif
