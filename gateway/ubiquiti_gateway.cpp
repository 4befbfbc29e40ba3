#include "ubiquiti_gateway.hpp"
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "parsers.hpp"
#include "string_utils.hpp"

std::string UbiquitiGateway::try_run(const std::string &cmd, const CancellationScope &cancel)
{
    try
    {
        return run(cmd, cancel);
    }
    catch (const ExecError &e)
    {
        spdlog::debug("ubiquiti: {}", e.what());
        return "";
    }
}

std::string UbiquitiGateway::identity(const CancellationScope &cancel)
{
    return trim(run("hostname", cancel));
}

WanConfig UbiquitiGateway::wan_info(const CancellationScope &cancel)
{
    WanConfig cfg;
    std::vector<std::string> candidates = {"ppp0", "pppoe0", "eth0"};

    // airOS: PPPoE enabled means the address lives on ppp0 at runtime
    std::string pppoe = parse_system_cfg_wan(try_run("cat /tmp/system.cfg 2>/dev/null", cancel));
    if (!pppoe.empty())
        spdlog::debug("ubiquiti: PPPoE enabled in system.cfg, WAN on {}", pppoe);

    for (const auto &iface : candidates)
    {
        std::string ip = parse_linux_inet_addr(try_run("ip addr show " + iface + " 2>/dev/null", cancel));
        if (!ip.empty() && !is_private_ipv4(strip_cidr_suffix(ip)))
        {
            cfg.public_ip = ip;
            cfg.interface_name = iface;
            break;
        }
    }

    if (cfg.public_ip.empty())
    {
        for (const auto &iface : candidates)
        {
            std::string ip = parse_ifconfig_inet_addr(try_run("ifconfig " + iface + " 2>/dev/null", cancel));
            if (!ip.empty() && !is_private_ipv4(ip))
            {
                cfg.public_ip = ip;
                cfg.interface_name = iface;
                break;
            }
        }
    }

    cfg.gateway = parse_linux_default_gateway(try_run("ip route show default 2>/dev/null", cancel));

    if (cfg.public_ip.empty() && cfg.gateway.empty())
    {
        throw TunnelerError("ubiquiti wan_info: could not determine WAN configuration");
    }
    return cfg;
}

LanConfig UbiquitiGateway::lan_info(const CancellationScope &cancel)
{
    LanConfig cfg;

    // airOS system.cfg carries interface roles and the DHCP range
    std::string system_cfg = try_run("cat /tmp/system.cfg 2>/dev/null", cancel);
    SystemCfgLan lan = parse_system_cfg_lan(system_cfg);
    if (!lan.ip.empty())
    {
        std::string cidr = lan.ip + cidr_from_mask(lan.netmask);
        cfg.interface_name = lan.interface_name;
        cfg.gateway_ip = lan.ip;
        cfg.cidr = cidr;
        cfg.subnet = subnet_from_cidr(cidr);
        auto range = parse_system_cfg_dhcp(system_cfg);
        cfg.dhcp_start = range.first;
        cfg.dhcp_end = range.second;
    }

    // EdgeOS
    if (cfg.gateway_ip.empty())
    {
        std::string out = try_run("ip -o addr show 2>/dev/null", cancel);
        bool has_ppp = contains(out, "ppp0") || contains(out, "pppoe0");
        std::vector<LanCandidate> found = discover_lan_interfaces(out, has_ppp);
        if (!found.empty())
        {
            cfg.interface_name = found.front().interface_name;
            cfg.gateway_ip = strip_cidr_suffix(found.front().addr);
            cfg.cidr = found.front().addr;
            cfg.subnet = subnet_from_cidr(found.front().addr);
        }
    }

    // airOS BusyBox
    if (cfg.gateway_ip.empty())
    {
        for (const std::string iface : {"eth0", "br0", "eth1", "switch0"})
        {
            std::string out = try_run("ifconfig " + iface + " 2>/dev/null", cancel);
            std::string ip = parse_ifconfig_inet_addr(out);
            if (!ip.empty() && is_private_ipv4(ip))
            {
                std::string cidr = ip + cidr_from_mask(parse_ifconfig_mask(out));
                cfg.interface_name = iface;
                cfg.gateway_ip = ip;
                cfg.cidr = cidr;
                cfg.subnet = subnet_from_cidr(cidr);
                break;
            }
        }
    }

    if (cfg.gateway_ip.empty())
    {
        for (const std::string iface : {"br0", "eth1", "switch0"})
        {
            std::string ip = parse_linux_inet_addr(try_run("ip addr show " + iface + " 2>/dev/null", cancel));
            if (!ip.empty())
            {
                cfg.interface_name = iface;
                cfg.gateway_ip = strip_cidr_suffix(ip);
                cfg.cidr = ip;
                cfg.subnet = subnet_from_cidr(ip);
                break;
            }
        }
    }

    if (cfg.gateway_ip.empty())
    {
        throw TunnelerError("ubiquiti lan_info: could not determine LAN configuration");
    }

    if (cfg.dhcp_start.empty())
    {
        auto range = parse_dnsmasq_range(
            try_run("cat /etc/dnsmasq.d/dhcpd.conf 2>/dev/null || cat /config/dhcpd.conf 2>/dev/null", cancel));
        cfg.dhcp_start = range.first;
        cfg.dhcp_end = range.second;
    }
    if (cfg.dhcp_start.empty())
    {
        auto range = parse_config_boot_dhcp(try_run("cat /config/config.boot 2>/dev/null", cancel), cfg.subnet);
        cfg.dhcp_start = range.first;
        cfg.dhcp_end = range.second;
    }

    return cfg;
}

void UbiquitiGateway::flood_ping(const std::string &subnet, const CancellationScope &cancel)
{
    validate_subnet(subnet);
    run("for i in $(seq 1 254); do ping -c1 -W1 " + subnet + ".$i &>/dev/null & done; wait", cancel);
}

std::vector<ArpEntry> UbiquitiGateway::arp_table(const std::string &subnet, const CancellationScope &cancel)
{
    if (!subnet.empty())
        validate_subnet(subnet);

    std::string out = try_run("ip neigh show 2>/dev/null", cancel);
    if (!trim(out).empty())
    {
        bool matched = false;
        std::vector<ArpEntry> entries = parse_ip_neigh(out, subnet, matched);
        if (!matched)
            return parse_arp_fallback(out, subnet);
        return entries;
    }

    try
    {
        return parse_busybox_arp(run("arp -a 2>/dev/null", cancel), subnet);
    }
    catch (const ExecError &e)
    {
        throw ExecError(e.cmd(), "neither ip neigh nor arp available", e.output());
    }
}
