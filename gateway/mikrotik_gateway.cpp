#include "mikrotik_gateway.hpp"
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "parsers.hpp"
#include "string_utils.hpp"

std::string MikroTikGateway::identity(const CancellationScope &cancel)
{
    std::string out = trim(run("/system identity print", cancel));
    std::string before, after;
    if (cut(out, "name:", before, after))
        return trim(after);
    return out;
}

WanConfig MikroTikGateway::wan_info(const CancellationScope &cancel)
{
    WanConfig cfg;

    try
    {
        auto address = parse_terse_address(run(R"(/ip address print terse where interface~"ether1|pppoe")", cancel));
        cfg.public_ip = address.first;
        cfg.interface_name = address.second;
    }
    catch (const ExecError &e)
    {
        spdlog::debug("mikrotik wan address: {}", e.what());
    }

    try
    {
        cfg.gateway = parse_terse_route_gateway(run("/ip route print terse where dst-address=0.0.0.0/0", cancel));
    }
    catch (const ExecError &e)
    {
        spdlog::debug("mikrotik default route: {}", e.what());
    }

    if (cfg.public_ip.empty() && cfg.gateway.empty())
    {
        throw TunnelerError("mikrotik wan_info: could not determine WAN configuration");
    }
    return cfg;
}

LanConfig MikroTikGateway::lan_info(const CancellationScope &cancel)
{
    LanConfig cfg;

    try
    {
        auto address = parse_terse_address(run(R"(/ip address print terse where interface~"bridge|ether2")", cancel));
        if (!address.first.empty())
        {
            cfg.interface_name = address.second;
            cfg.gateway_ip = strip_cidr_suffix(address.first);
            cfg.cidr = address.first;
            cfg.subnet = subnet_from_cidr(address.first);
        }
    }
    catch (const ExecError &e)
    {
        spdlog::debug("mikrotik lan address: {}", e.what());
    }

    if (cfg.gateway_ip.empty())
    {
        throw TunnelerError("mikrotik lan_info: could not determine LAN configuration");
    }

    try
    {
        auto range = parse_terse_pool(run("/ip pool print terse", cancel));
        cfg.dhcp_start = range.first;
        cfg.dhcp_end = range.second;
    }
    catch (const ExecError &e)
    {
        spdlog::debug("mikrotik dhcp pool: {}", e.what());
    }

    return cfg;
}

void MikroTikGateway::flood_ping(const std::string &subnet, const CancellationScope &cancel)
{
    validate_subnet(subnet);
    run(":for i from=1 to=254 do={/ping " + subnet + ".$i count=1 interval=0.1}", cancel);
}

std::vector<ArpEntry> MikroTikGateway::arp_table(const std::string &subnet, const CancellationScope &cancel)
{
    if (!subnet.empty())
        validate_subnet(subnet);

    std::string out = run("/ip arp print terse where !invalid", cancel);

    std::vector<ArpEntry> entries = parse_terse_arp(out, subnet);
    if (entries.empty() && !trim(out).empty())
    {
        std::vector<ArpEntry> loose = parse_arp_fallback(out, subnet);
        if (!loose.empty())
            spdlog::debug("mikrotik arp: terse format not recognised, used token scan");
        return loose;
    }
    return entries;
}
