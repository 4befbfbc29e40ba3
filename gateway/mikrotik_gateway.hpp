#ifndef MIKROTIK_GATEWAY_HPP
#define MIKROTIK_GATEWAY_HPP

#include "gateway.hpp"

// RouterOS, queried through terse CLI output
class MikroTikGateway : public Gateway
{
public:
    explicit MikroTikGateway(CommandRunner runner) : Gateway(std::move(runner)) {}

    GatewayType type() const override { return GatewayType::MikroTik; }
    std::string identity(const CancellationScope &cancel) override;
    WanConfig wan_info(const CancellationScope &cancel) override;
    LanConfig lan_info(const CancellationScope &cancel) override;
    void flood_ping(const std::string &subnet, const CancellationScope &cancel) override;
    std::vector<ArpEntry> arp_table(const std::string &subnet, const CancellationScope &cancel) override;
};

#endif
