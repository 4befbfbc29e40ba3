#ifndef UBIQUITI_GATEWAY_HPP
#define UBIQUITI_GATEWAY_HPP

#include "gateway.hpp"

// EdgeOS and airOS. Both are Linux underneath, so every query is a cascade
// of strategies from the richest source down to plain BusyBox tools.
class UbiquitiGateway : public Gateway
{
private:
    // Output of cmd, or empty if it failed
    std::string try_run(const std::string &cmd, const CancellationScope &cancel);

public:
    explicit UbiquitiGateway(CommandRunner runner) : Gateway(std::move(runner)) {}

    GatewayType type() const override { return GatewayType::Ubiquiti; }
    std::string identity(const CancellationScope &cancel) override;
    WanConfig wan_info(const CancellationScope &cancel) override;
    LanConfig lan_info(const CancellationScope &cancel) override;
    void flood_ping(const std::string &subnet, const CancellationScope &cancel) override;
    std::vector<ArpEntry> arp_table(const std::string &subnet, const CancellationScope &cancel) override;
};

#endif
