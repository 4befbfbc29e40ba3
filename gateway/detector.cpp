#include "detector.hpp"
#include <spdlog/spdlog.h>
#include "errors.hpp"
#include "mikrotik_gateway.hpp"
#include "ubiquiti_gateway.hpp"
#include "string_utils.hpp"

namespace
{

bool mentions_ubiquiti(const std::string &out)
{
    std::string lower = to_lower(out);
    return contains(lower, "edgeos") || contains(lower, "ubnt") || contains(lower, "ubiquiti");
}

} // namespace

std::unique_ptr<Gateway> detect_gateway(const std::string &banner, CommandRunner run,
                                        const CancellationScope &cancel)
{
    std::string upper = to_upper(banner);
    if (contains(upper, "ROSSSH") || contains(upper, "MIKROTIK"))
    {
        spdlog::info("Gateway detected as MikroTik from SSH banner");
        return std::make_unique<MikroTikGateway>(std::move(run));
    }

    try
    {
        std::string out = trim(run("/system identity print", cancel));
        if (!out.empty() && !contains(out, "not found") && !contains(out, "No such file"))
        {
            spdlog::info("Gateway detected as MikroTik from identity probe");
            return std::make_unique<MikroTikGateway>(std::move(run));
        }
    }
    catch (const ExecError &e)
    {
        spdlog::debug("Identity probe: {}", e.what());
    }

    for (const char *probe : {"cat /etc/version", "uname -a"})
    {
        try
        {
            if (mentions_ubiquiti(run(probe, cancel)))
            {
                spdlog::info("Gateway detected as Ubiquiti from \"{}\"", probe);
                return std::make_unique<UbiquitiGateway>(std::move(run));
            }
        }
        catch (const ExecError &e)
        {
            spdlog::debug("Version probe: {}", e.what());
        }
    }

    spdlog::info("Gateway type not recognised, assuming Ubiquiti");
    return std::make_unique<UbiquitiGateway>(std::move(run));
}
