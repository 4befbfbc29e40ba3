#include "gateway.hpp"
#include <regex>
#include "errors.hpp"

const char *to_string(GatewayType type)
{
    switch (type)
    {
    case GatewayType::MikroTik:
        return "mikrotik";
    case GatewayType::Ubiquiti:
        return "ubiquiti";
    case GatewayType::Unknown:
        return "unknown";
    }
    return "unknown";
}

void validate_subnet(const std::string &subnet)
{
    static const std::regex subnet_re(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3}))");

    std::smatch m;
    if (!std::regex_match(subnet, m, subnet_re))
    {
        throw ValidationError("invalid subnet format \"" + subnet + "\": must be 3 decimal octets (e.g., 10.0.0)");
    }
    for (size_t i = 1; i <= 3; i++)
    {
        if (std::stoi(m[i].str()) > 255)
        {
            throw ValidationError("invalid subnet \"" + subnet + "\": octets must be 0-255");
        }
    }
}
