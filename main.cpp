#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <termios.h>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include "config.hpp"
#include "connection.hpp"
#include "errors.hpp"
#include "host_key_store.hpp"
#include "logging.hpp"
#include "network_utils.hpp"
#include "port_allocator.hpp"
#include "discovery/device.hpp"
#include "discovery/oui_table.hpp"
#include "discovery/scanner.hpp"
#include "gateway/detector.hpp"
#include "tunnels/tunnel_manager.hpp"

struct Config
{
    std::string gateway;
    int port = SSH_DEFAULT_PORT;
    std::string user = "admin";
    std::string subnet;
    std::vector<int> ports;
    bool legacy_hostkey = false;
    bool verbose = false;
    std::string log_file;
    std::string oui_file;
};

std::atomic<bool> g_running{true};

void signal_handler(int)
{
    g_running = false;
}

std::string read_password(const std::string &prompt)
{
    const char *env = std::getenv("LMTM_PASSWORD");
    if (env != nullptr)
        return env;

    std::cerr << prompt << std::flush;

    termios old_attrs{};
    bool is_tty = tcgetattr(STDIN_FILENO, &old_attrs) == 0;
    if (is_tty)
    {
        termios no_echo = old_attrs;
        no_echo.c_lflag &= ~ECHO;
        tcsetattr(STDIN_FILENO, TCSANOW, &no_echo);
    }

    std::string password;
    std::getline(std::cin, password);

    if (is_tty)
        tcsetattr(STDIN_FILENO, TCSANOW, &old_attrs);
    std::cerr << std::endl;
    return password;
}

// Timeout is read per call so each phase can set its own
CommandRunner runner_for(std::shared_ptr<Connection> conn, std::shared_ptr<std::atomic<int>> timeout_ms)
{
    return [conn, timeout_ms](const std::string &cmd, const CancellationScope &cancel) {
        return conn->exec(cmd, cancel, std::chrono::milliseconds(timeout_ms->load()));
    };
}

void print_event(const TunnelEvent &event)
{
    const Tunnel &tunnel = *event.tunnel;
    std::cout << "[" << to_string(event.type) << "] 127.0.0.1:" << tunnel.local_port() << " -> "
              << join_host_port(tunnel.remote_host(), tunnel.remote_port())
              << " (" << service_name(tunnel.remote_port()) << ")";
    if (event.type == TunnelEventType::Failed)
        std::cout << ": " << tunnel.error();
    std::cout << std::endl;
}

int run(const Config &config)
{
    std::string password = read_password(config.user + "@" + config.gateway + "'s password: ");

    auto trust_store = std::make_shared<HostKeyStore>();
    std::shared_ptr<Connection> conn;
    if (config.legacy_hostkey)
    {
        conn = std::make_shared<Connection>(trust_store);
        conn->connect(config.gateway, config.port, config.user, password, LEGACY_HOSTKEY_ALGORITHMS);
    }
    else
    {
        conn = Connection::open(trust_store, config.gateway, config.port, config.user, password);
    }
    password.assign(password.size(), '\0');

    conn->start_keepalive(std::chrono::seconds(KEEPALIVE_INTERVAL_S));

    const CancellationScope &no_cancel = never_cancelled();
    auto exec_timeout = std::make_shared<std::atomic<int>>(DETECT_TIMEOUT_MS);
    std::unique_ptr<Gateway> gateway = detect_gateway(conn->server_banner(), runner_for(conn, exec_timeout), no_cancel);

    exec_timeout->store(SURVEY_TIMEOUT_MS);
    std::string subnet = config.subnet;
    try
    {
        spdlog::info("Gateway {} ({})", gateway->identity(no_cancel), to_string(gateway->type()));
        WanConfig wan = gateway->wan_info(no_cancel);
        spdlog::info("WAN {} on {} via {}", wan.public_ip, wan.interface_name, wan.gateway);
    }
    catch (const TunnelerError &e)
    {
        spdlog::warn("Gateway survey incomplete: {}", e.what());
    }

    if (subnet.empty())
    {
        LanConfig lan = gateway->lan_info(no_cancel);
        spdlog::info("LAN {} on {}, DHCP {} - {}", lan.cidr, lan.interface_name, lan.dhcp_start, lan.dhcp_end);
        subnet = lan.subnet;
    }
    validate_subnet(subnet);

    if (!config.oui_file.empty())
    {
        size_t added = system_oui_registry().load_file(config.oui_file);
        if (added == 0)
            spdlog::warn("No vendor prefixes found in {}", config.oui_file);
        else
            spdlog::info("Loaded {} vendor prefixes from {}", added, config.oui_file);
    }

    exec_timeout->store(SCAN_TIMEOUT_MS);
    DiscoveryScanner scanner(*gateway);
    std::vector<DiscoveredDevice> devices = scanner.scan(subnet, no_cancel);

    std::vector<DeviceSelection> selection;
    for (const auto &device : devices)
    {
        std::cout << device.ip << "  " << device.mac << "  " << device.vendor << "  ["
                  << to_string(device.device_class) << "]" << std::endl;
        selection.push_back(DeviceSelection{device.ip, device.mac,
                                            config.ports.empty() ? device.default_ports : config.ports});
    }

    PortAllocator allocator;
    std::vector<TunnelSpec> specs = specs_for(selection, allocator);
    if (specs.empty())
    {
        spdlog::warn("No devices to tunnel to on {}.0/24", subnet);
        conn->close();
        return 0;
    }

    TunnelManager manager(conn, TunnelManager::suggested_capacity(specs.size()));

    // From here on Ctrl+C closes the tunnels instead of killing the process
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::thread builder([&manager, &specs] {
        try
        {
            size_t active = manager.build(specs);
            spdlog::info("{} of {} tunnels active, Ctrl+C to close", active, specs.size());
        }
        catch (const CancelledError &e)
        {
            spdlog::info("{}", e.what());
        }
        catch (const TunnelerError &e)
        {
            spdlog::error("Tunnel build failed: {}", e.what());
        }
    });

    TunnelEvent event;
    while (g_running)
    {
        if (manager.next_event(event, std::chrono::milliseconds(POLL_INTERVAL_MS)))
            print_event(event);

        if (!conn->is_connected())
        {
            spdlog::error("Lost connection to {}", conn->gateway_address());
            break;
        }
    }

    int rc = 0;
    try
    {
        manager.close_all();
    }
    catch (const TunnelerError &e)
    {
        spdlog::error("Shutdown: {}", e.what());
        rc = 1;
    }
    builder.join();

    while (manager.try_next_event(event))
        print_event(event);

    return rc;
}

int main(int argc, char *argv[])
{
    CLI::App app{"lmtm - SSH tunnels to the devices behind a MikroTik or Ubiquiti gateway"};

    app.set_version_flag("--version", "1.0.0");

    Config config;

    app.add_option("gateway", config.gateway, "Gateway address")
        ->required();
    app.add_option("-u,--user", config.user, "SSH user")
        ->capture_default_str();
    app.add_option("-p,--port", config.port, "SSH port")
        ->capture_default_str()
        ->check(CLI::Range(1, MAX_PORT));
    app.add_option("-s,--subnet", config.subnet, "LAN subnet as three octets, e.g. 10.0.0 (default: from the gateway)")
        ->check([](const std::string &val) {
            try
            {
                validate_subnet(val);
                return std::string();
            }
            catch (const ValidationError &e)
            {
                return std::string(e.what());
            }
        });
    app.add_option("--ports", config.ports, "Remote ports to tunnel on every device (default: per device class)")
        ->delimiter(',')
        ->check(CLI::Range(1, MAX_PORT));
    app.add_flag("--legacy-hostkey", config.legacy_hostkey, "Only offer the ssh-rsa host key algorithm");
    app.add_flag("-v,--verbose", config.verbose, "Debug logging");
    app.add_option("--log-file", config.log_file, "Also log to this file (rotated)");
    app.add_option("--oui-file", config.oui_file, "MAC vendor registry (IEEE oui.txt, nmap or Wireshark format)")
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    init_logging(config.verbose, config.log_file);

    signal(SIGPIPE, SIG_IGN);

    try
    {
        return run(config);
    }
    catch (const std::exception &e)
    {
        spdlog::error("{}", e.what());
        return 1;
    }
}
