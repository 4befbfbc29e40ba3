#ifndef TUNNEL_HPP
#define TUNNEL_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "transport.hpp"

enum class TunnelStatus
{
    Disconnected,
    Connecting,
    Active,
    Failed
};

const char *to_string(TunnelStatus status);

struct TunnelState;

// Local port forward: a listener on 127.0.0.1:local_port whose accepted
// connections are each spliced to remote_host:remote_port through the
// transport on their own thread.
class Tunnel
{
private:
    std::shared_ptr<Transport> transport;
    std::shared_ptr<TunnelState> state;
    int port;
    std::string host;
    int target_port;

    int listen_fd = -1;
    std::thread accept_thread;
    std::mutex lifecycle_mutex;
    bool started = false;
    bool stopped = false;

    std::atomic<TunnelStatus> current_status{TunnelStatus::Disconnected};
    mutable std::mutex error_mutex;
    std::string last_error;
    std::string bound;

    void fail(const std::string &message);
    void accept_loop();
    size_t shutdown();

protected:
    // Accepts one pending client; -1 with errno set on failure.
    // Subclasses overriding this must stop() in their own destructor.
    virtual int accept_client(int listen_fd);

public:
    Tunnel(std::shared_ptr<Transport> transport, int local_port,
           const std::string &remote_host, int remote_port);
    virtual ~Tunnel();

    Tunnel(const Tunnel &) = delete;
    Tunnel &operator=(const Tunnel &) = delete;

    // Throws ResourceError if the listener cannot be bound.
    void start();

    // Throws DrainTimeoutError if forwarded connections outlive the drain
    // window. The tunnel is disconnected either way.
    void stop();

    TunnelStatus status() const { return current_status.load(); }
    std::string error() const;

    int local_port() const { return port; }
    const std::string &remote_host() const { return host; }
    int remote_port() const { return target_port; }

    std::string bound_address() const;
    size_t active_connections() const;
};

#endif
