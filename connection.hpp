#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <libssh2.h>
#include "cancellation.hpp"
#include "host_key_store.hpp"
#include "transport.hpp"
#include "crypto/secure_buffer.hpp"

struct SessionCore;

// Authenticated SSH session to one gateway (libssh2). Runs remote commands
// and opens direct-tcpip streams for tunnels. All libssh2 calls go through
// one session mutex; the session is non-blocking so waiting callers never
// hold it.
class Connection : public Transport
{
private:
    std::shared_ptr<HostKeyStore> trust_store;
    std::shared_ptr<SessionCore> core;
    std::string host;
    std::string gateway; // host:port
    std::string user;
    SecureBuffer password;
    std::string banner;
    std::atomic<bool> connected{false};
    bool used = false;
    CancellationScope scope;
    std::thread keepalive_thread;
    mutable std::mutex state_mutex;

    int tcp_connect(const std::string &host, int port);
    void verify_host_key(LIBSSH2_SESSION *session);
    void authenticate(LIBSSH2_SESSION *session);
    void keepalive_loop(std::chrono::seconds interval);
    LIBSSH2_CHANNEL *open_direct(const std::string &remote_host, int remote_port,
                                 std::chrono::milliseconds timeout);

public:
    explicit Connection(std::shared_ptr<HostKeyStore> trust_store);
    ~Connection() override;

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Connects with the default host key algorithms; if negotiation fails,
    // makes exactly one more attempt on a fresh Connection restricted to the
    // legacy algorithm set.
    static std::shared_ptr<Connection> open(std::shared_ptr<HostKeyStore> trust_store,
                                            const std::string &host, int port,
                                            const std::string &user, const std::string &password);

    // Empty hostkey_algorithms keeps libssh2's defaults.
    void connect(const std::string &host, int port, const std::string &user,
                 const std::string &password, const std::string &hostkey_algorithms = "");

    // Combined stdout/stderr, trimmed. Throws ExecError.
    std::string exec(const std::string &cmd, const CancellationScope &cancel,
                     std::chrono::milliseconds timeout);

    std::unique_ptr<Stream> dial(const std::string &host, int port) override;

    // True if host:port accepted a forwarded connection within timeout.
    bool probe(const std::string &host, int port, std::chrono::milliseconds timeout);

    void start_keepalive(std::chrono::seconds interval);

    bool is_connected() const override;
    void close() override;

    std::string server_banner() const;
    const std::string &gateway_address() const { return gateway; }
    const std::string &remote_host() const { return host; }
};

#endif
