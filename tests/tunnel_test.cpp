#include <atomic>
#include <cassert>
#include <csignal>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <thread>
#include "errors.hpp"
#include "loopback_transport.hpp"
#include "tunnels/tunnel.hpp"

// Fails every accept with EMFILE
class ExhaustedTunnel : public Tunnel
{
public:
    std::atomic<int> attempts{0};

    using Tunnel::Tunnel;
    ~ExhaustedTunnel() override { stop(); }

protected:
    int accept_client(int) override
    {
        attempts++;
        errno = EMFILE;
        return -1;
    }
};

// Holds every dial until released
class StalledTransport : public Transport
{
private:
    std::mutex mutex;
    std::condition_variable released_cv;
    bool released = false;

public:
    std::atomic<int> dials{0};

    std::unique_ptr<Stream> dial(const std::string &host, int port) override
    {
        dials++;
        std::unique_lock<std::mutex> lock(mutex);
        released_cv.wait_for(lock, std::chrono::seconds(30), [this] { return released; });
        throw NetworkError("dial " + join_host_port(host, port) + ": released");
    }

    bool is_connected() const override { return true; }
    void close() override {}

    void release()
    {
        std::lock_guard<std::mutex> lock(mutex);
        released = true;
        released_cv.notify_all();
    }
};

template <typename Predicate>
bool wait_until(Predicate predicate, int timeout_ms)
{
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

std::string round_trip(int fd, const std::string &message)
{
    ssize_t sent = send(fd, message.data(), message.size(), MSG_NOSIGNAL);
    assert(sent == static_cast<ssize_t>(message.size()));
    std::string reply;
    char buffer[256];
    while (reply.size() < message.size())
    {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n <= 0)
            break;
        reply.append(buffer, n);
    }
    return reply;
}

void test_forwarding()
{
    EchoServer echo;
    auto transport = std::make_shared<LoopbackTransport>(echo.port());

    Tunnel tunnel(transport, 0, "10.0.0.5", 80);
    assert(tunnel.status() == TunnelStatus::Disconnected);
    tunnel.start();
    assert(tunnel.status() == TunnelStatus::Active);

    std::string bound = tunnel.bound_address();
    assert(bound.compare(0, 10, "127.0.0.1:") == 0);
    int port = port_of(bound);
    assert(port > 0);

    int client = connect_client(port);
    assert(client >= 0);
    assert(round_trip(client, "hello through the tunnel") == "hello through the tunnel");
    assert(tunnel.active_connections() == 1);

    int second = connect_client(port);
    assert(second >= 0);
    assert(round_trip(second, "second") == "second");
    assert(round_trip(client, "again") == "again");

    auto dialed = transport->dialed();
    assert(dialed.size() == 2);
    assert(dialed[0] == "10.0.0.5:80");

    close(second);
    assert(wait_until([&] { return tunnel.active_connections() == 1; }, 2000));

    // Stopping cuts the remaining forward
    tunnel.stop();
    assert(tunnel.status() == TunnelStatus::Disconnected);
    assert(tunnel.active_connections() == 0);
    char byte;
    assert(recv(client, &byte, 1, 0) <= 0);
    close(client);

    assert(connect_client(port) < 0);
    tunnel.stop();
    std::cout << "[OK] tunnel forwarding smoke test\n";
}

void test_bind_conflict()
{
    auto transport = std::make_shared<LoopbackTransport>(1);

    Tunnel first(transport, 0, "10.0.0.5", 443);
    first.start();
    int port = port_of(first.bound_address());

    Tunnel second(transport, port, "10.0.0.6", 443);
    bool threw = false;
    try
    {
        second.start();
    }
    catch (const ResourceError &e)
    {
        threw = true;
        assert(std::string(e.what()).find(std::to_string(port)) != std::string::npos);
    }
    assert(threw);
    assert(second.status() == TunnelStatus::Failed);
    assert(!second.error().empty());

    // The first tunnel is untouched
    assert(first.status() == TunnelStatus::Active);
    first.stop();
    second.stop();
    assert(second.status() == TunnelStatus::Disconnected);
    assert(!second.error().empty());
    std::cout << "[OK] tunnel bind conflict smoke test\n";
}

void test_dial_failure_is_isolated()
{
    EchoServer echo;
    auto transport = std::make_shared<LoopbackTransport>(echo.port());
    transport->refuse = true;

    Tunnel tunnel(transport, 0, "10.0.0.9", 554);
    tunnel.start();
    int port = port_of(tunnel.bound_address());

    int client = connect_client(port);
    assert(client >= 0);
    char byte;
    assert(recv(client, &byte, 1, 0) == 0);
    close(client);

    assert(wait_until([&] { return tunnel.active_connections() == 0; }, 2000));
    assert(tunnel.status() == TunnelStatus::Active);

    transport->refuse = false;
    int retry = connect_client(port);
    assert(round_trip(retry, "ok") == "ok");
    close(retry);

    tunnel.stop();
    std::cout << "[OK] tunnel dial failure smoke test\n";
}

void test_accept_error_storm()
{
    auto transport = std::make_shared<LoopbackTransport>(1);
    ExhaustedTunnel tunnel(transport, 0, "10.0.0.5", 80);
    tunnel.start();

    // Never accepted, so the listener stays readable
    int pending = connect_client(port_of(tunnel.bound_address()));
    assert(pending >= 0);

    assert(wait_until([&] { return tunnel.status() == TunnelStatus::Failed; }, 5000));
    assert(tunnel.attempts == 10);
    assert(!tunnel.error().empty());

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(tunnel.attempts == 10);

    close(pending);
    tunnel.stop();
    assert(tunnel.status() == TunnelStatus::Disconnected);
    assert(!tunnel.error().empty());
    std::cout << "[OK] accept error storm smoke test\n";
}

void test_start_twice()
{
    auto transport = std::make_shared<LoopbackTransport>(1);
    Tunnel tunnel(transport, 0, "10.0.0.5", 80);
    tunnel.start();

    bool threw = false;
    try
    {
        tunnel.start();
    }
    catch (const ResourceError &)
    {
        threw = true;
    }
    assert(threw);
    assert(tunnel.status() == TunnelStatus::Active);

    tunnel.stop();
    assert(std::string(to_string(tunnel.status())) == "disconnected");
    std::cout << "[OK] tunnel restart smoke test\n";
}

void test_drain_timeout()
{
    auto transport = std::make_shared<StalledTransport>();
    Tunnel tunnel(transport, 0, "10.0.0.7", 554);
    tunnel.start();
    std::string bound = tunnel.bound_address();

    int client = connect_client(port_of(bound));
    assert(client >= 0);
    assert(wait_until([&] { return transport->dials == 1; }, 2000));
    assert(tunnel.active_connections() == 1);

    auto began = std::chrono::steady_clock::now();
    bool threw = false;
    try
    {
        tunnel.stop();
    }
    catch (const DrainTimeoutError &e)
    {
        threw = true;
        assert(e.residual() == 1);
        assert(std::string(e.what()).find(bound) != std::string::npos);
    }
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - began);
    assert(threw);
    assert(waited.count() >= 4900 && waited.count() < 8000);
    assert(tunnel.status() == TunnelStatus::Disconnected);

    // The straggler finishes on its own once the dial returns
    transport->release();
    assert(wait_until([&] { return tunnel.active_connections() == 0; }, 2000));
    close(client);

    tunnel.stop();
    std::cout << "[OK] tunnel drain timeout smoke test\n";
}

int main()
{
    signal(SIGPIPE, SIG_IGN);
    test_forwarding();
    test_bind_conflict();
    test_dial_failure_is_isolated();
    test_accept_error_storm();
    test_start_twice();
    test_drain_timeout();
    std::cout << "All Tunnel tests passed!\n";
    return 0;
}
