#include <atomic>
#include <cassert>
#include <csignal>
#include <iostream>
#include <thread>
#include "connection.hpp"
#include "errors.hpp"
#include "loopback_transport.hpp"
#include "ssh_utils.hpp"

// Answers every connection with an HTTP error instead of an SSH banner
class NotSshServer
{
private:
    int listen_fd;
    int bound_port = 0;
    std::atomic<bool> running{true};
    std::thread accept_thread;

public:
    std::atomic<int> accepted{0};

    NotSshServer()
    {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_storage addr;
        socklen_t addr_len;
        setup_sockaddr(addr, addr_len, "127.0.0.1", 0);
        bind(listen_fd, (struct sockaddr *)&addr, addr_len);
        listen(listen_fd, 8);

        sockaddr_in actual{};
        socklen_t len = sizeof(actual);
        getsockname(listen_fd, (struct sockaddr *)&actual, &len);
        bound_port = ntohs(actual.sin_port);

        accept_thread = std::thread([this] {
            while (running)
            {
                pollfd pfd{listen_fd, POLLIN, 0};
                if (poll(&pfd, 1, 50) <= 0)
                    continue;
                int fd = accept(listen_fd, nullptr, nullptr);
                if (fd < 0)
                    continue;
                accepted++;
                const char reply[] = "HTTP/1.0 400 Bad Request\r\n\r\n";
                send(fd, reply, sizeof(reply) - 1, MSG_NOSIGNAL);
                close(fd);
            }
        });
    }

    ~NotSshServer()
    {
        running = false;
        accept_thread.join();
        close(listen_fd);
    }

    int port() const { return bound_port; }
};

int unused_port()
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_storage addr;
    socklen_t addr_len;
    setup_sockaddr(addr, addr_len, "127.0.0.1", 0);
    bind(fd, (struct sockaddr *)&addr, addr_len);
    sockaddr_in actual{};
    socklen_t len = sizeof(actual);
    getsockname(fd, (struct sockaddr *)&actual, &len);
    close(fd);
    return ntohs(actual.sin_port);
}

void test_refused()
{
    auto store = std::make_shared<HostKeyStore>();
    bool threw = false;
    try
    {
        Connection::open(store, "127.0.0.1", unused_port(), "admin", "secret");
    }
    catch (const HandshakeError &)
    {
        assert(false);
    }
    catch (const NetworkError &e)
    {
        threw = true;
        assert(std::string(e.what()).find("127.0.0.1") != std::string::npos);
    }
    assert(threw);
    assert(store->size() == 0);
    std::cout << "[OK] refused connection smoke test\n";
}

void test_handshake_failure_retries_once()
{
    NotSshServer server;
    auto store = std::make_shared<HostKeyStore>();

    bool threw = false;
    try
    {
        Connection::open(store, "127.0.0.1", server.port(), "admin", "secret");
    }
    catch (const HandshakeError &)
    {
        threw = true;
    }
    assert(threw);
    assert(server.accepted == 2);
    std::cout << "[OK] legacy retry smoke test\n";
}

void test_unconnected_operations()
{
    Connection conn(std::make_shared<HostKeyStore>());
    assert(!conn.is_connected());

    bool threw = false;
    try
    {
        conn.exec("uname -a", never_cancelled(), std::chrono::milliseconds(100));
    }
    catch (const ExecError &e)
    {
        threw = true;
        assert(e.cmd() == "uname -a");
    }
    assert(threw);

    threw = false;
    try
    {
        conn.dial("10.0.0.5", 80);
    }
    catch (const NetworkError &)
    {
        threw = true;
    }
    assert(threw);

    assert(!conn.probe("10.0.0.5", 80, std::chrono::milliseconds(100)));
    assert(conn.server_banner().empty());

    conn.close();
    conn.close();
    assert(!conn.is_connected());
    std::cout << "[OK] unconnected operations smoke test\n";
}

void test_single_use()
{
    Connection conn(std::make_shared<HostKeyStore>());
    int port = unused_port();
    bool threw = false;
    try
    {
        conn.connect("127.0.0.1", port, "admin", "secret");
    }
    catch (const NetworkError &)
    {
        threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
        conn.connect("127.0.0.1", port, "admin", "secret");
    }
    catch (const NetworkError &e)
    {
        threw = true;
        assert(std::string(e.what()).find("already used") != std::string::npos);
    }
    assert(threw);
    std::cout << "[OK] single use smoke test\n";
}

void test_keepalive_cutoff()
{
    KeepaliveTracker tracker;
    assert(tracker.record(0));
    assert(tracker.record(LIBSSH2_ERROR_SOCKET_SEND));
    assert(tracker.record(LIBSSH2_ERROR_SOCKET_SEND));
    assert(tracker.failures() == 2);

    // A queued request resets the streak
    assert(tracker.record(LIBSSH2_ERROR_EAGAIN));
    assert(tracker.failures() == 0);

    assert(tracker.record(LIBSSH2_ERROR_SOCKET_SEND));
    assert(tracker.record(LIBSSH2_ERROR_SOCKET_TIMEOUT));
    assert(!tracker.record(LIBSSH2_ERROR_SOCKET_SEND));
    assert(tracker.failures() == KEEPALIVE_MAX_FAILURES);
    std::cout << "[OK] keepalive cutoff smoke test\n";
}

void test_channel_read_result()
{
    assert(channel_read_result(0, false) == LIBSSH2_ERROR_EAGAIN);
    assert(channel_read_result(0, true) == 0);
    assert(channel_read_result(42, false) == 42);
    assert(channel_read_result(LIBSSH2_ERROR_CHANNEL_CLOSED, false) == LIBSSH2_ERROR_CHANNEL_CLOSED);
    std::cout << "[OK] channel read result smoke test\n";
}

void test_exec_after_close()
{
    Connection conn(std::make_shared<HostKeyStore>());
    conn.close();

    bool threw = false;
    try
    {
        conn.exec("/system identity print", never_cancelled(), std::chrono::milliseconds(100));
    }
    catch (const ExecError &e)
    {
        threw = true;
        assert(e.cmd() == "/system identity print");
    }
    assert(threw);
    std::cout << "[OK] exec after close smoke test\n";
}

int main()
{
    signal(SIGPIPE, SIG_IGN);
    test_refused();
    test_handshake_failure_retries_once();
    test_unconnected_operations();
    test_single_use();
    test_keepalive_cutoff();
    test_channel_read_result();
    test_exec_after_close();
    std::cout << "All Connection tests passed!\n";
    return 0;
}
