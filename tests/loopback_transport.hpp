#ifndef LOOPBACK_TRANSPORT_HPP
#define LOOPBACK_TRANSPORT_HPP

#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include "errors.hpp"
#include "network_utils.hpp"
#include "transport.hpp"

// Echoes every byte back on 127.0.0.1:<ephemeral port>
class EchoServer
{
private:
    int listen_fd = -1;
    int bound_port = 0;
    std::atomic<bool> running{true};
    std::thread accept_thread;
    std::mutex mutex;
    std::vector<std::thread> workers;
    std::vector<int> clients;

    static void echo(int fd)
    {
        char buffer[4096];
        while (true)
        {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            if (send(fd, buffer, n, MSG_NOSIGNAL) != n)
                break;
        }
    }

    void accept_loop()
    {
        while (running)
        {
            pollfd pfd{listen_fd, POLLIN, 0};
            if (poll(&pfd, 1, 50) <= 0)
                continue;
            int fd = accept(listen_fd, nullptr, nullptr);
            if (fd < 0)
                continue;
            std::lock_guard<std::mutex> lock(mutex);
            clients.push_back(fd);
            workers.emplace_back(echo, fd);
        }
    }

public:
    EchoServer()
    {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_storage addr;
        socklen_t addr_len;
        setup_sockaddr(addr, addr_len, "127.0.0.1", 0);
        if (bind(listen_fd, (struct sockaddr *)&addr, addr_len) < 0 || listen(listen_fd, 16) < 0)
            throw std::runtime_error(std::string("echo server: ") + strerror(errno));

        sockaddr_in actual{};
        socklen_t len = sizeof(actual);
        getsockname(listen_fd, (struct sockaddr *)&actual, &len);
        bound_port = ntohs(actual.sin_port);
        accept_thread = std::thread(&EchoServer::accept_loop, this);
    }

    ~EchoServer()
    {
        running = false;
        accept_thread.join();
        close(listen_fd);
        std::lock_guard<std::mutex> lock(mutex);
        for (int fd : clients)
            shutdown(fd, SHUT_RDWR);
        for (auto &worker : workers)
            worker.join();
        for (int fd : clients)
            close(fd);
    }

    int port() const { return bound_port; }
};

class FdStream : public Stream
{
private:
    int fd;

public:
    explicit FdStream(int fd) : fd(fd) {}
    ~FdStream() override { close(); }

    ssize_t read_some(uint8_t *buffer, size_t max_len) override
    {
        if (fd < 0)
            return -1;
        ssize_t n = recv(fd, buffer, max_len, 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return STREAM_WOULD_BLOCK;
        return n < 0 ? -1 : n;
    }

    ssize_t write_some(const uint8_t *data, size_t len) override
    {
        if (fd < 0)
            return -1;
        ssize_t n = send(fd, data, len, MSG_NOSIGNAL);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return STREAM_WOULD_BLOCK;
        return n < 0 ? -1 : n;
    }

    int poll_fd() const override { return fd; }

    void close() override
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }
};

// Transport that sends every dial to the echo server and records targets
class LoopbackTransport : public Transport
{
private:
    int echo_port;
    mutable std::mutex mutex;
    std::vector<std::string> targets;
    std::atomic<bool> closed{false};

public:
    std::atomic<bool> refuse{false};

    explicit LoopbackTransport(int echo_port) : echo_port(echo_port) {}

    std::unique_ptr<Stream> dial(const std::string &host, int port) override
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            targets.push_back(join_host_port(host, port));
        }
        if (refuse || closed)
            throw NetworkError("dial " + join_host_port(host, port) + ": connection refused");

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_storage addr;
        socklen_t addr_len;
        setup_sockaddr(addr, addr_len, "127.0.0.1", echo_port);
        if (connect(fd, (struct sockaddr *)&addr, addr_len) < 0)
        {
            ::close(fd);
            throw NetworkError("dial echo server: " + std::string(strerror(errno)));
        }
        set_nonblocking(fd);
        return std::make_unique<FdStream>(fd);
    }

    bool is_connected() const override { return !closed; }
    void close() override { closed = true; }

    std::vector<std::string> dialed() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return targets;
    }
};

// Blocking client connected to 127.0.0.1:port with a 2 s receive timeout
inline int connect_client(int port)
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    timeval tv{2, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    sockaddr_storage addr;
    socklen_t addr_len;
    setup_sockaddr(addr, addr_len, "127.0.0.1", port);
    if (connect(fd, (struct sockaddr *)&addr, addr_len) < 0)
    {
        close(fd);
        return -1;
    }
    return fd;
}

// Port part of "127.0.0.1:NNNN"
inline int port_of(const std::string &address)
{
    return std::stoi(address.substr(address.rfind(':') + 1));
}

#endif
