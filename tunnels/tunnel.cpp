#include "tunnel.hpp"
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <vector>
#include <unistd.h>
#include <poll.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <spdlog/spdlog.h>
#include "cancellation.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "network_utils.hpp"

// Shared with forwarding threads, which may outlive the Tunnel after a
// drain timeout.
struct TunnelState
{
    CancellationScope scope;
    std::mutex mutex;
    std::condition_variable drained;
    size_t in_flight = 0;
};

namespace
{

struct PendingBytes
{
    std::vector<uint8_t> data;
    size_t offset = 0;

    bool empty() const { return offset >= data.size(); }
    const uint8_t *begin() const { return data.data() + offset; }
    size_t remaining() const { return data.size() - offset; }

    void fill(const uint8_t *bytes, size_t len)
    {
        data.assign(bytes, bytes + len);
        offset = 0;
    }
};

// Moves bytes both ways until either side closes or the tunnel is cancelled.
void splice(int client_fd, Stream &stream, const CancellationScope &scope)
{
    uint8_t buffer[BUFFER_SIZE];
    PendingBytes to_remote;
    PendingBytes to_local;
    bool local_eof = false;
    bool remote_eof = false;

    while (!scope.is_cancelled())
    {
        pollfd fds[2];
        int nfds = 0;
        fds[nfds].fd = client_fd;
        fds[nfds].events = 0;
        fds[nfds].revents = 0;
        if (to_remote.empty() && !local_eof)
            fds[nfds].events |= POLLIN;
        if (!to_local.empty())
            fds[nfds].events |= POLLOUT;
        nfds++;

        int remote_fd = stream.poll_fd();
        if (remote_fd >= 0)
        {
            fds[nfds].fd = remote_fd;
            fds[nfds].events = POLLIN;
            if (!to_remote.empty())
                fds[nfds].events |= POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }

        if (poll(fds, nfds, SPLICE_POLL_MS) < 0 && errno != EINTR)
            break;

        // local -> remote
        if (to_remote.empty() && !local_eof)
        {
            ssize_t n = recv(client_fd, buffer, sizeof(buffer), 0);
            if (n > 0)
                to_remote.fill(buffer, n);
            else if (n == 0)
                local_eof = true;
            else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                break;
        }
        if (!to_remote.empty())
        {
            ssize_t n = stream.write_some(to_remote.begin(), to_remote.remaining());
            if (n > 0)
                to_remote.offset += n;
            else if (n != STREAM_WOULD_BLOCK)
                break;
        }

        // remote -> local
        if (to_local.empty() && !remote_eof)
        {
            ssize_t n = stream.read_some(buffer, sizeof(buffer));
            if (n > 0)
                to_local.fill(buffer, n);
            else if (n == 0)
                remote_eof = true;
            else if (n != STREAM_WOULD_BLOCK)
                break;
        }
        if (!to_local.empty())
        {
            ssize_t n = send(client_fd, to_local.begin(), to_local.remaining(), MSG_NOSIGNAL);
            if (n > 0)
                to_local.offset += n;
            else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                break;
        }

        if ((local_eof && to_remote.empty()) || (remote_eof && to_local.empty()))
            break;
    }
}

void forward(std::shared_ptr<TunnelState> state, std::shared_ptr<Transport> transport,
             int client_fd, std::string remote_host, int remote_port)
{
    std::string target = join_host_port(remote_host, remote_port);

    try
    {
        std::unique_ptr<Stream> stream = transport->dial(remote_host, remote_port);
        splice(client_fd, *stream, state->scope);
        stream->close();
    }
    catch (const TunnelerError &e)
    {
        spdlog::debug("Forward to {} closed: {}", target, e.what());
    }

    close(client_fd);

    std::lock_guard<std::mutex> lock(state->mutex);
    state->in_flight--;
    state->drained.notify_all();
}

} // namespace

const char *to_string(TunnelStatus status)
{
    switch (status)
    {
    case TunnelStatus::Disconnected:
        return "disconnected";
    case TunnelStatus::Connecting:
        return "connecting";
    case TunnelStatus::Active:
        return "active";
    case TunnelStatus::Failed:
        return "failed";
    }
    return "unknown";
}

Tunnel::Tunnel(std::shared_ptr<Transport> transport, int local_port,
               const std::string &remote_host, int remote_port)
    : transport(std::move(transport)), state(std::make_shared<TunnelState>()),
      port(local_port), host(remote_host), target_port(remote_port)
{
}

Tunnel::~Tunnel()
{
    size_t residual = shutdown();
    if (residual > 0)
    {
        spdlog::warn("Tunnel 127.0.0.1:{} destroyed with {} forwarded connections still open",
                     port, residual);
    }
}

void Tunnel::fail(const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = message;
    }
    current_status = TunnelStatus::Failed;
    spdlog::error("Tunnel 127.0.0.1:{} -> {}: {}", port, join_host_port(host, target_port), message);
}

std::string Tunnel::error() const
{
    std::lock_guard<std::mutex> lock(error_mutex);
    return last_error;
}

std::string Tunnel::bound_address() const
{
    std::lock_guard<std::mutex> lock(error_mutex);
    return bound;
}

size_t Tunnel::active_connections() const
{
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->in_flight;
}

void Tunnel::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    if (started || stopped)
    {
        throw ResourceError("tunnel 127.0.0.1:" + std::to_string(port) + " cannot be started twice");
    }
    started = true;
    current_status = TunnelStatus::Connecting;

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0)
    {
        std::string message = std::string("socket: ") + strerror(errno);
        fail(message);
        throw ResourceError("tunnel 127.0.0.1:" + std::to_string(port) + ": " + message);
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_storage addr;
    socklen_t addr_len;
    setup_sockaddr(addr, addr_len, "127.0.0.1", port);

    if (bind(fd, (struct sockaddr *)&addr, addr_len) < 0 || listen(fd, LISTEN_BACKLOG) < 0)
    {
        std::string message = std::string("listen on 127.0.0.1:") + std::to_string(port) + ": " + strerror(errno);
        close(fd);
        fail(message);
        throw ResourceError("tunnel: " + message);
    }
    set_nonblocking(fd);

    sockaddr_in actual{};
    socklen_t actual_len = sizeof(actual);
    getsockname(fd, (struct sockaddr *)&actual, &actual_len);
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &actual.sin_addr, ip, sizeof(ip));
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        bound = join_host_port(ip, ntohs(actual.sin_port));
    }

    listen_fd = fd;
    current_status = TunnelStatus::Active;
    accept_thread = std::thread(&Tunnel::accept_loop, this);

    spdlog::info("Tunnel {} -> {} active", bound_address(), join_host_port(host, target_port));
}

int Tunnel::accept_client(int fd)
{
    sockaddr_storage client_addr;
    socklen_t addr_len = sizeof(client_addr);
    return accept(fd, (struct sockaddr *)&client_addr, &addr_len);
}

void Tunnel::accept_loop()
{
    int error_count = 0;

    while (!state->scope.is_cancelled())
    {
        pollfd pfd{};
        pfd.fd = listen_fd;
        pfd.events = POLLIN;

        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc == 0 || (rc < 0 && errno == EINTR))
            continue;
        if (state->scope.is_cancelled())
            break;

        int client_fd = rc < 0 ? -1 : accept_client(listen_fd);
        if (client_fd < 0)
        {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;

            error_count++;
            std::string reason = strerror(errno);
            spdlog::warn("Tunnel 127.0.0.1:{} accept error {}/{}: {}",
                         port, error_count, MAX_ACCEPT_ERRORS, reason);
            if (error_count >= MAX_ACCEPT_ERRORS)
            {
                fail("accept failed " + std::to_string(error_count) + " times in a row: " + reason);
                return;
            }
            if (state->scope.wait_for(std::chrono::milliseconds(error_count * ACCEPT_BACKOFF_MS)))
                break;
            continue;
        }

        error_count = 0;
        set_nonblocking(client_fd);

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->in_flight++;
        }
        std::thread(forward, state, transport, client_fd, host, target_port).detach();
    }
}

size_t Tunnel::shutdown()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex);
    if (stopped)
        return 0;
    stopped = true;

    state->scope.cancel();
    if (accept_thread.joinable())
        accept_thread.join();

    if (listen_fd >= 0)
    {
        close(listen_fd);
        listen_fd = -1;
    }

    size_t residual;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        state->drained.wait_for(lock, std::chrono::milliseconds(DRAIN_TIMEOUT_MS),
                                [this] { return state->in_flight == 0; });
        residual = state->in_flight;
    }

    // The failure reason, if any, stays in last_error
    current_status = TunnelStatus::Disconnected;
    return residual;
}

void Tunnel::stop()
{
    size_t residual = shutdown();
    if (residual > 0)
    {
        std::string where = bound_address();
        if (where.empty())
            where = "127.0.0.1:" + std::to_string(port);
        throw DrainTimeoutError("tunnel " + where + ": " +
                                    std::to_string(residual) + " forwarded connections still open after " +
                                    std::to_string(DRAIN_TIMEOUT_MS) + "ms",
                                residual);
    }
}
